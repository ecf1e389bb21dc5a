
#include "file_util.h"
#include <fstream>
#include <sstream>
#include "except.h"

using namespace std;


std::string read_text_file(std::string const& filename)
{
    std::ifstream file(filename, ios::in);
    if (file.fail())
    {
        throw file_exception_t("could not open file for reading at " + filename);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    file.close();
    std::string result = oss.str();
    if (result.size() && result.back() == '\n')
    {
        result.pop_back();
        if (result.size() && result.back() == '\r')
        {
            result.pop_back();
        }
    }
    return result;
}

void write_text_file(std::string const& data, std::string const& path)
{
    ofstream fw(path, std::ofstream::out);
    // check if file was successfully opened for writing
    if (fw.is_open())
    {
        fw << data;
        fw.close();
    }
    else
    {
        throw file_exception_t("could not open file for writing: " + std::string(path));
    }
}
