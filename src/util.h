#ifndef ____UTIL_H
#define ____UTIL_H

#include <string>
#include <string_view>
#include <span>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <botan/rng.h>
#include "except.h"
#include "file_util.h"

class run_time_ctrl_t

{
  public:
    run_time_ctrl_t(std::filesystem::path const& run_time_log_dir = "", bool verbose = false) : m_verbose(verbose)
    {
        if (run_time_log_dir == "")
        {
            return;
        }
        auto t  = std::time(nullptr);
        auto tm = *std::localtime(&t);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d--%H-%M-%S");
        auto date_str = oss.str();
        m_run_time_log_dir = run_time_log_dir / std::filesystem::path(date_str);
        std::filesystem::create_directories(m_run_time_log_dir);
    }

    void potentially_write_run_time_file(std::string const& data, std::string const& leaf_name)
    {
        if (m_run_time_log_dir == "")
        {
            return;
        }
        if (leaf_name == "")
        {
            throw Exception("attempt to write file without leaf name");
        }
        auto file_path = m_run_time_log_dir / leaf_name;
        if (std::filesystem::exists(file_path))
        {
            throw Exception(std::string("file path ") + file_path.c_str() + " already exists");
        }
        write_text_file(data, file_path);
    }

    void potentially_log(std::string_view msg) const
    {
        if (m_verbose)
        {
            std::cout << msg << std::endl;
        }
    }

    inline bool verbose() const
    {
        return m_verbose;
    }

    inline std::filesystem::path const& run_time_log_dir() const
    {
        return m_run_time_log_dir;
    }

  private:
    std::filesystem::path m_run_time_log_dir;
    bool m_verbose;
};


std::string generate_random_key(size_t key_length, Botan::RandomNumberGenerator& rng);

std::string generate_random_lowercase_text(size_t text_length, Botan::RandomNumberGenerator& rng);

std::string join_uint32_list(std::span<const uint32_t> values, std::string_view separator = ", ");

#endif /* ____UTIL_H */
