#ifndef FILE_UTIL_H
#define FILE_UTIL_H

#include <string>

/**
 * Read a whole text file. A single trailing line break (LF or CRLF) is removed, since ciphertexts are usually
 * stored as one line.
 */
std::string read_text_file(std::string const& filename);

void write_text_file(std::string const& data, std::string const& path);

#endif /* FILE_UTIL_H */
