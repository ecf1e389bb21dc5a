
#include "except.h"

Exception::~Exception() {};

Exception::Exception(const std::string& msg) : m_msg(msg)
{
}

invalid_argument_exception_t::~invalid_argument_exception_t() {};

invalid_argument_exception_t::invalid_argument_exception_t(const std::string& msg)
    : Exception("invalid argument: " + msg)
{
}

not_implemented_exception_t::~not_implemented_exception_t() {};

not_implemented_exception_t::not_implemented_exception_t(const std::string& msg)
    : Exception("not implemented: " + msg)
{
}

file_exception_t::~file_exception_t() {};

file_exception_t::file_exception_t(const std::string& msg) : Exception(msg)
{
}

cli_exception_t::~cli_exception_t() {};

cli_exception_t::cli_exception_t(const std::string& msg) : Exception(msg)
{
}

test_exception_t::~test_exception_t() {};

test_exception_t::test_exception_t(const std::string& msg) : Exception(msg)
{
}
