#ifndef _EXCEPT_H
#define _EXCEPT_H

#include <string>
#include <exception>

class Exception : public std::exception
{
  public:
    explicit Exception(const std::string& msg);
    const char* what() const noexcept override
    {
        return m_msg.c_str();
    }
    virtual ~Exception();

  private:
    std::string m_msg;
};

class invalid_argument_exception_t : public Exception
{
  public:
    explicit invalid_argument_exception_t(const std::string& msg);
    virtual ~invalid_argument_exception_t();
};

class not_implemented_exception_t : public Exception
{
  public:
    explicit not_implemented_exception_t(const std::string& msg);
    virtual ~not_implemented_exception_t();
};

class file_exception_t : public Exception 
{
  public:
    explicit file_exception_t(const std::string& msg);
    virtual ~file_exception_t();
};

class cli_exception_t : public Exception 
{
  public:
    explicit cli_exception_t(const std::string& msg);
    virtual ~cli_exception_t();
};

class test_exception_t : public Exception 
{
  public:
    explicit test_exception_t(const std::string& msg);
    virtual ~test_exception_t();
};

#endif /* _EXCEPT_H */
