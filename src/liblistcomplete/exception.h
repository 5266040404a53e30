#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>
#include <exception>

class Exception : public std::exception
{
    public:
        Exception(const std::string& msg):
            m_msg(msg)
        {}

        virtual ~Exception() noexcept;

        virtual const char* what() const noexcept override
        {
           return m_msg.c_str();
        }

    protected:
        std::string m_msg;
};

// GSettings schema not installed
class SchemaException : public Exception
{
   public:
       using Exception::Exception;
};

// Reading or writing a settings key failed.
class ConfigException : public Exception
{
   public:
       using Exception::Exception;
};

// Argument out of range, e.g. a span beyond the end of the text,
// or an unusable token separator.
class ValueException : public Exception
{
    public:
        using Exception::Exception;
};

#endif // EXCEPTION_H
