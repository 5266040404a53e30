#ifndef STRING_HELPERS_H
#define STRING_HELPERS_H

#include <string>
#include <sstream>
#include <vector>

#include "tools/iostream_helpers.h"

// stream into string
class sstr
{
    public:
        template <typename T>
        sstr& operator << (const T& value)
        {
            m_stream << value;
            return *this;
        }

        operator std::string () const
        {
            return m_stream.str();
        }

    private:
        std::stringstream m_stream;
};

// Returns false instead of throwing if <s> is not a number.
bool try_to_int(const std::string& s, int& value_out, int base=10);

// Quoted for log messages, with quotes and control characters escaped,
// so that leading and trailing spaces remain visible.
std::string repr(const std::string& value);

// Groups of the first match of pattern in s.
std::vector<std::string> re_search(const std::string& s, const std::string& pattern);

// UTF-8 aware functions
std::string strip(const std::string &s);
std::string lower(const std::string& s);

#endif // STRING_HELPERS_H
