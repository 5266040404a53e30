#include <regex>
#include <stdexcept>

#define U_CHARSET_IS_UTF8 1
#include <unicode/unistr.h>  // icu

#include "tools/string_helpers.h"


bool try_to_int(const std::string& s, int& value_out, int base)
{
    try {
        size_t pos = 0;
        int value = std::stoi(s, &pos, base);
        if (pos != s.size())
            return false;
        value_out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string repr(const std::string& value)
{
    std::string result = "'";
    for (char c : value)
    {
        switch (c)
        {
            case '\'': result += "\\'"; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    return result + "'";
}

std::vector<std::string> re_search(const std::string& s, const std::string& pattern)
{
    std::vector<std::string> groups;

    std::regex regex(pattern);
    std::smatch matches;

    if(std::regex_search(s, matches, regex))
    {
        if (matches.size() == 1)   // no groups in pattern?
            groups.emplace_back(matches[0].str());
        else  // skip the whole match
            for (size_t i = 1; i < matches.size(); ++i)
                groups.emplace_back(matches[i].str());
    }

    return groups;
}

std::string strip(const std::string &s)
{
    auto us = icu::UnicodeString::fromUTF8(s);
    std::string out;
    return us.trim().toUTF8String(out);
}

std::string lower(const std::string& s)
{
    auto us = icu::UnicodeString::fromUTF8(s);
    std::string out;
    return us.toLower().toUTF8String(out);
}
