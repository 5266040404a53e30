#ifndef USTRINGMAIN_H
#define USTRINGMAIN_H

#include <climits>
#include <ostream>
#include <string>
#include <vector>

#ifndef U_CHARSET_IS_UTF8
#define U_CHARSET_IS_UTF8 1
#endif
#include <unicode/unistr.h>  // icu

#include "textdecls.h"

// Unicode string indexed by code points. All positions in the
// editing engine (cursor, spans, token boundaries) are code point
// indices into UStrings.
class UString
{
    private:
        UString(const icu::UnicodeString& s);
        UString(icu::UnicodeString&& s);

    public:
        UString() = default;
        UString(const char* s);
        UString(const std::string& s);   // assumed to be UTF-8

        bool operator==(const UString& s) const {return m_us == s.m_us;}
        bool operator!=(const UString& s) const {return !operator==(s);}

        UString operator+(const UString& s) const;
        UString& operator+=(const UString& s);

        std::string to_utf8() const;

        static UString from_code_point(CodePoint cp);
        static UString from_code_points(const std::vector<CodePoint>& cps);

        bool empty() const {return m_us.isEmpty();}

        // True for empty strings too.
        bool isspace() const;

        // Count of code points
        size_t size() const;

        // Code point at code point index
        CodePoint operator[](size_t index) const;

        UString lower() const;
        UString upper() const;

        UString strip() const;
        UString lstrip() const;
        UString rstrip() const;

        // Python like slicing on code points
        // Negative indices count from the end of the string.
        // Result is truncated for out of range indizes.
        UString slice(int begin, int end=INT_MAX) const;

        bool startswith(const UString& prefix) const;

        std::vector<CodePoint> get_code_points() const;

    private:
        icu::UnicodeString m_us;
};

typedef std::vector<UString> UStrings;

std::ostream& operator<<(std::ostream& s, const UString& us);

std::string repr(const UString& value);

#endif // USTRINGMAIN_H
