#include <algorithm>
#include <utility>

#include <unicode/uchar.h>
#include <unicode/schriter.h>
#include <unicode/utf16.h>

#include "tools/string_helpers.h"
#include "tools/ustringmain.h"


UString::UString(const icu::UnicodeString& s) :
    m_us(s)
{
}

UString::UString(icu::UnicodeString&& s) :
    m_us(std::move(s))
{
}

UString::UString(const char* s) :
    m_us(icu::UnicodeString::fromUTF8(s ? s : ""))
{
}

UString::UString(const std::string& s) :
    m_us(icu::UnicodeString::fromUTF8(s))
{
}

UString UString::operator+(const UString& s) const
{
    return {m_us + s.m_us};
}

UString& UString::operator+=(const UString& s)
{
    m_us += s.m_us;
    return *this;
}

std::string UString::to_utf8() const
{
    std::string out;
    return m_us.toUTF8String(out);
}

UString UString::from_code_point(CodePoint cp)
{
    return {icu::UnicodeString(static_cast<UChar32>(cp))};
}

UString UString::from_code_points(const std::vector<CodePoint>& cps)
{
    if (cps.empty())
        return {};
    return {icu::UnicodeString::fromUTF32(
                    reinterpret_cast<const UChar32*>(cps.data()),
                    static_cast<int32_t>(cps.size()))};
}

bool UString::isspace() const
{
    icu::StringCharacterIterator it(m_us);
    for (auto cp = it.first32(); cp != it.DONE; cp = it.next32())
        if (!u_isspace(cp))
            return false;
    return true;
}

size_t UString::size() const
{
    return static_cast<size_t>(m_us.countChar32());
}

CodePoint UString::operator[](size_t index) const
{
    // char32At takes a UTF-16 index
    int32_t i = m_us.moveIndex32(0, static_cast<int32_t>(index));
    return m_us.char32At(i);
}

UString UString::lower() const
{
    icu::UnicodeString us = m_us;
    return {us.toLower()};
}

UString UString::upper() const
{
    icu::UnicodeString us = m_us;
    return {us.toUpper()};
}

UString UString::strip() const
{
    return lstrip().rstrip();
}

UString UString::lstrip() const
{
    icu::StringCharacterIterator it(m_us);
    for (auto cp = it.first32(); cp != it.DONE; cp = it.next32())
    {
        if (!u_isspace(cp))
        {
            int32_t begin = it.getIndex();
            return {icu::UnicodeString{m_us, begin, m_us.length() - begin}};
        }
    }
    return {};
}

UString UString::rstrip() const
{
    icu::StringCharacterIterator it(m_us);
    for (auto cp = it.last32(); cp != it.DONE; cp = it.previous32())
    {
        if (!u_isspace(cp))
        {
            int32_t end = it.getIndex() + U16_LENGTH(cp);
            return {icu::UnicodeString{m_us, 0, end}};
        }
    }
    return {};
}

UString UString::slice(int begin, int end) const
{
    int n = static_cast<int>(size());
    if (begin < 0)
        begin = std::max(0, n + begin);
    if (end < 0)
        end = std::max(0, n + end);
    begin = std::min(begin, n);
    end = std::min(end, n);
    if (end <= begin)
        return {};

    int32_t utf16_begin = m_us.moveIndex32(0, begin);
    int32_t utf16_end = m_us.moveIndex32(utf16_begin, end - begin);
    return {icu::UnicodeString{m_us, utf16_begin, utf16_end - utf16_begin}};
}

bool UString::startswith(const UString& prefix) const
{
    return m_us.startsWith(prefix.m_us);
}

std::vector<CodePoint> UString::get_code_points() const
{
    std::vector<CodePoint> cps;
    cps.reserve(static_cast<size_t>(m_us.length()));
    icu::StringCharacterIterator it(m_us);
    for (auto cp = it.first32(); cp != it.DONE; cp = it.next32())
        cps.emplace_back(cp);
    return cps;
}

std::ostream& operator<<(std::ostream& s, const UString& us)
{
    s << "U\"" << us.to_utf8() << "\"";
    return s;
}

std::string repr(const UString& value)
{
    return repr(value.to_utf8());
}
