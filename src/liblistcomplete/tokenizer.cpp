#include <algorithm>

#include "tools/string_helpers.h"

#include "exception.h"
#include "tokenizer.h"


static const CodePoint SPACE = ' ';

SingleCharTokenizer::SingleCharTokenizer(CodePoint separator) :
    m_separator(separator)
{
    if (separator == SPACE)
        throw ValueException("space is not a valid token separator");
}

std::unique_ptr<SingleCharTokenizer> SingleCharTokenizer::from_string(const UString& separator)
{
    if (separator.size() != 1)
        throw ValueException(sstr() << "token separator must be a single character, got "
                             << repr(separator));
    return std::make_unique<SingleCharTokenizer>(separator[0]);
}

TextPos SingleCharTokenizer::find_token_start(const UString& text, TextPos cursor) const
{
    auto cps = text.get_code_points();
    const TextPos n = static_cast<TextPos>(cps.size());
    cursor = std::max(0, std::min(cursor, n));

    TextPos i = cursor;
    while (i > 0 && cps[i - 1] != m_separator)
        i--;
    while (i < cursor && cps[i] == SPACE)
        i++;
    return i;
}

TextPos SingleCharTokenizer::find_token_end(const UString& text, TextPos cursor) const
{
    auto cps = text.get_code_points();
    const TextPos n = static_cast<TextPos>(cps.size());
    cursor = std::max(0, std::min(cursor, n));

    TextPos i = cursor;
    while (i < n && cps[i] != m_separator)
        i++;
    return i;
}

UString SingleCharTokenizer::terminate_token(const UString& text) const
{
    if (is_terminated(text))
        return text;
    return text + UString::from_code_point(m_separator);
}

SpannedText SingleCharTokenizer::terminate_token(const SpannedText& text) const
{
    if (is_terminated(text.get_text()))
        return text;
    // no span covers the separator
    return text + SpannedText(UString::from_code_point(m_separator));
}

bool SingleCharTokenizer::is_terminated(const UString& text) const
{
    auto cps = text.get_code_points();
    size_t i = cps.size();
    while (i > 0 && cps[i - 1] == SPACE)
        i--;
    return i > 0 && cps[i - 1] == m_separator;
}
