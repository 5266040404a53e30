#include <algorithm>

#include "tools/iostream_helpers.h"
#include "tools/string_helpers.h"

#include "exception.h"
#include "spannedtext.h"


SpannedText::SpannedText()
{
}

SpannedText::SpannedText(const UString& text) :
    m_text(text),
    m_length(static_cast<TextLength>(text.size()))
{
}

SpannedText::SpannedText(const char* text) :
    SpannedText(UString(text))
{
}

SpannedText::SpannedText(const UString& text, const FormatSpans& spans) :
    SpannedText(text)
{
    for (const auto& span : spans)
        add_span(span);
}

void SpannedText::add_span(const FormatSpan& span)
{
    check_span(span);
    if (span.empty())
        return;

    m_spans.emplace_back(span);
    sort_spans();
}

SpannedText SpannedText::slice(TextPos begin, TextPos end) const
{
    begin = std::max(0, std::min(begin, m_length));
    end = std::max(begin, std::min(end, m_length));

    SpannedText result(m_text.slice(begin, end));
    for (const auto& span : m_spans)
    {
        TextPos b = std::max(span.begin, begin);
        TextPos e = std::min(span.end(), end);
        if (e > b)
            result.m_spans.emplace_back(b - begin, e - b, span.attribute);
    }
    return result;
}

SpannedText SpannedText::operator+(const SpannedText& other) const
{
    SpannedText result(*this);
    result += other;
    return result;
}

SpannedText& SpannedText::operator+=(const SpannedText& other)
{
    TextPos offset = m_length;
    m_text += other.m_text;
    m_length += other.m_length;
    for (const auto& span : other.m_spans)
        m_spans.emplace_back(span.begin + offset, span.length, span.attribute);
    sort_spans();
    return *this;
}

SpannedText SpannedText::replaced(const Span& range, const SpannedText& insertion) const
{
    check_span(range);

    const TextPos start = range.begin;
    const TextPos end = range.end();
    const TextLength delta = insertion.m_length - range.length;

    SpannedText result(m_text.slice(0, start) +
                       insertion.m_text +
                       m_text.slice(end));

    for (const auto& span : m_spans)
    {
        FormatSpan s = span;
        if (span.end() <= start)
        {
            // before, unchanged
        }
        else if (span.begin >= end)
        {
            s.begin += delta;
        }
        else if (span.begin >= start && span.end() <= end)
        {
            continue;   // swallowed by the replacement
        }
        else if (span.begin < start && span.end() > end)
        {
            s.length += delta;
        }
        else if (span.begin < start)
        {
            s.length = start - span.begin;
        }
        else
        {
            s.begin = start + insertion.m_length;
            s.length = span.end() - end;
        }

        if (!s.empty())
            result.m_spans.emplace_back(s);
    }

    for (const auto& span : insertion.m_spans)
        result.m_spans.emplace_back(span.begin + start, span.length, span.attribute);

    result.sort_spans();
    return result;
}

bool SpannedText::operator==(const SpannedText& other) const
{
    return m_text == other.m_text &&
           m_spans == other.m_spans;
}

void SpannedText::check_span(const Span& span) const
{
    if (span.begin < 0 ||
        span.length < 0 ||
        span.end() > m_length)
        throw ValueException(sstr() << "span " << span
                             << " out of range for text of length " << m_length);
}

void SpannedText::sort_spans()
{
    std::stable_sort(m_spans.begin(), m_spans.end(),
                     [](const FormatSpan& a, const FormatSpan& b)
                     {return a.begin < b.begin;});
}

std::ostream& operator<<(std::ostream& s, const SpannedText& text)
{
    s << "SpannedText(" << text.get_text() << ", " << text.get_spans() << ")";
    return s;
}
