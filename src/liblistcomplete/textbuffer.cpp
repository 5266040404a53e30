#include <algorithm>

#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "exception.h"
#include "textbuffer.h"


EditableText::EditableText(const ContextBase& context) :
    ContextBase(context)
{
}

UString EditableText::read(const Span& span) const
{
    return read_spanned(span).get_text();
}

SpannedText EditableText::read_spanned(const Span& span) const
{
    check_span(span);
    return m_text.slice(span.begin, span.end());
}

void EditableText::replace(const Span& span, const SpannedText& text)
{
    check_span(span);

    LOG_TRACE << "replacing " << span << " with " << text;

    const TextPos start = span.begin;
    const TextPos end = span.end();
    const TextLength delta = text.size() - span.length;

    m_text = m_text.replaced(span, text);

    if (m_selection_end >= end)
        m_selection_end += delta;
    else if (m_selection_end > start)
        m_selection_end = start + text.size();

    // A composing region touched by the edit is finished.
    if (!m_composing_span.empty())
    {
        if (m_composing_span.begin >= end)
            m_composing_span.begin += delta;
        else if (m_composing_span.end() > start)
            m_composing_span = {};
    }

    text_changed.emit();
}

void EditableText::set_text(const SpannedText& text)
{
    m_text = text;
    m_selection_end = m_text.size();
    m_composing_span = {};
    text_changed.emit();
}

TextLength EditableText::get_length() const
{
    return m_text.size();
}

TextPos EditableText::get_selection_end() const
{
    return m_selection_end;
}

void EditableText::clear_composing_text()
{
    m_composing_span = {};
}

void EditableText::set_selection(TextPos cursor)
{
    cursor = std::max(0, std::min(cursor, m_text.size()));
    if (cursor != m_selection_end)
    {
        m_selection_end = cursor;
        selection_changed.emit();
    }
}

void EditableText::insert(const UString& text)
{
    replace({m_selection_end, 0}, text);
}

void EditableText::delete_backward()
{
    if (m_selection_end > 0)
        replace({m_selection_end - 1, 1}, {});
}

void EditableText::set_composing_span(const Span& span)
{
    check_span(span);
    m_composing_span = span;
}

void EditableText::check_span(const Span& span) const
{
    if (span.begin < 0 ||
        span.length < 0 ||
        span.end() > m_text.size())
        throw ValueException(sstr() << "span " << span
                             << " out of range for text of length "
                             << m_text.size());
}
