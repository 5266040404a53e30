#ifndef SPANNEDTEXT_H
#define SPANNEDTEXT_H

#include <ostream>

#include "tools/textdecls.h"
#include "tools/ustringmain.h"


// Text with formatting spans attached. Span offsets count code points.
class SpannedText
{
    public:
        SpannedText();
        SpannedText(const UString& text);
        SpannedText(const char* text);

        // Throws ValueException if any span lies outside of text.
        SpannedText(const UString& text, const FormatSpans& spans);

        const UString& get_text() const {return m_text;}
        const FormatSpans& get_spans() const {return m_spans;}

        TextLength size() const {return m_length;}
        bool empty() const {return m_length == 0;}

        // Zero-length spans are ignored.
        void add_span(const FormatSpan& span);
        void clear_spans() {m_spans.clear();}

        // Sub-range [begin, end) with spans clipped to it, offsets
        // relative to begin. The range is clamped to the text.
        SpannedText slice(TextPos begin, TextPos end) const;

        SpannedText operator+(const SpannedText& other) const;
        SpannedText& operator+=(const SpannedText& other);

        // Returns a copy with range replaced by insertion.
        //  - spans before or after range are kept, the latter shifted,
        //  - spans inside range are dropped,
        //  - partially overlapping spans are clipped,
        //  - spans enclosing range grow or shrink with it,
        //  - spans of insertion are added at range.begin.
        // Throws ValueException if range is outside of the text.
        SpannedText replaced(const Span& range, const SpannedText& insertion) const;

        bool operator==(const SpannedText& other) const;
        bool operator!=(const SpannedText& other) const
        { return !operator==(other);}

    private:
        void check_span(const Span& span) const;
        void sort_spans();

    private:
        UString m_text;
        TextLength m_length{0};
        FormatSpans m_spans;
};

std::ostream& operator<<(std::ostream& s, const SpannedText& text);

#endif // SPANNEDTEXT_H
