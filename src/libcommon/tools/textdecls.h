#ifndef TEXTDECLS_H
#define TEXTDECLS_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

typedef int TextPos;
typedef int TextLength;
typedef int32_t CodePoint;

struct _Span
{
    _Span()
    {}
    _Span(TextPos begin_, TextLength length_) :
        begin(begin_),
        length(length_)
    {}

    bool operator==(const _Span& other) const
    { return begin == other.begin && length == other.length;}
    bool operator!=(const _Span& other) const
    { return !operator==(other);}

    TextPos end() const {return begin + length;}

    bool empty() const {return length == 0;}

    bool contains(TextPos pos) const
    { return pos >= begin && pos < end();}

    bool intersects(TextPos begin_, TextLength length_) const
    {
        TextPos end_ = begin_ + length_;
        return begin_ < this->end() && end_ > this->begin;
    }

    TextPos begin{0};
    TextLength length{0};
};
typedef _Span Span;

inline Span span_from_range(TextPos begin, TextPos end)
{
    return {begin, end - begin};
}

inline std::ostream& operator<<(std::ostream& s, const Span& span){
    s << "Span(" << span.begin << ", " << span.length << ")";
    return s;
}

// Formatting attribute attached to a range of text, e.g. "bold"
// or "underline". Independent of token boundaries.
struct FormatSpan : public Span
{
    using Super = Span;

    FormatSpan()
    {}

    FormatSpan(TextPos begin_, TextLength length_,
               const std::string& attribute_) :
        Span(begin_, length_),
        attribute(attribute_)
    {}

    bool operator==(const FormatSpan& other) const
    { return begin == other.begin &&
             length == other.length &&
             attribute == other.attribute;
    }
    bool operator!=(const FormatSpan& other) const
    { return !operator==(other);}

    std::string attribute;
};
typedef std::vector<FormatSpan> FormatSpans;

inline std::ostream& operator<<(std::ostream& s, const FormatSpan& span){
    s << "FormatSpan(" << span.begin << ", " << span.length
      << ", " << span.attribute << ")";
    return s;
}

#endif // TEXTDECLS_H
