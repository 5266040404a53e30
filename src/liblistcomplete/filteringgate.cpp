#include <algorithm>

#include "filteringgate.h"
#include "tokenizer.h"


bool enough_to_filter(const UString& text, TextPos cursor,
                      int threshold, const Tokenizer* tokenizer)
{
    if (!tokenizer)
        return static_cast<int>(text.size()) >= threshold;

    if (cursor < 0)
        return false;

    Span span = active_token_span(text, cursor, tokenizer);
    return span.length >= threshold;
}

Span active_token_span(const UString& text, TextPos cursor,
                       const Tokenizer* tokenizer)
{
    TextLength length = static_cast<TextLength>(text.size());
    if (!tokenizer)
        return {0, length};

    cursor = std::max(0, std::min(cursor, length));
    TextPos start = tokenizer->find_token_start(text, cursor);
    return span_from_range(start, cursor);
}
