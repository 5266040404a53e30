#ifndef FILTERINGGATE_H
#define FILTERINGGATE_H

#include "tools/textdecls.h"
#include "tools/ustringmain.h"

class Tokenizer;


// True if the token before cursor has at least threshold characters.
// Without tokenizer the whole text counts. Negative cursors never pass.
bool enough_to_filter(const UString& text, TextPos cursor,
                      int threshold, const Tokenizer* tokenizer);

// Range [token start, cursor), the part of the token the user typed
// so far. Without tokenizer the whole text.
Span active_token_span(const UString& text, TextPos cursor,
                       const Tokenizer* tokenizer);

#endif // FILTERINGGATE_H
