#ifndef TOKENREPLACER_H
#define TOKENREPLACER_H

#include <ostream>

#include "tools/textdecls.h"
#include "tools/ustringmain.h"

#include "spannedtext.h"

class TextBuffer;
class Tokenizer;


// Record of an applied suggestion, enough to undo it.
struct Replacement
{
    Span inserted;          // range of the inserted text after the edit
    UString text;           // inserted text
    SpannedText original;   // text it replaced, with its formatting
};

std::ostream& operator<<(std::ostream& s, const Replacement& r);


// Replace the token before the cursor with the terminated suggestion.
// Text and formatting outside of the token are preserved. Without
// tokenizer the whole buffer is replaced.
Replacement replace_token(TextBuffer& buffer, const Tokenizer* tokenizer,
                          const SpannedText& suggestion);

// Restore the original text if the inserted text is still in place.
bool revert_replacement(TextBuffer& buffer, const Replacement& replacement);

#endif // TOKENREPLACER_H
