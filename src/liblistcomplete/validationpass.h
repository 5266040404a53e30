#ifndef VALIDATIONPASS_H
#define VALIDATIONPASS_H

#include "tools/textdecls.h"

#include "listcompleteglobals.h"

class TextBuffer;
class Tokenizer;
class Validator;


// Checks all tokens of a buffer, right to left. Empty tokens are
// removed together with their separator, invalid ones are replaced
// by the validator's fix.
class ValidationPass : public ContextBase
{
    public:
        ValidationPass(const ContextBase& context);

        // Returns the number of edits made. Without tokenizer the whole
        // text is validated as one value, without validator nothing
        // happens.
        //
        // Spaces in front of a token are handed to the validator as
        // part of it, so a validator that rejects them gets to strip
        // them. A validator that can't fix a value (empty fix) thus
        // removes every value that follows a space, valid or not.
        int run(TextBuffer& buffer, const Tokenizer* tokenizer, Validator* validator);

    private:
        int validate_whole_text(TextBuffer& buffer, Validator& validator);

        // Returns the start of the segment ending at segment_end.
        TextPos validate_segment(TextBuffer& buffer, TextPos segment_end,
                                 const Tokenizer& tokenizer, Validator& validator,
                                 int& edits);
};

#endif // VALIDATIONPASS_H
