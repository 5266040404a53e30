#include "tools/logger.h"
#include "tools/ustringmain.h"

#include "textbuffer.h"
#include "tokenizer.h"
#include "validationpass.h"
#include "validator.h"


ValidationPass::ValidationPass(const ContextBase& context) :
    ContextBase(context)
{
}

int ValidationPass::run(TextBuffer& buffer, const Tokenizer* tokenizer, Validator* validator)
{
    if (!validator)
        return 0;

    if (!tokenizer)
        return validate_whole_text(buffer, *validator);

    int edits = 0;
    TextPos i = buffer.get_length();
    while (i > 0)
        i = validate_segment(buffer, i, *tokenizer, *validator, edits);

    LOG_DEBUG << edits << " edits, result " << repr(buffer.get_text());
    return edits;
}

int ValidationPass::validate_whole_text(TextBuffer& buffer, Validator& validator)
{
    UString text = buffer.get_text();
    if (text.empty() || validator.is_valid(text))
        return 0;

    UString fixed = validator.fix_text(text);
    LOG_DEBUG << "fixing " << repr(text) << " -> " << repr(fixed);
    buffer.set_text(fixed);
    return 1;
}

TextPos ValidationPass::validate_segment(TextBuffer& buffer, TextPos segment_end,
                                         const Tokenizer& tokenizer, Validator& validator,
                                         int& edits)
{
    // Read again each step, earlier steps edited the text to the right.
    UString text = buffer.get_text();
    TextPos start = tokenizer.find_token_start(text, segment_end - 1);
    TextPos end = tokenizer.find_token_end(text, start);

    // include the leading spaces skipped by the tokenizer
    TextPos begin = start;
    while (begin > 0 && text[static_cast<size_t>(begin - 1)] == ' ')
        begin--;

    Span segment = span_from_range(begin, segment_end);
    UString token = text.slice(begin, end);

    if (token.empty() || token.isspace())
    {
        LOG_DEBUG << "removing empty token at " << segment;
        buffer.replace(segment, {});
        edits++;
    }
    else if (!validator.is_valid(token))
    {
        UString fixed = validator.fix_text(token);
        UString replacement;
        if (!fixed.empty() && !fixed.isspace())
            replacement = tokenizer.terminate_token(fixed);

        LOG_DEBUG << "fixing " << repr(token) << " -> " << repr(replacement)
                  << " at " << segment;
        buffer.replace(segment, replacement);
        edits++;
    }

    return begin;
}
