#include <algorithm>

#include "textbuffer.h"
#include "tokenizer.h"
#include "tokenreplacer.h"


std::ostream& operator<<(std::ostream& s, const Replacement& r)
{
    s << "Replacement(" << r.inserted << ", "
      << repr(r.text) << ", " << repr(r.original.get_text()) << ")";
    return s;
}

Replacement replace_token(TextBuffer& buffer, const Tokenizer* tokenizer,
                          const SpannedText& suggestion)
{
    buffer.clear_composing_text();

    UString text = buffer.get_text();
    if (!tokenizer)
    {
        SpannedText original = buffer.read_spanned({0, buffer.get_length()});
        buffer.set_text(suggestion);
        return {{0, suggestion.size()}, suggestion.get_text(), original};
    }

    TextLength length = static_cast<TextLength>(text.size());
    TextPos end = std::max(0, std::min(buffer.get_selection_end(), length));
    TextPos start = tokenizer->find_token_start(text, end);

    Span token = span_from_range(start, end);
    SpannedText original = buffer.read_spanned(token);
    SpannedText terminated = tokenizer->terminate_token(suggestion);
    buffer.replace(token, terminated);

    return {{start, terminated.size()}, terminated.get_text(), original};
}

bool revert_replacement(TextBuffer& buffer, const Replacement& replacement)
{
    const Span& span = replacement.inserted;
    if (span.begin < 0 ||
        span.length < 0 ||
        span.end() > buffer.get_length())
        return false;

    if (buffer.read(span) != replacement.text)
        return false;

    buffer.replace(span, replacement.original);
    return true;
}
