#ifndef TOKENIZER_H
#define TOKENIZER_H

#include <memory>

#include "tools/textdecls.h"
#include "tools/ustringmain.h"

#include "spannedtext.h"


// Finds token boundaries in delimited lists of values.
// For all texts and cursors:
// 0 <= find_token_start() <= cursor <= find_token_end() <= length.
class Tokenizer
{
    public:
        virtual ~Tokenizer() = default;

        virtual TextPos find_token_start(const UString& text, TextPos cursor) const = 0;
        virtual TextPos find_token_end(const UString& text, TextPos cursor) const = 0;

        // Append a separator unless text already ends with one.
        virtual UString terminate_token(const UString& text) const = 0;
        virtual SpannedText terminate_token(const SpannedText& text) const = 0;
};


// Tokenizer for a single separator character, ';' by default.
// Leading plain spaces are not part of a token.
class SingleCharTokenizer : public Tokenizer
{
    public:
        static constexpr const CodePoint DEFAULT_SEPARATOR = ';';

        // Throws ValueException for a space separator.
        SingleCharTokenizer(CodePoint separator = DEFAULT_SEPARATOR);

        // Throws ValueException unless separator is a single code point.
        static std::unique_ptr<SingleCharTokenizer> from_string(const UString& separator);

        CodePoint get_separator() const {return m_separator;}

        virtual TextPos find_token_start(const UString& text, TextPos cursor) const override;
        virtual TextPos find_token_end(const UString& text, TextPos cursor) const override;
        virtual UString terminate_token(const UString& text) const override;
        virtual SpannedText terminate_token(const SpannedText& text) const override;

    private:
        bool is_terminated(const UString& text) const;

    private:
        CodePoint m_separator;
};

#endif // TOKENIZER_H
