#ifndef TEXTBUFFER_H
#define TEXTBUFFER_H

#include "tools/textdecls.h"
#include "tools/ustringmain.h"

#include "listcompleteglobals.h"
#include "signalling.h"
#include "spannedtext.h"


// Access to the text of an editable widget. The engine reads ranges
// and requests range replacements, the host owns the content.
class TextBuffer
{
    public:
        virtual ~TextBuffer() = default;

        virtual UString read(const Span& span) const = 0;
        virtual SpannedText read_spanned(const Span& span) const = 0;

        // Replace span with text, moving a cursor at or behind the end
        // of span to the end of the inserted text.
        virtual void replace(const Span& span, const SpannedText& text) = 0;
        virtual void set_text(const SpannedText& text) = 0;

        virtual TextLength get_length() const = 0;
        virtual TextPos get_selection_end() const = 0;

        // Finish any pending input method composition.
        virtual void clear_composing_text() = 0;

        UString get_text() const
        { return read({0, get_length()}); }
};


// In-memory text buffer with cursor and composing region.
class EditableText : public TextBuffer, public ContextBase
{
    public:
        EditableText(const ContextBase& context);

        virtual UString read(const Span& span) const override;
        virtual SpannedText read_spanned(const Span& span) const override;
        virtual void replace(const Span& span, const SpannedText& text) override;
        virtual void set_text(const SpannedText& text) override;
        virtual TextLength get_length() const override;
        virtual TextPos get_selection_end() const override;
        virtual void clear_composing_text() override;

        const SpannedText& get_spanned_text() const {return m_text;}

        // Clamped to [0, length].
        void set_selection(TextPos cursor);

        // Typing and backspace at the cursor.
        void insert(const UString& text);
        void delete_backward();

        // Throws ValueException for spans outside of the text.
        void set_composing_span(const Span& span);
        const Span& get_composing_span() const {return m_composing_span;}

    public:
        DEFINE_SIGNAL(<>, text_changed, this);
        DEFINE_SIGNAL(<>, selection_changed, this);

    private:
        void check_span(const Span& span) const;

    private:
        SpannedText m_text;
        TextPos m_selection_end{0};
        Span m_composing_span;
};

#endif // TEXTBUFFER_H
