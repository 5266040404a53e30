#ifndef MULTIAUTOCOMPLETE_H
#define MULTIAUTOCOMPLETE_H

#include <memory>
#include <optional>

#include "tools/textdecls.h"
#include "tools/ustringmain.h"

#include "listcompleteglobals.h"
#include "signalling.h"
#include "spannedtext.h"
#include "suggestions.h"
#include "tokenreplacer.h"

class EditableText;
class TextBuffer;
class Tokenizer;
class ValidationPass;
class Validator;


// Autocompletion for text fields holding delimited lists of values.
// Drives filtering, validation and suggestion insertion for the token
// at the cursor. Without tokenizer the whole text is a single value.
class MultiAutoComplete : public ContextBase
{
    public:
        using Super = ContextBase;

        static constexpr const int DEFAULT_THRESHOLD = 2;

        // Starts out with a SingleCharTokenizer for ';'.
        MultiAutoComplete(const ContextBase& context);
        virtual ~MultiAutoComplete();

        // Collaborators are owned by the host and must outlive
        // this object or be reset to nullptr.
        void set_text_buffer(TextBuffer* buffer);
        void set_suggestion_source(SuggestionSource* source);
        void set_suggestion_view(SuggestionView* view);

        // Use text as buffer and follow its change signals.
        void attach(EditableText& text);
        void detach();

        // nullptr switches to single value mode.
        void set_tokenizer(std::unique_ptr<Tokenizer> tokenizer);
        const Tokenizer* get_tokenizer() const {return m_tokenizer.get();}

        void set_validator(Validator* validator);
        Validator* get_validator() const {return m_validator;}

        // Values <= 0 are stored as 1.
        void set_threshold(int threshold);
        int get_threshold() const {return m_threshold;}

        void set_validate_on_focus_out(bool enable) {m_validate_on_focus_out = enable;}
        bool get_validate_on_focus_out() const {return m_validate_on_focus_out;}

        // Id of the most recent filtering decision.
        QueryId get_query_id() const {return m_query_id;}

        bool enough_to_filter() const;

        // Query suggestions for the token before the cursor, or dismiss
        // and clear them if it is too short.
        void perform_filtering(int key_code=0);

        // Returns the number of edits.
        int perform_validation();

        // Replace the token before the cursor with suggestion plus
        // separator. Returns nothing without text buffer.
        std::optional<Replacement> set_or_replace_text(const SpannedText& suggestion);
        bool revert_replacement(const Replacement& replacement);

        // host events
        void on_text_changed();
        void on_selection_changed();
        void on_focus_changed(bool has_focus);
        void on_suggestions(QueryId id, const UStrings& suggestions);
        void on_query_failed(QueryId id);

        // Take settings from the configuration and follow its changes.
        void apply_config();

    private:
        void dismiss_suggestions();
        void apply_separator(const std::string& separator);
        bool is_current_query(QueryId id) const;

    private:
        TextBuffer* m_buffer{};
        SuggestionSource* m_source{};
        SuggestionView* m_view{};
        Validator* m_validator{};
        std::unique_ptr<Tokenizer> m_tokenizer;
        std::unique_ptr<ValidationPass> m_validation_pass;

        int m_threshold{DEFAULT_THRESHOLD};
        bool m_validate_on_focus_out{true};

        QueryId m_query_id{0};

        // Set while the engine edits the buffer itself.
        bool m_block_completion{false};

        // active token of the last filtering decision
        Span m_active_span;

        SignalConnections m_text_connections;
        SignalConnections m_config_connections;
};

#endif // MULTIAUTOCOMPLETE_H
