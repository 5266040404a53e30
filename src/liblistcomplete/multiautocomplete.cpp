#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "configuration.h"
#include "exception.h"
#include "filteringgate.h"
#include "multiautocomplete.h"
#include "textbuffer.h"
#include "tokenizer.h"
#include "validationpass.h"
#include "validator.h"


// Suppresses filtering while the engine edits the buffer itself.
class CompletionBlocker
{
    public:
        CompletionBlocker(bool& flag) :
            m_flag(flag),
            m_old_value(flag)
        {
            m_flag = true;
        }
        ~CompletionBlocker()
        {
            m_flag = m_old_value;
        }

    private:
        bool& m_flag;
        bool m_old_value;
};


MultiAutoComplete::MultiAutoComplete(const ContextBase& context) :
    Super(context),
    m_tokenizer(std::make_unique<SingleCharTokenizer>()),
    m_validation_pass(std::make_unique<ValidationPass>(context))
{
}

MultiAutoComplete::~MultiAutoComplete()
{
}

void MultiAutoComplete::set_text_buffer(TextBuffer* buffer)
{
    m_buffer = buffer;
    m_active_span = {};
}

void MultiAutoComplete::set_suggestion_source(SuggestionSource* source)
{
    m_source = source;
}

void MultiAutoComplete::set_suggestion_view(SuggestionView* view)
{
    m_view = view;
}

void MultiAutoComplete::attach(EditableText& text)
{
    detach();
    set_text_buffer(&text);
    m_text_connections.connect(text.text_changed,
                               [this]{on_text_changed();});
    m_text_connections.connect(text.selection_changed,
                               [this]{on_selection_changed();});
}

void MultiAutoComplete::detach()
{
    m_text_connections.disconnect_all();
    set_text_buffer(nullptr);
}

void MultiAutoComplete::set_tokenizer(std::unique_ptr<Tokenizer> tokenizer)
{
    m_tokenizer = std::move(tokenizer);
    LOG_DEBUG << (m_tokenizer ? "list mode" : "single value mode");
}

void MultiAutoComplete::set_validator(Validator* validator)
{
    m_validator = validator;
}

void MultiAutoComplete::set_threshold(int threshold)
{
    m_threshold = threshold <= 0 ? 1 : threshold;
}

bool MultiAutoComplete::enough_to_filter() const
{
    if (!m_buffer)
        return false;

    return ::enough_to_filter(m_buffer->get_text(),
                              m_buffer->get_selection_end(),
                              m_threshold, m_tokenizer.get());
}

void MultiAutoComplete::perform_filtering(int key_code)
{
    if (!m_buffer)
        return;

    UString text = m_buffer->get_text();
    TextPos cursor = m_buffer->get_selection_end();

    m_query_id++;
    m_active_span = active_token_span(text, cursor, m_tokenizer.get());

    if (::enough_to_filter(text, cursor, m_threshold, m_tokenizer.get()))
    {
        UString constraint = text.slice(m_active_span.begin, m_active_span.end());
        LOG_DEBUG << "query " << m_query_id << " for " << repr(constraint)
                  << " key_code " << key_code;
        if (m_source)
            m_source->query(constraint, m_query_id);
    }
    else
    {
        LOG_DEBUG << "token too short at " << m_active_span
                  << ", threshold " << m_threshold;
        dismiss_suggestions();
        if (m_source)
            m_source->clear();
    }
}

int MultiAutoComplete::perform_validation()
{
    if (!m_buffer)
        return 0;

    CompletionBlocker blocker(m_block_completion);
    return m_validation_pass->run(*m_buffer, m_tokenizer.get(), m_validator);
}

std::optional<Replacement> MultiAutoComplete::set_or_replace_text(const SpannedText& suggestion)
{
    if (!m_buffer)
    {
        LOG_ERROR << "no text buffer, dropping " << suggestion;
        return {};
    }

    Replacement replacement;
    {
        CompletionBlocker blocker(m_block_completion);
        replacement = replace_token(*m_buffer, m_tokenizer.get(), suggestion);
    }
    LOG_DEBUG << replacement;

    // outstanding results refer to the replaced token
    m_query_id++;
    m_active_span = active_token_span(m_buffer->get_text(),
                                      m_buffer->get_selection_end(),
                                      m_tokenizer.get());
    dismiss_suggestions();

    return replacement;
}

bool MultiAutoComplete::revert_replacement(const Replacement& replacement)
{
    if (!m_buffer)
        return false;

    bool reverted;
    {
        CompletionBlocker blocker(m_block_completion);
        reverted = ::revert_replacement(*m_buffer, replacement);
    }
    LOG_DEBUG << replacement << (reverted ? " reverted" : " not reverted, text changed");
    return reverted;
}

void MultiAutoComplete::on_text_changed()
{
    LOG_EVENT << "blocked " << m_block_completion;
    if (!m_block_completion)
        perform_filtering();
}

void MultiAutoComplete::on_selection_changed()
{
    LOG_EVENT << "blocked " << m_block_completion;
    if (m_block_completion || !m_buffer)
        return;

    Span span = active_token_span(m_buffer->get_text(),
                                  m_buffer->get_selection_end(),
                                  m_tokenizer.get());
    if (span != m_active_span)
        perform_filtering();
}

void MultiAutoComplete::on_focus_changed(bool has_focus)
{
    LOG_EVENT << "has_focus " << has_focus;
    if (!has_focus)
    {
        if (m_validate_on_focus_out)
            perform_validation();
        dismiss_suggestions();
    }
}

void MultiAutoComplete::on_suggestions(QueryId id, const UStrings& suggestions)
{
    LOG_EVENT << "query " << id << ", " << suggestions.size() << " results";
    if (!is_current_query(id))
        return;

    if (suggestions.empty() ||
        !enough_to_filter())
    {
        dismiss_suggestions();
        return;
    }

    if (m_view)
        m_view->show(suggestions);
}

void MultiAutoComplete::on_query_failed(QueryId id)
{
    LOG_EVENT << "query " << id;
    if (!is_current_query(id))
        return;

    LOG_INFO << "query " << id << " failed";
    dismiss_suggestions();
}

void MultiAutoComplete::apply_config()
{
    Config* cfg = config();
    if (!cfg)
    {
        LOG_DEBUG << "no configuration, keeping current settings";
        return;
    }

    ConfigEngine* engine = cfg->engine.get();
    apply_separator(engine->separator);
    set_threshold(engine->threshold);
    set_validate_on_focus_out(engine->validate_on_focus_out);

    m_config_connections.disconnect_all();
    m_config_connections.connect(engine->separator.changed,
                                 [this, engine]{apply_separator(engine->separator);});
    m_config_connections.connect(engine->threshold.changed,
                                 [this, engine]{set_threshold(engine->threshold);});
    m_config_connections.connect(engine->validate_on_focus_out.changed,
                                 [this, engine]{set_validate_on_focus_out(engine->validate_on_focus_out);});
}

void MultiAutoComplete::dismiss_suggestions()
{
    if (m_view && m_view->is_showing())
        m_view->dismiss();
}

void MultiAutoComplete::apply_separator(const std::string& separator)
{
    if (separator.empty())
    {
        set_tokenizer({});
        return;
    }

    try
    {
        set_tokenizer(SingleCharTokenizer::from_string(separator));
    }
    catch (const ValueException& ex)
    {
        LOG_ERROR << "keeping current tokenizer: " << ex.what();
    }
}

bool MultiAutoComplete::is_current_query(QueryId id) const
{
    if (id != m_query_id)
    {
        LOG_DEBUG << "discarding stale results of query " << id
                  << ", current " << m_query_id;
        return false;
    }
    return true;
}
