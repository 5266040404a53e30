#include <fstream>

#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "commandlineoptions.h"
#include "configuration.h"
#include "demohost.h"
#include "exception.h"
#include "tokenizer.h"


static const UStrings DEFAULT_WORDS {
    "motorway", "trunk", "primary", "secondary", "tertiary",
    "unclassified", "residential", "service", "living_street",
    "pedestrian", "track", "path", "footway", "cycleway", "bridleway",
};


bool WordListSource::load(const std::string& filename)
{
    std::ifstream f(filename);
    if (!f)
        return false;

    UStrings words;
    std::string line;
    while (std::getline(f, line))
    {
        UString word = UString(line).strip();
        if (!word.empty())
            words.emplace_back(word);
    }
    m_words = words;
    return true;
}

void WordListSource::query(const UString& constraint, QueryId id)
{
    UString prefix = constraint.lower();
    UStrings results;
    for (const auto& word : m_words)
        if (word.lower().startswith(prefix))
            results.emplace_back(word);
    m_pending.emplace_back(id, results);
}

void WordListSource::clear()
{
    m_pending.clear();
}

void WordListSource::deliver(MultiAutoComplete& engine)
{
    auto pending = std::move(m_pending);
    m_pending.clear();
    for (const auto& e : pending)
        engine.on_suggestions(e.first, e.second);
}


void ConsoleView::show(const UStrings& suggestions)
{
    m_suggestions = suggestions;
    for (size_t i=0; i<m_suggestions.size(); i++)
        m_out << "  " << (i + 1) << ") " << m_suggestions[i].to_utf8() << std::endl;
}

void ConsoleView::dismiss()
{
    m_suggestions.clear();
}


DemoHost::DemoHost(ListCompleteGlobals* globals, std::ostream& out) :
    ContextBase(globals),
    m_out(out),
    m_text(*this),
    m_engine(*this),
    m_view(out)
{
    m_source.set_words(DEFAULT_WORDS);

    m_engine.attach(m_text);
    m_engine.set_suggestion_source(&m_source);
    m_engine.set_suggestion_view(&m_view);
    m_engine.set_validator(&m_validator);
}

DemoHost::~DemoHost()
{
    m_engine.detach();
}

bool DemoHost::init(const std::vector<std::string>& args)
{
    // setup logger
    m_globals->set_logger(Logger::get_default());

    // create config, optional
    std::unique_ptr<Config> config;
    try {
        config = Config::make(*this);
    }
    catch (const SchemaException& ex) {
        LOG_WARNING << ex.what() << " Running with built-in defaults.";
    }

    if (config)
    {
        if (!config->parse_command_line(args))
            return false;
        config->init();

        m_connections.connect(config->log_level.changed,
                              [this]{apply_log_level(this->config()->log_level);});
        apply_log_level(config->log_level);

        const std::string word_file = config->options->word_file;
        m_globals->set_config(std::move(config));
        m_engine.apply_config();

        if (!word_file.empty() && !m_source.load(word_file))
            LOG_ERROR << "failed to read word list " << repr(word_file);
    }
    else
    {
        CommandLineOptions options;
        if (!options.parse(args))
            return false;
        apply_options(options);
    }

    LOG_DEBUG << "threshold " << m_engine.get_threshold()
              << (m_engine.get_tokenizer() ? ", list mode" : ", single value mode");
    return true;
}

// Without gsettings schema the command line is all there is.
void DemoHost::apply_options(const CommandLineOptions& options)
{
    if (options.log_level)
    {
        LogLevel level;
        if (parse_log_level(options.log_level.value(), level))
            apply_log_level(level);
        else
            LOG_WARNING << "unknown log level " << repr(options.log_level.value());
    }

    if (options.separator)
    {
        if (options.separator.value().empty())
        {
            m_engine.set_tokenizer({});
        }
        else
        {
            try {
                m_engine.set_tokenizer(SingleCharTokenizer::from_string(options.separator.value()));
            }
            catch (const ValueException& ex) {
                LOG_ERROR << ex.what();
            }
        }
    }

    if (options.threshold)
        m_engine.set_threshold(options.threshold.value());

    if (!options.word_file.empty() && !m_source.load(options.word_file))
        LOG_ERROR << "failed to read word list " << repr(options.word_file);
}

void DemoHost::apply_log_level(LogLevel level)
{
    logger()->set_level(level);
}

void DemoHost::run(std::istream& in)
{
    print_help();
    print_text();

    std::string line;
    while (std::getline(in, line))
    {
        if (!execute(line))
            break;
    }
}

bool DemoHost::execute(const std::string& line)
{
    auto pos = line.find(' ');
    std::string command = line.substr(0, pos);
    std::string arg = pos == std::string::npos ? "" : line.substr(pos + 1);

    LOG_EVENT << repr(command) << " " << repr(arg);

    if (command == "quit" || command == "q")
    {
        return false;
    }
    else if (command == "type")
    {
        // one change per character, like a keyboard
        for (auto cp : UString(arg).get_code_points())
            m_text.insert(UString::from_code_point(cp));
        m_last_replacement.reset();
    }
    else if (command == "cursor")
    {
        int cursor;
        if (try_to_int(arg, cursor))
            m_text.set_selection(cursor);
        else
            m_out << "invalid position " << repr(arg) << std::endl;
    }
    else if (command == "back")
    {
        // backspace right after picking a suggestion undoes it
        bool reverted = m_last_replacement &&
            m_text.get_selection_end() == m_last_replacement->inserted.end() &&
            m_engine.revert_replacement(m_last_replacement.value());
        if (!reverted)
            m_text.delete_backward();
        m_last_replacement.reset();
    }
    else if (command == "pick")
    {
        const UStrings& suggestions = m_view.get_suggestions();
        int index;
        if (try_to_int(arg, index) &&
            index >= 1 && index <= static_cast<int>(suggestions.size()))
        {
            UString suggestion = suggestions[static_cast<size_t>(index - 1)];
            m_last_replacement = m_engine.set_or_replace_text(suggestion);
        }
        else
        {
            m_out << "no suggestion " << repr(arg) << std::endl;
        }
    }
    else if (command == "undo")
    {
        if (!m_last_replacement ||
            !m_engine.revert_replacement(m_last_replacement.value()))
            m_out << "nothing to undo" << std::endl;
        m_last_replacement.reset();
    }
    else if (command == "commit")
    {
        m_engine.on_focus_changed(false);
        m_engine.on_focus_changed(true);
        m_last_replacement.reset();
    }
    else if (command == "show" || command.empty())
    {
        // text is printed below
    }
    else if (command == "help")
    {
        print_help();
    }
    else
    {
        m_out << "unknown command " << repr(command) << std::endl;
    }

    m_source.deliver(m_engine);
    print_text();
    return true;
}

void DemoHost::print_text()
{
    UString text = m_text.get_text();
    TextPos cursor = m_text.get_selection_end();
    m_out << "[" << text.slice(0, cursor).to_utf8() << "|"
          << text.slice(cursor).to_utf8() << "]" << std::endl;
}

void DemoHost::print_help()
{
    m_out << "Commands:" << std::endl
          << "  type TEXT   insert TEXT at the cursor" << std::endl
          << "  cursor N    move the cursor" << std::endl
          << "  back        backspace" << std::endl
          << "  pick N      apply suggestion N" << std::endl
          << "  undo        revert the last applied suggestion" << std::endl
          << "  commit      leave the field, validating all values" << std::endl
          << "  show        print the text" << std::endl
          << "  quit" << std::endl;
}
