#ifndef DEMOHOST_H
#define DEMOHOST_H

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tools/loggerdecls.h"
#include "tools/ustringmain.h"

#include "listcompleteglobals.h"
#include "multiautocomplete.h"
#include "signalling.h"
#include "suggestions.h"
#include "textbuffer.h"
#include "validator.h"

class CommandLineOptions;


// Prefix matching against a fixed list of words. Results are held
// back until deliver() to mimic an asynchronous lookup.
class WordListSource : public SuggestionSource
{
    public:
        void set_words(const UStrings& words) {m_words = words;}
        bool load(const std::string& filename);

        virtual void query(const UString& constraint, QueryId id) override;
        virtual void clear() override;

        // Hand all pending results to engine.
        void deliver(MultiAutoComplete& engine);

    private:
        UStrings m_words;
        std::vector<std::pair<QueryId, UStrings>> m_pending;
};


class ConsoleView : public SuggestionView
{
    public:
        ConsoleView(std::ostream& out) :
            m_out(out)
        {}

        virtual void show(const UStrings& suggestions) override;
        virtual void dismiss() override;
        virtual bool is_showing() const override {return !m_suggestions.empty();}

        const UStrings& get_suggestions() const {return m_suggestions;}

    private:
        std::ostream& m_out;
        UStrings m_suggestions;
};


// Line oriented stand-in for a text entry with autocompletion.
class DemoHost : public ContextBase
{
    public:
        DemoHost(ListCompleteGlobals* globals, std::ostream& out);
        ~DemoHost();

        // Set up logging and configuration. Returns false if the
        // program should exit, e.g. after --help.
        bool init(const std::vector<std::string>& args);

        void run(std::istream& in);

        // Returns false for quit.
        bool execute(const std::string& line);

    private:
        void apply_options(const CommandLineOptions& options);
        void apply_log_level(LogLevel level);
        void print_text();
        void print_help();

    private:
        std::ostream& m_out;

        EditableText m_text;
        MultiAutoComplete m_engine;
        WordListSource m_source;
        ConsoleView m_view;
        TrimValidator m_validator;

        std::optional<Replacement> m_last_replacement;

        SignalConnections m_connections;
};

#endif // DEMOHOST_H
