#ifndef TESTHELPERS_H
#define TESTHELPERS_H

#include <string>
#include <utility>
#include <vector>

#include "tools/logger.h"
#include "tools/ustringmain.h"

#include "suggestions.h"
#include "validator.h"


// Remembers queries, results are delivered by the test.
class RecordingSource : public SuggestionSource
{
    public:
        virtual void query(const UString& constraint, QueryId id) override
        {
            queries.emplace_back(constraint, id);
        }

        virtual void clear() override
        {
            clear_count++;
        }

        std::vector<std::pair<UString, QueryId>> queries;
        int clear_count{0};
};


class RecordingView : public SuggestionView
{
    public:
        virtual void show(const UStrings& suggestions_) override
        {
            suggestions = suggestions_;
            showing = true;
            show_count++;
        }

        virtual void dismiss() override
        {
            suggestions.clear();
            showing = false;
            dismiss_count++;
        }

        virtual bool is_showing() const override
        {
            return showing;
        }

        UStrings suggestions;
        bool showing{false};
        int show_count{0};
        int dismiss_count{0};
};


// Upper case words are valid, fix converts to upper case.
class UpperCaseValidator : public Validator
{
    public:
        virtual bool is_valid(const UString& text) override
        {
            checked.emplace_back(text);
            return text == text.upper();
        }

        virtual UString fix_text(const UString& invalid_text) override
        {
            return invalid_text.upper();
        }

        UStrings checked;
};


// Collects log lines instead of printing them.
class CapturingLogger : public Logger
{
    public:
        virtual void write_prefix(std::ostream& stream, LogLevel level,
                                  const std::string& src_location) const override
        {
            stream << to_string(level) << " " << src_location << ": ";
        }

        virtual void output(const std::string& s) const override
        {
            lines.emplace_back(s);
        }

        mutable std::vector<std::string> lines;
};

#endif // TESTHELPERS_H
