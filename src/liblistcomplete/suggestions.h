#ifndef SUGGESTIONS_H
#define SUGGESTIONS_H

#include <cstdint>

#include "tools/ustringmain.h"

using QueryId = uint64_t;


// Asynchronous provider of completions. Results are handed back
// through MultiAutoComplete::on_suggestions() with the same id.
class SuggestionSource
{
    public:
        virtual ~SuggestionSource() = default;

        virtual void query(const UString& constraint, QueryId id) = 0;

        // Drop pending and cached results.
        virtual void clear() = 0;
};


// Drop-down, popup or whatever else presents the completions.
class SuggestionView
{
    public:
        virtual ~SuggestionView() = default;

        virtual void show(const UStrings& suggestions) = 0;
        virtual void dismiss() = 0;
        virtual bool is_showing() const = 0;
};

#endif // SUGGESTIONS_H
