#ifndef VALIDATOR_H
#define VALIDATOR_H

#include "tools/ustringmain.h"


// Host supplied token validation.
class Validator
{
    public:
        virtual ~Validator() = default;

        virtual bool is_valid(const UString& text) = 0;

        // Corrected replacement for an invalid token, may be empty.
        virtual UString fix_text(const UString& invalid_text) = 0;
};


// Accepts non-empty tokens without surrounding whitespace,
// fixes by stripping.
class TrimValidator : public Validator
{
    public:
        virtual bool is_valid(const UString& text) override;
        virtual UString fix_text(const UString& invalid_text) override;
};

#endif // VALIDATOR_H
