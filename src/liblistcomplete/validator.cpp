#include "validator.h"


bool TrimValidator::is_valid(const UString& text)
{
    return !text.empty() && text == text.strip();
}

UString TrimValidator::fix_text(const UString& invalid_text)
{
    return invalid_text.strip();
}
