#ifndef LOGGERDECLS_H
#define LOGGERDECLS_H

#include <ostream>
#include <string>

enum class LogLevel
{
    NONE,   // no logging
    CRITICAL,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
    TRACE,
    EVENT,
};

std::string to_string(LogLevel e);

inline std::ostream& operator<<(std::ostream& s, LogLevel e)
{
    s << to_string(e);
    return s;
}

// Parse level names as given on the command line or in gsettings,
// e.g. "debug" or "WARNING". "all" selects the most verbose level.
bool parse_log_level(const std::string& s, LogLevel& level_out);

#endif // LOGGERDECLS_H
