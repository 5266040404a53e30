#include <array>
#include <chrono>
#include <cstdio>       // fileno
#include <ctime>
#include <iomanip>      // put_time, setw
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

#include <unistd.h>     // isatty

#include "tools/string_helpers.h"

#include "logger.h"


namespace {

enum TermColor {
    BLACK, RED, GREEN, YELLOW, BLUE, MAGENTA, CYAN, WHITE,
    BOLD, RESET,
    NONE
};

// ANSI escape sequence for color or attribute
std::string get_term_sequence(TermColor color)
{
    switch (color)
    {
        case RESET: return "\x1b[0m";
        case BOLD:  return "\x1b[1m";
        case NONE:  return "";
        default:
            char sequence[] = "\x1b[30m";
            sequence[3] = static_cast<char>('0' + color);
            return sequence;
    }
}

TermColor get_level_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::CRITICAL: return RED;
        case LogLevel::ERROR:    return RED;
        case LogLevel::WARNING:  return YELLOW;
        case LogLevel::INFO:     return GREEN;
        case LogLevel::DEBUG:    return BLUE;
        case LogLevel::TRACE:    return BLUE;
        case LogLevel::EVENT:    return MAGENTA;
        default:
            return NONE;
    }
}

// hh:mm:ss.mmm in local time
std::string format_time_stamp(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    auto t = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return ss.str();
}

const std::array<LogLevel, 8> ALL_LEVELS = {
    LogLevel::NONE, LogLevel::CRITICAL, LogLevel::ERROR, LogLevel::WARNING,
    LogLevel::INFO, LogLevel::DEBUG, LogLevel::TRACE, LogLevel::EVENT,
};

}


LogStream::LogStream(const Logger* logger, LogLevel level, const char* const src_location)
{
    if (logger && logger->can_log(level))
    {
        m_logger = logger;
        m_logger->write_prefix(*this, level, extract_src_location(src_location));
    }
}

LogStream::~LogStream()
{
    if (m_logger)
    {
        static std::mutex mutex;
        std::lock_guard<std::mutex> guard(mutex);
        m_logger->output(this->str());
    }
}

void Logger::set_level(LogLevel level)
{
    m_level = level;
}

std::shared_ptr<Logger> Logger::get_default()
{
    static auto lg = std::make_shared<LoggerConsole>(std::cerr);
    return lg;
}


LoggerConsole::LoggerConsole(std::ostream& out) :
    m_out(out)
{
    // colors only for terminals
    if (&out == &std::cerr)
        m_use_colors = isatty(fileno(stderr));
    else if (&out == &std::cout)
        m_use_colors = isatty(fileno(stdout));
}

void LoggerConsole::write_prefix(std::ostream& stream, LogLevel level, const std::string& src_location) const
{
    stream << format_time_stamp(std::chrono::system_clock::now()) << " ";

    if (m_use_colors)
        stream << get_term_sequence(get_level_color(level));
    stream << std::setw(7) << std::left << to_string(level);
    if (m_use_colors)
        stream << get_term_sequence(RESET) << get_term_sequence(BOLD);
    stream << " " << std::setw(33) << std::left << (src_location + ": ");
    if (m_use_colors)
        stream << get_term_sequence(RESET);
}

void LoggerConsole::output(const std::string& s) const
{
    m_out << s << std::endl;
}


std::string to_string(LogLevel e)
{
    switch (e)
    {
        case LogLevel::NONE:     return "NONE";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::EVENT:    return "EVENT";
    }
    return {};
}

bool parse_log_level(const std::string& s, LogLevel& level_out)
{
    std::string name = lower(strip(s));
    if (name == "all")
    {
        level_out = LogLevel::EVENT;
        return true;
    }

    for (LogLevel level : ALL_LEVELS)
    {
        if (lower(to_string(level)) == name)
        {
            level_out = level;
            return true;
        }
    }
    return false;
}

// cut out class::function from src_location
std::string extract_src_location(const char* const src_location)
{
    auto fields = re_search(src_location, R"(((?:\w+::)*\w+)\()");
    return fields.empty() ? "" : fields[0];
}
