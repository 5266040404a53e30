#ifndef LISTCOMPLETEGLOBALS_H
#define LISTCOMPLETEGLOBALS_H

#include <memory>

class Config;
class Logger;


// Process-wide services shared by all engine instances of a host.
class ListCompleteGlobals
{
    public:
        ListCompleteGlobals();
        ~ListCompleteGlobals();

        // Null logger selects Logger::get_default().
        void set_logger(const std::shared_ptr<Logger>& logger);

        // Config is optional, engines run on built-in defaults without it.
        void set_config(std::unique_ptr<Config> config);

    private:
        std::shared_ptr<Logger> m_logger;
        std::unique_ptr<Config> m_config;

        friend class ContextBase;
};

// Base class for transporting global settings deep into the class hierarchy
class ContextBase
{
    public:
        ContextBase(ListCompleteGlobals* globals) :
            m_globals(globals)
        {}

        Logger* logger();
        const Logger* logger() const;

        Config* config() {return m_globals ? m_globals->m_config.get() : nullptr;}
        const Config* config() const {return m_globals ? m_globals->m_config.get() : nullptr;}

        ListCompleteGlobals* get_globals() const {return m_globals;}

    public:
        ListCompleteGlobals* m_globals{};     // weak pointer to the one held by the host
};

#endif // LISTCOMPLETEGLOBALS_H
