#include <memory>

#include "tools/logger.h"

#include "configuration.h"
#include "listcompleteglobals.h"


ListCompleteGlobals::ListCompleteGlobals()
{
}

ListCompleteGlobals::~ListCompleteGlobals()
{
}

void ListCompleteGlobals::set_logger(const std::shared_ptr<Logger>& logger)
{
    m_logger = logger;
}

void ListCompleteGlobals::set_config(std::unique_ptr<Config> config)
{
    m_config = std::move(config);
}


Logger* ContextBase::logger()
{
    if (m_globals && m_globals->m_logger)
        return m_globals->m_logger.get();
    return Logger::get_default().get();
}

const Logger* ContextBase::logger() const
{
    if (m_globals && m_globals->m_logger)
        return m_globals->m_logger.get();
    return Logger::get_default().get();
}
