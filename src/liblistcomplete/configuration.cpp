#include <string>

#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "commandlineoptions.h"
#include "configuration.h"
#include "exception.h"

using namespace std;


Config::Config(const ContextBase& context) :
    Super(context, SCHEMA_LISTCOMPLETE),
    engine(std::make_unique<ConfigEngine>(this)),
    options(std::make_unique<CommandLineOptions>())
{
    m_children.emplace_back(this->engine.get());
}

Config::~Config()
{
}

std::unique_ptr<Config> Config::make(const ContextBase& context)
{
    return std::make_unique<This>(context);
}

bool Config::parse_command_line(const vector<string>& args)
{
    return options->parse(args);
}

void Config::init()
{
    read_all_keys();
    apply_command_line();
}

void Config::apply_command_line()
{
    if (options->log_level)
    {
        LogLevel level;
        if (parse_log_level(options->log_level.value(), level))
            log_level.override_value(level);
        else
            LOG_WARNING << "unknown log level " << repr(options->log_level.value());
    }

    if (options->separator)
        engine->separator.override_value(options->separator.value());

    if (options->threshold)
        engine->threshold.override_value(options->threshold.value());
}


ConfigEngine::ConfigEngine(ConfigObject* parent) :
    ConfigObject(parent, SCHEMA_ENGINE)
{
}
