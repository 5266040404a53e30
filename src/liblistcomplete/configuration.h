#ifndef CONFIG_H
#define CONFIG_H

#include <memory>
#include <string>
#include <vector>

#include "tools/loggerdecls.h"
#include "tools/string_helpers.h"

#include "configobject.h"
#include "listcompleteglobals.h"

class CommandLineOptions;


// gsettings schemas
constexpr const char* SCHEMA_LISTCOMPLETE = "org.listcomplete";
constexpr const char* SCHEMA_ENGINE       = "org.listcomplete.engine";

// hard coded defaults, keep in sync with the schema
constexpr const char* DEFAULT_SEPARATOR   = ";";
constexpr const int DEFAULT_THRESHOLD     = 2;

class ConfigEngine;


class Config : public ConfigObject
{
    public:
        // persistent configuration keys
        GSKey<LogLevel, std::string> log_level{this, "log-level", LogLevel::WARNING,
        {
            [](const std::string& s) {
                LogLevel level = LogLevel::WARNING;
                parse_log_level(s, level);
                return level;
            },
            [](const LogLevel& level) {
                return lower(to_string(level));
            },
        }};

        std::unique_ptr<ConfigEngine> engine;

        std::unique_ptr<CommandLineOptions> options;

    public:
        using Super = ConfigObject;
        using This = Config;

        Config(const ContextBase& context);
        ~Config();
        static std::unique_ptr<This> make(const ContextBase& context);

        bool parse_command_line(const std::vector<std::string>& args);

        // Read all keys, then let command line options take precedence.
        void init();

    private:
        void apply_command_line();
};


// editing engine configuration keys
class ConfigEngine : public ConfigObject
{
    public:
        GSKey<std::string> separator{this, "separator", DEFAULT_SEPARATOR};
        GSKey<int> threshold{this, "threshold", DEFAULT_THRESHOLD};
        GSKey<bool> validate_on_focus_out{this, "validate-on-focus-out", true};

    public:
        ConfigEngine(ConfigObject* parent);
};

#endif // CONFIG_H
