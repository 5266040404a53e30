#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gio/gio.h>
#include <gtest/gtest.h>

#include "testhelpers.h"

#include "commandlineoptions.h"
#include "configuration.h"
#include "exception.h"
#include "listcompleteglobals.h"
#include "multiautocomplete.h"
#include "tokenizer.h"

// Runs with GSETTINGS_BACKEND=memory and GSETTINGS_SCHEMA_DIR
// pointing to the compiled schema in the build tree.


// Raw access to the engine schema, as another process would see it.
class RawSettings
{
    public:
        RawSettings(const char* schema) :
            m_settings(g_settings_new(schema))
        {}

        ~RawSettings()
        {
            g_object_unref(m_settings);
        }

        void reset_all()
        {
            GSettingsSchema* schema = nullptr;
            g_object_get(m_settings, "settings-schema", &schema, nullptr);
            gchar** keys = g_settings_schema_list_keys(schema);
            for (gchar** k = keys; *k; k++)
                g_settings_reset(m_settings, *k);
            g_strfreev(keys);
            g_settings_schema_unref(schema);
            flush();
        }

        std::string get_string(const char* key)
        {
            gchar* s = g_settings_get_string(m_settings, key);
            std::string result(s);
            g_free(s);
            return result;
        }

        int get_int(const char* key)
        {
            return g_settings_get_int(m_settings, key);
        }

        void set_string(const char* key, const std::string& value)
        {
            g_settings_set_string(m_settings, key, value.c_str());
            flush();
        }

        void set_int(const char* key, int value)
        {
            g_settings_set_int(m_settings, key, value);
            flush();
        }

        void set_boolean(const char* key, bool value)
        {
            g_settings_set_boolean(m_settings, key, value);
            flush();
        }

        // deliver pending change notifications
        static void flush()
        {
            g_settings_sync();
            while (g_main_context_iteration(nullptr, FALSE))
            {}
        }

    private:
        GSettings* m_settings;
};


class ConfigurationTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            RawSettings(SCHEMA_LISTCOMPLETE).reset_all();
            raw.reset_all();
        }

        Config* make_config(const std::vector<std::string>& args = {})
        {
            auto config = Config::make(context);
            if (!args.empty())
                EXPECT_TRUE(config->parse_command_line(args));
            config->init();
            globals.set_config(std::move(config));
            return context.config();
        }

        ListCompleteGlobals globals;
        ContextBase context{&globals};
        RawSettings raw{SCHEMA_ENGINE};
};

TEST_F(ConfigurationTest, defaults)
{
    Config* config = make_config();

    EXPECT_EQ(config->log_level.get(), LogLevel::WARNING);
    EXPECT_EQ(config->engine->separator.get(), std::string(DEFAULT_SEPARATOR));
    EXPECT_EQ(config->engine->threshold.get(), DEFAULT_THRESHOLD);
    EXPECT_TRUE(config->engine->validate_on_focus_out.get());
}

TEST_F(ConfigurationTest, set_writes_through)
{
    Config* config = make_config();
    int n = 0;
    SignalConnections connections;
    connections.connect(config->engine->threshold.changed, [&]{n++;});

    config->engine->threshold = 5;
    RawSettings::flush();

    EXPECT_EQ(raw.get_int("threshold"), 5);
    EXPECT_EQ(n, 1);
}

TEST_F(ConfigurationTest, log_level_is_stored_as_name)
{
    Config* config = make_config();
    config->log_level = LogLevel::DEBUG;
    RawSettings::flush();
    EXPECT_EQ(RawSettings(SCHEMA_LISTCOMPLETE).get_string("log-level"), "debug");
}

TEST_F(ConfigurationTest, outside_changes_arrive)
{
    Config* config = make_config();
    int n = 0;
    SignalConnections connections;
    connections.connect(config->engine->separator.changed, [&]{n++;});

    raw.set_string("separator", ",");

    EXPECT_EQ(config->engine->separator.get(), ",");
    EXPECT_EQ(n, 1);
}

TEST_F(ConfigurationTest, unknown_log_level_falls_back_to_warning)
{
    RawSettings(SCHEMA_LISTCOMPLETE).set_string("log-level", "loud");
    Config* config = make_config();
    EXPECT_EQ(config->log_level.get(), LogLevel::WARNING);
}

TEST_F(ConfigurationTest, command_line_overrides_without_writing)
{
    Config* config = make_config({"listcomplete-demo",
                                  "-s", "|", "-t", "4", "--debug=debug"});

    EXPECT_EQ(config->engine->separator.get(), "|");
    EXPECT_EQ(config->engine->threshold.get(), 4);
    EXPECT_EQ(config->log_level.get(), LogLevel::DEBUG);

    RawSettings::flush();
    EXPECT_EQ(raw.get_string("separator"), ";");
    EXPECT_EQ(raw.get_int("threshold"), 2);
}

TEST_F(ConfigurationTest, engine_follows_configuration)
{
    make_config();
    MultiAutoComplete engine(context);
    engine.apply_config();

    raw.set_string("separator", ",");
    raw.set_int("threshold", 3);
    raw.set_boolean("validate-on-focus-out", false);

    auto tokenizer = dynamic_cast<const SingleCharTokenizer*>(engine.get_tokenizer());
    ASSERT_NE(tokenizer, nullptr);
    EXPECT_EQ(tokenizer->get_separator(), static_cast<CodePoint>(','));
    EXPECT_EQ(engine.get_threshold(), 3);
    EXPECT_FALSE(engine.get_validate_on_focus_out());

    raw.set_string("separator", "");
    EXPECT_EQ(engine.get_tokenizer(), nullptr);
}

TEST_F(ConfigurationTest, invalid_separator_keeps_tokenizer)
{
    auto logger = std::make_shared<CapturingLogger>();
    globals.set_logger(logger);
    make_config();
    MultiAutoComplete engine(context);
    engine.apply_config();

    raw.set_string("separator", ",,");

    auto tokenizer = dynamic_cast<const SingleCharTokenizer*>(engine.get_tokenizer());
    ASSERT_NE(tokenizer, nullptr);
    EXPECT_EQ(tokenizer->get_separator(), static_cast<CodePoint>(';'));
    EXPECT_FALSE(logger->lines.empty());
}

TEST_F(ConfigurationTest, failed_write_is_logged)
{
    auto logger = std::make_shared<CapturingLogger>();
    globals.set_logger(logger);
    Config* config = make_config();

    config->engine->threshold = 0;      // below the schema's range

    RawSettings::flush();
    EXPECT_EQ(raw.get_int("threshold"), 2);
    ASSERT_FALSE(logger->lines.empty());
    EXPECT_NE(logger->lines.back().find("failed to write key 'threshold'"),
              std::string::npos);
}

TEST_F(ConfigurationTest, missing_schema)
{
    EXPECT_THROW(ConfigObject(context, "org.listcomplete.missing"), SchemaException);
}


TEST(CommandLineOptions, parse)
{
    CommandLineOptions options;
    EXPECT_TRUE(options.parse({"listcomplete-demo", "--separator=,",
                               "-w", "words.txt", "extra"}));
    EXPECT_EQ(options.separator, std::optional<std::string>(","));
    EXPECT_FALSE(options.threshold);
    EXPECT_FALSE(options.log_level);
    EXPECT_EQ(options.word_file, "words.txt");
    EXPECT_EQ(options.remaining_args, std::vector<std::string>({"extra"}));
}

TEST(CommandLineOptions, invalid_threshold)
{
    CommandLineOptions options;
    EXPECT_FALSE(options.parse({"listcomplete-demo", "-t", "many"}));
    EXPECT_FALSE(options.threshold);
}

TEST(CommandLineOptions, empty_separator_selects_single_value_mode)
{
    CommandLineOptions options;
    EXPECT_TRUE(options.parse({"listcomplete-demo", "-s", ""}));
    EXPECT_EQ(options.separator, std::optional<std::string>(""));
}
