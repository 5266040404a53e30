#include <gio/gio.h>

#include "tools/glib_helpers.h"
#include "tools/logger.h"
#include "tools/string_helpers.h"

#include "configobject.h"
#include "exception.h"


GSKeyBase::GSKeyBase(ConfigObject* config_object, const std::string& key_name) :
    Super(*config_object),
    m_config_object(config_object),
    m_key_name(key_name)
{
    config_object->add_key(this);
}

void GSKeyBase::log_access(const char* operation, const std::string& value)
{
    LOG_DEBUG << operation << " " << m_config_object->get_schema()
              << " " << m_key_name << " = " << value;
}

void GSKeyBase::log_exception(const Exception& ex, const char* operation)
{
    LOG_ERROR << "failed to " << operation << " key " << repr(m_key_name)
              << ": " << ex.what();
}


static gboolean on_gsettings_change_event (GSettings *settings,
                                           gpointer   keys,
                                           gint       n_keys,
                                           gpointer   user_data)
{
    (void)settings;

    ConfigObject* this_ = reinterpret_cast<ConfigObject*>(user_data);
    for (gint i=0; i<n_keys; i++)
    {
        GQuark* quarks = reinterpret_cast<GQuark*>(keys);
        const gchar* name = g_quark_to_string(quarks[i]);
        this_->on_change_event(name);
    }
    return TRUE;  // done, we don't need the "changed" signal
}

ConfigObject::ConfigObject(const ContextBase& context,
                           const std::string& schema) :
    ContextBase(context),
    m_parent(nullptr),
    m_schema(schema)
{
    construct();
}

ConfigObject::ConfigObject(ConfigObject* parent,
                           const std::string& schema) :
    ContextBase(*parent),
    m_parent(parent),
    m_schema(schema)
{
    construct();
}

void ConfigObject::construct()
{
    // g_settings_new() aborts for unknown schemas, look it up first.
    GSettingsSchemaSource* source = g_settings_schema_source_get_default();
    GSettingsSchemaPtr schema(source ?
                              g_settings_schema_source_lookup(source, m_schema.c_str(), TRUE) :
                              nullptr,
                              g_settings_schema_unref);
    if (!schema)
        throw SchemaException(sstr()
            << "GSettings schema " << repr(m_schema) << " not found."
            << " Is this GSettings schema installed?");

    m_settings = g_settings_new_full(schema.get(), nullptr, nullptr);
    if (!m_settings)
        throw SchemaException(sstr()
            << "g_settings_new_full failed for " << repr(m_schema) << ".");

    g_signal_connect (m_settings, "change_event", G_CALLBACK (on_gsettings_change_event), this);
}

ConfigObject::~ConfigObject()
{
    if (m_settings)
    {
         g_signal_handlers_disconnect_by_data (m_settings, this);
         g_object_unref(m_settings);
    }
}

void ConfigObject::on_change_event(const char* key_name)
{
    for(auto& gskey : m_gskeys)
    {
        if (gskey->get_key_name() == key_name)
        {
            try {
                gskey->on_change_event();
            } catch (const Exception& ex) {
                LOG_ERROR << "error reading changed key " << repr(gskey->get_key_name())
                          << ": " << ex.what();
            }
            break;
        }
    }
}

void ConfigObject::sync()
{
    if (m_modified &&
        m_settings)
    {
        g_settings_sync();
        set_modified(false);
    }
}

void ConfigObject::set_modified(bool modified)
{
    m_modified = modified;
}

// init property values from gsettings
void ConfigObject::read_all_keys()
{
    for (auto gskey : m_gskeys)
    {
        try {
            gskey->read();
        } catch (const Exception& ex) {
            LOG_ERROR << "error reading key " << repr(gskey->get_key_name())
                      << ": " << ex.what();
        }
    }

    for (auto child  : this->m_children)
        child->read_all_keys();
}

void ConfigObject::read_value(const std::string& key_name, bool& value)
{
    value = g_settings_get_boolean(m_settings, key_name.c_str());
}
void ConfigObject::write_value(const std::string& key_name, bool value)
{
    if (!g_settings_set_boolean(m_settings, key_name.c_str(), value))
        throw ConfigException("g_settings_set_boolean failed for " + key_name);
}

void ConfigObject::read_value(const std::string& key_name, int& value)
{
    value = g_settings_get_int(m_settings, key_name.c_str());
}

void ConfigObject::write_value(const std::string& key_name, int value)
{
    if (!g_settings_set_int(m_settings, key_name.c_str(), value))
        throw ConfigException("g_settings_set_int failed for " + key_name);
}

void ConfigObject::read_value(const std::string& key_name, std::string& value)
{
    GStrPtr s(g_settings_get_string(m_settings, key_name.c_str()), g_free);
    value = s ? s.get() : "";
}

void ConfigObject::write_value(const std::string& key_name,
                               const std::string& value)
{
    if (!g_settings_set_string(m_settings, key_name.c_str(), value.c_str()))
        throw ConfigException("g_settings_set_string failed for " + key_name);
}
