#ifndef CONFIGOBJECT_H
#define CONFIGOBJECT_H

#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include "listcompleteglobals.h"
#include "signalling.h"
#include "exception.h"

class GSKeyBase;
struct _GSettings;
typedef struct _GSettings GSettings;


// Group of settings keys backed by one GSettings schema.
class ConfigObject : public ContextBase
{
    public:
        using Super = ContextBase;
        using This = ConfigObject;

        // Throws SchemaException if the schema isn't installed.
        ConfigObject(const ContextBase& context,
                     const std::string& schema);
        ConfigObject(ConfigObject* parent,
                     const std::string& schema);
        virtual ~ConfigObject();

        const std::string& get_schema() const {return m_schema;}

        void sync();
        void set_modified(bool modified);

        void read_value(const std::string& key_name, bool& value);
        void write_value(const std::string& key_name, bool value);

        void read_value(const std::string& key_name, int& value);
        void write_value(const std::string& key_name, int value);

        void read_value(const std::string& key_name, std::string& value);
        void write_value(const std::string& key_name, const std::string& value);

        void add_key(GSKeyBase* gskey)
        {
            m_gskeys.emplace_back(gskey);
        }

        void on_change_event(const char* key_name);

    protected:
        // init GSKey values from gsettings
        void read_all_keys();

    private:
        void construct();

    protected:
        ConfigObject* m_parent{};
        std::vector<ConfigObject*> m_children;

    private:
        GSettings* m_settings{};
        std::vector<GSKeyBase*> m_gskeys;
        std::string m_schema;

        // True if anything was written, cleared with sync().
        bool m_modified{false};
};


// Conversion between the property type and the type stored in
// gsettings, e.g. LogLevel <-> "debug". Only needed if they differ.
template<typename TProp, typename TSetting>
struct GSPacker
{
    using UnpackFunc = std::function<TProp(const TSetting&)>;
    using PackFunc = std::function<TSetting(const TProp&)>;

    UnpackFunc m_unpack_func{};
    PackFunc m_pack_func{};
};


class GSKeyBase : public ContextBase
{
    public:
        using Super = ContextBase;

        // Registers with config_object, which forwards change events.
        GSKeyBase(ConfigObject* config_object, const std::string& key_name);
        virtual ~GSKeyBase() = default;

        // Load from gsettings, store to gsettings.
        virtual void read() = 0;
        virtual void write() = 0;

        // Key changed in gsettings, possibly by another process.
        virtual void on_change_event() = 0;

        const std::string& get_key_name() const {return m_key_name;}

    protected:
        void log_access(const char* operation, const std::string& value);
        void log_exception(const Exception& ex, const char* operation);

    protected:
        ConfigObject* m_config_object{};
        std::string m_key_name;
};

// Typed value of a gsettings key. Emits changed when the value changes,
// no matter if from set(), override_value() or from outside.
template<typename TProp, typename TSetting=TProp>
class GSKey : public GSKeyBase
{
    public:
        using Super = GSKeyBase;
        using Packer = GSPacker<TProp, TSetting>;

        GSKey(ConfigObject* config_object,
              const std::string& key_name,
              const TProp& default_value={},
              Packer packer={}) :
            Super(config_object, key_name),
            m_default_value(default_value),
            m_packer(packer),
            m_value(default_value)
        {}

        operator const TProp&() const {return m_value;}

        const TProp& operator=(const TProp &value)
        {
            set(value);
            return m_value;
        }

        const TProp& get() const {return m_value;}
        const TProp& get_default() const {return m_default_value;}

        // Change and store in gsettings.
        void set(const TProp& value)
        {
            if (m_value == value)
                return;

            m_value = value;
            try
            {
                write();
            }
            catch (const Exception& ex)
            {
                log_exception(ex, "write");
            }
            // The change notification of our own write finds the
            // value unchanged and stays silent, emit here instead.
            changed.emit();
        }

        // Change the value for this process only, e.g. from the
        // command line. Gsettings stays untouched.
        void override_value(const TProp& value)
        {
            if (m_value == value)
                return;

            m_value = value;
            changed.emit();
        }

        virtual void read() override
        {
            // pending writes first, or we might read stale data
            m_config_object->sync();

            TSetting stored{};
            m_config_object->read_value(m_key_name, stored);
            m_value = unpack(stored);
            log_access("read", to_log_string());
        }

        virtual void write() override
        {
            log_access("write", to_log_string());
            m_config_object->set_modified(true);
            m_config_object->write_value(m_key_name, pack(m_value));
        }

        virtual void on_change_event() override
        {
            TProp old_value = m_value;
            read();
            if (m_value != old_value)
                changed.emit();
        }

    public:
        DEFINE_SIGNAL(<>, changed, this);

    private:
        TProp unpack(const TSetting& stored) const
        {
            if constexpr(std::is_same<TProp, TSetting>::value)
            {
                return stored;
            }
            else
            {
                if (!m_packer.m_unpack_func)
                    throw ConfigException("no unpack function for key " + m_key_name);
                return m_packer.m_unpack_func(stored);
            }
        }

        TSetting pack(const TProp& value) const
        {
            if constexpr(std::is_same<TProp, TSetting>::value)
            {
                return value;
            }
            else
            {
                if (!m_packer.m_pack_func)
                    throw ConfigException("no pack function for key " + m_key_name);
                return m_packer.m_pack_func(value);
            }
        }

        std::string to_log_string() const
        {
            std::stringstream ss;
            ss << std::boolalpha << m_value;
            return ss.str();
        }

    private:
        const TProp m_default_value;
        const Packer m_packer;
        TProp m_value;
};

#endif // CONFIGOBJECT_H
