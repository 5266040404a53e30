#ifndef GLIB_HELPERS_H
#define GLIB_HELPERS_H

#include <memory>

#include <gio/gio.h>

// owning pointers for glib allocations
typedef std::unique_ptr<gchar, decltype(&g_free)> GStrPtr;
typedef std::unique_ptr<GSettingsSchema, decltype(&g_settings_schema_unref)> GSettingsSchemaPtr;

#endif // GLIB_HELPERS_H
