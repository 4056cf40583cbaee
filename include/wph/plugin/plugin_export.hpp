#pragma once

/// @file plugin_export.hpp
/// @brief Macro generating the four C exports of a widget plugin library.

#include <exception>
#include <memory>

#include "wph/plugin/abi.h"
#include "wph/plugin/iplugin.hpp"
#include "wph/plugin/plugin_runtime.hpp"

/// Generate plugin_init, plugin_call_command, plugin_destroy and
/// plugin_free_string for a default-constructible IPlugin.
///
/// Usage (exactly once, in a .cpp file compiled into the shared library):
/// @code
///   class FsPlugin : public wph::plugin::IPlugin { ... };
///   WPH_PLUGIN_EXPORT(FsPlugin)
/// @endcode
///
/// Every export is noexcept. A std::exception escaping plugin code becomes
/// WPH_STATUS_ERROR; any other exception reaches the noexcept boundary and
/// terminates the process instead of unwinding into the host.
#define WPH_PLUGIN_EXPORT(PluginClass)                                                     \
    extern "C" {                                                                           \
    WPH_PLUGIN_API int32_t plugin_init(WphEngineCallbacks callbacks,                       \
                                       WphPluginInfo* out) noexcept {                      \
        try {                                                                              \
            return ::wph::plugin::runtime::InitPlugin(std::make_unique<PluginClass>(),     \
                                                      callbacks, out);                     \
        } catch (const std::exception&) {                                                  \
            return WPH_STATUS_ERROR;                                                       \
        }                                                                                  \
    }                                                                                      \
    WPH_PLUGIN_API int32_t plugin_call_command(const char* command, const char* widget_id, \
                                               const char* payload,                        \
                                               char** result_out) noexcept {               \
        try {                                                                              \
            return ::wph::plugin::runtime::CallCommand(command, widget_id, payload,        \
                                                       result_out);                        \
        } catch (const std::exception&) {                                                  \
            return WPH_STATUS_ERROR;                                                       \
        }                                                                                  \
    }                                                                                      \
    WPH_PLUGIN_API void plugin_destroy(void) noexcept {                                    \
        ::wph::plugin::runtime::DestroyPlugin();                                           \
    }                                                                                      \
    WPH_PLUGIN_API void plugin_free_string(char* str) noexcept {                           \
        ::wph::plugin::runtime::FreeString(str);                                           \
    }                                                                                      \
    }
