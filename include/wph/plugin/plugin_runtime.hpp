#pragma once

/// @file plugin_runtime.hpp
/// @brief PluginRuntime: the per-library state behind the four C exports.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "wph/plugin/abi.h"
#include "wph/plugin/command_registry.hpp"
#include "wph/plugin/engine_interface.hpp"
#include "wph/plugin/iplugin.hpp"

namespace wph::plugin {

/// State shared by the exports of one plugin library.
///
/// Lifecycle: Init(), any number of concurrent Call(), then Destroy().
/// Call() before Init() (or after the last Destroy()) returns
/// WPH_STATUS_NOT_INITIALIZED. Failed commands are reported to the host
/// through the engine log and yield WPH_STATUS_ERROR.
///
/// Init() on a live runtime keeps the first plugin and its callbacks,
/// reports that plugin again and counts one more reference. Destroy()
/// releases one reference and tears down on the last one.
class PluginRuntime {
public:
    PluginRuntime() = default;

    PluginRuntime(const PluginRuntime&) = delete;
    PluginRuntime& operator=(const PluginRuntime&) = delete;

    /// Register @p plugin, keep the callbacks and describe the plugin in @p out.
    [[nodiscard]] int32_t Init(std::unique_ptr<IPlugin> plugin, WphEngineCallbacks callbacks,
                               WphPluginInfo* out);

    /// Dispatch one command; on success @p resultOut receives a string that
    /// must be released with FreeString().
    [[nodiscard]] int32_t Call(const char* command, const char* widgetId, const char* payload,
                               char** resultOut) const;

    /// Release one Init() reference; the last one drops the plugin and its
    /// commands. Safe to call more than once.
    void Destroy();

    [[nodiscard]] bool IsInitialized() const;

    /// Copy @p text into a heap string owned by this library.
    [[nodiscard]] static char* AllocateString(std::string_view text);

    /// Release a string produced by AllocateString(). Null is ignored.
    static void FreeString(char* str) noexcept;

    /// The runtime instance of the current plugin library.
    static PluginRuntime& Instance();

private:
    void describe(WphPluginInfo* out) const;

    mutable std::shared_mutex mutex_;
    bool initialized_ = false;
    std::size_t initCount_ = 0;
    EngineInterface engine_;
    CommandRegistry registry_;

    // Backing storage for the WphPluginInfo handed to the host.
    std::string name_;
    std::string version_;
    std::vector<std::string> commandNames_;
    std::vector<const char*> commandPtrs_;
};

/// Free-function entry points used by WPH_PLUGIN_EXPORT.
namespace runtime {

[[nodiscard]] int32_t InitPlugin(std::unique_ptr<IPlugin> plugin, WphEngineCallbacks callbacks,
                                 WphPluginInfo* out);

[[nodiscard]] int32_t CallCommand(const char* command, const char* widgetId, const char* payload,
                                  char** resultOut);

void DestroyPlugin();

[[nodiscard]] char* AllocateString(std::string_view text);

void FreeString(char* str) noexcept;

}  // namespace runtime

}  // namespace wph::plugin
