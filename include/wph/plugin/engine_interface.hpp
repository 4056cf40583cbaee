#pragma once

/// @file engine_interface.hpp
/// @brief EngineInterface: plugin-side wrapper over the host's callbacks.

#include <cstdint>
#include <filesystem>
#include <string_view>

#include "wph/foundation/host_result.hpp"
#include "wph/plugin/abi.h"

namespace wph::plugin {

/// Severity levels understood by the host's log callback.
enum class EngineLogLevel : int32_t {
    Error = WPH_LOG_LEVEL_ERROR,
    Warn  = WPH_LOG_LEVEL_WARN,
    Info  = WPH_LOG_LEVEL_INFO,
    Debug = WPH_LOG_LEVEL_DEBUG,
    Trace = WPH_LOG_LEVEL_TRACE
};

/// Map a raw ABI level to EngineLogLevel. Out-of-range values map to Info.
[[nodiscard]] constexpr EngineLogLevel EngineLogLevelFromInt(int32_t raw) noexcept {
    switch (raw) {
        case WPH_LOG_LEVEL_ERROR: return EngineLogLevel::Error;
        case WPH_LOG_LEVEL_WARN:  return EngineLogLevel::Warn;
        case WPH_LOG_LEVEL_INFO:  return EngineLogLevel::Info;
        case WPH_LOG_LEVEL_DEBUG: return EngineLogLevel::Debug;
        case WPH_LOG_LEVEL_TRACE: return EngineLogLevel::Trace;
        default:                  return EngineLogLevel::Info;
    }
}

/// Safe access to the services the host hands to a plugin at init time.
///
/// Copyable; holds only the function pointers. Every string passed to the
/// host is validated first, and every string the host returns is released
/// exactly once with std::free.
class EngineInterface {
public:
    EngineInterface() = default;
    explicit EngineInterface(WphEngineCallbacks callbacks) noexcept
        : callbacks_(callbacks) {}

    /// Resolve the sandbox directory of a widget.
    ///
    /// @return The directory, or CallbackFailed / InvalidWidgetId when the id
    ///         cannot be marshaled, the host reports failure, or the returned
    ///         path is not valid UTF-8.
    [[nodiscard]] foundation::HostResult<std::filesystem::path>
    WidgetDir(std::string_view widgetId) const;

    /// Forward a message to the host log. Messages that cannot be
    /// represented as a C string are dropped.
    void Log(EngineLogLevel level, std::string_view message) const;

    void LogError(std::string_view message) const { Log(EngineLogLevel::Error, message); }
    void LogWarn(std::string_view message) const { Log(EngineLogLevel::Warn, message); }
    void LogInfo(std::string_view message) const { Log(EngineLogLevel::Info, message); }
    void LogDebug(std::string_view message) const { Log(EngineLogLevel::Debug, message); }
    void LogTrace(std::string_view message) const { Log(EngineLogLevel::Trace, message); }

    [[nodiscard]] const WphEngineCallbacks& Callbacks() const noexcept { return callbacks_; }

private:
    WphEngineCallbacks callbacks_{nullptr, nullptr};
};

}  // namespace wph::plugin
