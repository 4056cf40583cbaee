#pragma once

/// @file host_logger.hpp
/// @brief HostLogger wrapping kcenon common_system logging for the plugin host.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "wph/foundation/host_result.hpp"

namespace wph::foundation {

/// Log severity levels for the host.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Host log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Host startup and shutdown
    Loader  = 1, ///< Dynamic library loading and symbol resolution
    Manager = 2, ///< Plugin registration, routing and unloading
    Engine  = 3, ///< Engine callbacks serviced for plugins
    Plugin  = 4, ///< Messages forwarded from plugin code
    Config  = 5  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Loader", "Manager", "Engine", "Plugin", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name (case-insensitive, "warn" accepted for Warning).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name (case-insensitive).
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.pluginName = "fs";
///   ctx.widgetId = "clock";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Manager,
///                         "Dispatching command", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> pluginName;
    std::optional<std::string> commandName;
    std::optional<std::string> widgetId;
    std::unordered_map<std::string, std::string> extra;
};

/// Host logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Messages are
/// formatted as `[Category] message {key=val, ...}` and routed to the logger
/// registered under `wph.<Category>`, falling back to the default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Loader   | Debug         |
/// | Manager  | Info          |
/// | Engine   | Info          |
/// | Plugin   | Info          |
/// | Config   | Info          |
class HostLogger {
public:
    HostLogger();
    ~HostLogger();

    HostLogger(const HostLogger&) = delete;
    HostLogger& operator=(const HostLogger&) = delete;
    HostLogger(HostLogger&&) noexcept;
    HostLogger& operator=(HostLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    HostResult<void> flush();

    /// Process-wide logger instance used by the WPH_LOG macros.
    static HostLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wph::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name WPH_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// WPH_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef WPH_MIN_LOG_LEVEL
    #define WPH_MIN_LOG_LEVEL 0
#endif

#define WPH_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= WPH_MIN_LOG_LEVEL &&                       \
            ::wph::foundation::HostLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::wph::foundation::HostLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define WPH_LOG_DEBUG(cat, msg) \
    WPH_LOG(::wph::foundation::LogLevel::Debug, (cat), (msg))

#define WPH_LOG_INFO(cat, msg) \
    WPH_LOG(::wph::foundation::LogLevel::Info, (cat), (msg))

#define WPH_LOG_WARN(cat, msg) \
    WPH_LOG(::wph::foundation::LogLevel::Warning, (cat), (msg))

#define WPH_LOG_ERROR(cat, msg) \
    WPH_LOG(::wph::foundation::LogLevel::Error, (cat), (msg))

/// @}
