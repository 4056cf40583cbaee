#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the plugin host and SDK.

#include <cstdint>
#include <string_view>

namespace wph::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Plugin (0x0400 - 0x04FF)
    PluginLoadFailed = 0x0400,
    PluginNotFound = 0x0401,
    PluginConflict = 0x0402,
    PluginVersionMismatch = 0x0403,
    PluginInitFailed = 0x0404,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Dispatch (0x0900 - 0x09FF)
    DispatchFailed = 0x0900,
    UnknownCommand = 0x0901,
    InvalidPayload = 0x0902,
    InvalidResult = 0x0903,
    CommandFailed = 0x0904,

    // Engine callbacks (0x0A00 - 0x0AFF)
    CallbackFailed = 0x0A00,
    InvalidWidgetId = 0x0A01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0400: return "Plugin";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Dispatch";
        case 0x0A00: return "Callback";
        default: return "Unknown";
    }
}

/// A library could not be opened, lacks an export, or failed its handshake.
constexpr bool isLoadError(ErrorCode code) {
    return code == ErrorCode::PluginLoadFailed || code == ErrorCode::PluginInitFailed ||
           code == ErrorCode::PluginVersionMismatch;
}

/// A plugin name or command name was already registered.
constexpr bool isConflictError(ErrorCode code) {
    return code == ErrorCode::PluginConflict;
}

constexpr bool isDispatchError(ErrorCode code) {
    return errorSubsystem(code) == "Dispatch";
}

constexpr bool isCallbackError(ErrorCode code) {
    return errorSubsystem(code) == "Callback";
}

} // namespace wph::foundation
