#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define WPH_VERSION_MAJOR 0
#define WPH_VERSION_MINOR 1
#define WPH_VERSION_PATCH 0
#define WPH_VERSION_STRING "0.1.0"

namespace wph {

/// Project version information at compile time.
struct Version {
    static constexpr int major = WPH_VERSION_MAJOR;
    static constexpr int minor = WPH_VERSION_MINOR;
    static constexpr int patch = WPH_VERSION_PATCH;
    static constexpr const char* string = WPH_VERSION_STRING;
};

} // namespace wph
