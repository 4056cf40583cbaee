#pragma once

/// @file fixture_plugins.hpp
/// @brief Paths of the fixture plugin libraries, injected by the build.

#include <filesystem>

namespace wph::test {

inline const std::filesystem::path kEchoPlugin = WPH_FIXTURE_ECHO;
inline const std::filesystem::path kMathPlugin = WPH_FIXTURE_MATH;
inline const std::filesystem::path kSlowPlugin = WPH_FIXTURE_SLOW;
inline const std::filesystem::path kCommandThiefPlugin = WPH_FIXTURE_COMMAND_THIEF;
inline const std::filesystem::path kNameThiefPlugin = WPH_FIXTURE_NAME_THIEF;
inline const std::filesystem::path kMissingExportPlugin = WPH_FIXTURE_MISSING_EXPORT;
inline const std::filesystem::path kFailingInitPlugin = WPH_FIXTURE_FAILING_INIT;
inline const std::filesystem::path kVersionMismatchPlugin = WPH_FIXTURE_VERSION_MISMATCH;
inline const std::filesystem::path kRawPlugin = WPH_FIXTURE_RAW;
inline const std::filesystem::path kFsPlugin = WPH_FIXTURE_FS;
inline const std::filesystem::path kSysPlugin = WPH_FIXTURE_SYS;

}  // namespace wph::test
