#pragma once

/// @file host_config.hpp
/// @brief HostConfig and the helpers that build it from YAML and argv.

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "wph/foundation/config_manager.hpp"
#include "wph/foundation/host_logger.hpp"
#include "wph/foundation/host_result.hpp"

namespace wph::host {

/// Environment variable consulted when no `--config` argument is given.
inline constexpr const char* kConfigPathEnv = "WPH_CONFIG_PATH";

/// Config file used when neither `--config` nor the environment names one.
inline constexpr const char* kDefaultConfigPath = "wph.yaml";

/// Runtime configuration of the host.
///
/// YAML keys:
/// @code
///   plugins:
///     directory: plugins        # scanned by LoadPluginsFromDir
///   widgets:
///     root: widgets             # <root>/<widget id> is a widget's directory
///   logging:
///     loader: debug             # per-category minimum level
///     plugin: warning
/// @endcode
struct HostConfig {
    std::filesystem::path pluginDirectory = "plugins";
    std::filesystem::path widgetsRoot = "widgets";
    std::vector<std::pair<foundation::LogCategory, foundation::LogLevel>> logLevels;
};

/// Build a HostConfig from loaded configuration. Missing keys keep their
/// defaults; unknown category or level names are ConfigTypeMismatch.
[[nodiscard]] foundation::HostResult<HostConfig>
LoadHostConfig(const foundation::ConfigManager& config);

/// Apply the configured per-category levels to @p logger.
void ApplyLogLevels(const HostConfig& config, foundation::HostLogger& logger);

/// Value following @p flag in argv (e.g. `--config <path>`), if present.
[[nodiscard]] std::optional<std::string_view>
ParseArgValue(int argc, char* argv[], std::string_view flag);

/// Config path: `--config`, then WPH_CONFIG_PATH, then kDefaultConfigPath.
[[nodiscard]] std::filesystem::path ResolveConfigPath(int argc, char* argv[]);

/// True if ResolveConfigPath() takes its answer from `--config` or a
/// non-empty WPH_CONFIG_PATH rather than the default.
[[nodiscard]] bool HasExplicitConfigPath(int argc, char* argv[]);

}  // namespace wph::host
