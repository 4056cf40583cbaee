/// @file host_config.cpp
/// @brief HostConfig loading and command-line helpers.

#include "wph/host/host_config.hpp"

#include <cstdlib>
#include <string>

using wph::foundation::ConfigManager;
using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostLogger;
using wph::foundation::HostResult;

namespace wph::host {

// -- Config loading ----------------------------------------------------------

HostResult<HostConfig> LoadHostConfig(const ConfigManager& config) {
    HostConfig cfg;

    auto pluginDir = config.getOr<std::string>("plugins.directory", cfg.pluginDirectory.string());
    if (!pluginDir) {
        return HostResult<HostConfig>::err(pluginDir.error());
    }
    cfg.pluginDirectory = pluginDir.value();

    auto widgetsRoot = config.getOr<std::string>("widgets.root", cfg.widgetsRoot.string());
    if (!widgetsRoot) {
        return HostResult<HostConfig>::err(widgetsRoot.error());
    }
    cfg.widgetsRoot = widgetsRoot.value();

    for (const auto& categoryName : config.keysUnder("logging")) {
        auto category = foundation::parseLogCategory(categoryName);
        if (!category) {
            return HostResult<HostConfig>::err(HostError(
                ErrorCode::ConfigTypeMismatch, "Unknown log category: logging." + categoryName));
        }

        auto levelName = config.get<std::string>("logging." + categoryName);
        if (!levelName) {
            return HostResult<HostConfig>::err(levelName.error());
        }
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return HostResult<HostConfig>::err(HostError(
                ErrorCode::ConfigTypeMismatch,
                "Unknown log level '" + levelName.value() + "' for logging." + categoryName));
        }
        cfg.logLevels.emplace_back(*category, *level);
    }

    return HostResult<HostConfig>::ok(std::move(cfg));
}

void ApplyLogLevels(const HostConfig& config, HostLogger& logger) {
    for (const auto& [category, level] : config.logLevels) {
        logger.setCategoryLevel(category, level);
    }
}

// -- CLI argument parsing ----------------------------------------------------

std::optional<std::string_view> ParseArgValue(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string_view(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

namespace {

/// WPH_CONFIG_PATH when it is set to a non-empty value.
std::optional<std::string_view> configPathFromEnv() {
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath == nullptr || *envPath == '\0') {
        return std::nullopt;
    }
    return std::string_view(envPath);
}

}  // namespace

std::filesystem::path ResolveConfigPath(int argc, char* argv[]) {
    if (auto fromArgs = ParseArgValue(argc, argv, "--config")) {
        return std::filesystem::path(std::string(*fromArgs));
    }
    if (auto fromEnv = configPathFromEnv()) {
        return std::filesystem::path(std::string(*fromEnv));
    }
    return kDefaultConfigPath;
}

bool HasExplicitConfigPath(int argc, char* argv[]) {
    return ParseArgValue(argc, argv, "--config").has_value() || configPathFromEnv().has_value();
}

}  // namespace wph::host
