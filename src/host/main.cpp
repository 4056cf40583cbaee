/// @file main.cpp
/// @brief wph_host entry point.
///
/// Loads the host configuration, scans the plugin directory and either
/// lists the loaded plugins or dispatches a single command:
///
///   wph_host [--config <file>] [--call <command> --widget <id> [--payload <json>]]

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <nlohmann/json.hpp>

#include "wph/foundation/config_manager.hpp"
#include "wph/foundation/host_logger.hpp"
#include "wph/host/console_logger.hpp"
#include "wph/host/engine_bridge.hpp"
#include "wph/host/host_config.hpp"
#include "wph/host/shared_plugin_manager.hpp"
#include "wph/version.hpp"

namespace {

using wph::foundation::LogCategory;

/// Load the config file. A missing default file yields the built-in defaults.
wph::foundation::HostResult<void> loadConfig(wph::foundation::ConfigManager& config,
                                             const std::filesystem::path& path,
                                             bool explicitPath) {
    std::error_code ec;
    if (!explicitPath && !std::filesystem::exists(path, ec)) {
        WPH_LOG_INFO(LogCategory::Config,
                     "No config at " + path.string() + ", using defaults");
        return wph::foundation::HostResult<void>::ok();
    }
    WPH_LOG_INFO(LogCategory::Config, "Loading config from " + path.string());
    return config.load(path);
}

void printPlugins(const wph::host::SharedPluginManager& manager) {
    for (const auto& info : manager.AllPluginInfo()) {
        std::cout << info.name << ' ' << info.version << '\n';
        for (const auto& command : info.commands) {
            std::cout << "  " << command << '\n';
        }
    }
}

int runCommand(const wph::host::SharedPluginManager& manager, int argc, char* argv[],
               std::string_view command) {
    auto widget = wph::host::ParseArgValue(argc, argv, "--widget");
    if (!widget) {
        std::cerr << "--call requires --widget <id>\n";
        return EXIT_FAILURE;
    }

    nlohmann::json payload = nullptr;
    if (auto payloadText = wph::host::ParseArgValue(argc, argv, "--payload")) {
        payload = nlohmann::json::parse(payloadText->begin(), payloadText->end(), nullptr, false);
        if (payload.is_discarded()) {
            std::cerr << "--payload is not valid JSON\n";
            return EXIT_FAILURE;
        }
    }

    auto result = manager.CallCommand(command, *widget, payload);
    if (!result) {
        std::cerr << "Command failed [" << result.error().subsystem() << "]: "
                  << result.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << result.value().dump(2) << "\n";
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<wph::host::ConsoleLogger>(std::cerr));

    bool explicitPath = wph::host::HasExplicitConfigPath(argc, argv);
    auto configPath = wph::host::ResolveConfigPath(argc, argv);

    wph::foundation::ConfigManager config;
    auto loadResult = loadConfig(config, configPath, explicitPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto hostConfig = wph::host::LoadHostConfig(config);
    if (!hostConfig) {
        std::cerr << "Invalid config: " << hostConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& logger = wph::foundation::HostLogger::instance();
    wph::host::ApplyLogLevels(hostConfig.value(), logger);

    WPH_LOG_INFO(LogCategory::Core, std::string("wph_host ") + WPH_VERSION_STRING + " starting");

    wph::host::EngineBridge::Install(
        wph::host::EngineBridge::RootedResolver(hostConfig.value().widgetsRoot));
    wph::host::SharedPluginManager manager(wph::host::EngineBridge::Callbacks());

    auto report = manager.LoadPluginsFromDir(hostConfig.value().pluginDirectory);
    if (!report) {
        std::cerr << "Failed to load plugins: " << report.error().message() << "\n";
        wph::host::EngineBridge::Uninstall();
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    if (auto command = wph::host::ParseArgValue(argc, argv, "--call")) {
        exitCode = runCommand(manager, argc, argv, *command);
    } else {
        printPlugins(manager);
    }

    manager.UnloadAll();
    wph::host::EngineBridge::Uninstall();
    WPH_LOG_DEBUG(LogCategory::Core, "wph_host stopped");

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return exitCode;
}
