/// @file command_registry.cpp
/// @brief CommandRegistry implementation.

#include "wph/plugin/command_registry.hpp"

#include <algorithm>
#include <unordered_set>

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;

namespace wph::plugin {

// ── Registration ────────────────────────────────────────────────────────

HostResult<void> CommandRegistry::RegisterPlugin(std::unique_ptr<IPlugin> plugin) {
    if (!plugin) {
        return HostResult<void>::err(
            HostError(ErrorCode::InvalidArgument, "Cannot register a null plugin"));
    }

    std::string pluginName(plugin->Name());
    if (pluginName.empty()) {
        return HostResult<void>::err(
            HostError(ErrorCode::InvalidArgument, "Plugin name must not be empty"));
    }
    if (plugins_.count(pluginName) > 0) {
        return HostResult<void>::err(HostError(
            ErrorCode::PluginConflict, "Plugin '" + pluginName + "' is already registered"));
    }

    // Validate every command before touching the maps.
    auto commands = plugin->Commands();
    std::unordered_set<std::string> seen;
    std::vector<std::string> names;
    names.reserve(commands.size());
    for (const auto& command : commands) {
        if (!command) {
            return HostResult<void>::err(HostError(
                ErrorCode::InvalidArgument, "Plugin '" + pluginName + "' returned a null command"));
        }
        std::string name(command->Name());
        if (commands_.count(name) > 0 || !seen.insert(name).second) {
            return HostResult<void>::err(HostError(
                ErrorCode::PluginConflict,
                "Command '" + name + "' of plugin '" + pluginName + "' is already registered"));
        }
        names.push_back(std::move(name));
    }

    for (std::size_t i = 0; i < commands.size(); ++i) {
        commands_.emplace(names[i], std::move(commands[i]));
    }
    plugins_.emplace(pluginName, PluginEntry{std::move(plugin), std::move(names)});
    return HostResult<void>::ok();
}

void CommandRegistry::Clear() {
    commands_.clear();
    plugins_.clear();
}

// ── Dispatch ────────────────────────────────────────────────────────────

HostResult<std::string> CommandRegistry::CallCommand(std::string_view command,
                                                     std::string_view widgetId,
                                                     const EngineInterface& engine,
                                                     std::string_view payload) const {
    auto it = commands_.find(std::string(command));
    if (it == commands_.end()) {
        return HostResult<std::string>::err(
            HostError(ErrorCode::UnknownCommand, "Unknown command: " + std::string(command)));
    }
    return it->second->Run(widgetId, engine, payload);
}

// ── Queries ─────────────────────────────────────────────────────────────

const IPlugin* CommandRegistry::GetPlugin(std::string_view name) const {
    auto it = plugins_.find(std::string(name));
    return it != plugins_.end() ? it->second.plugin.get() : nullptr;
}

std::vector<std::string> CommandRegistry::PluginCommands(std::string_view name) const {
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end()) {
        return {};
    }
    return it->second.commandNames;
}

std::vector<std::string> CommandRegistry::PluginNames() const {
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& [name, entry] : plugins_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> CommandRegistry::CommandNames() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& [name, command] : commands_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool CommandRegistry::HasPlugin(std::string_view name) const {
    return plugins_.count(std::string(name)) > 0;
}

bool CommandRegistry::HasCommand(std::string_view name) const {
    return commands_.count(std::string(name)) > 0;
}

}  // namespace wph::plugin
