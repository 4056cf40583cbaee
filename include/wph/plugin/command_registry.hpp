#pragma once

/// @file command_registry.hpp
/// @brief CommandRegistry: plugin-side owner of plugins and their commands.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wph/foundation/host_result.hpp"
#include "wph/plugin/iplugin.hpp"

namespace wph::plugin {

/// Owns registered plugins and routes command names to their ICommand.
///
/// Registration is all-or-nothing: a duplicate plugin name or a command
/// name already taken (by another plugin, or twice within the same plugin)
/// is rejected with PluginConflict and leaves the registry unchanged.
///
/// Not internally synchronized. Concurrent CallCommand() calls are safe as
/// long as no registration or Clear() runs at the same time.
class CommandRegistry {
public:
    CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;
    CommandRegistry(CommandRegistry&&) noexcept = default;
    CommandRegistry& operator=(CommandRegistry&&) noexcept = default;

    // ── Registration ──────────────────────────────────────────────────

    /// Register a plugin and every command it exposes.
    [[nodiscard]] foundation::HostResult<void> RegisterPlugin(std::unique_ptr<IPlugin> plugin);

    /// Drop every plugin and command.
    void Clear();

    // ── Dispatch ──────────────────────────────────────────────────────

    /// Run a command by name.
    /// @return The command's JSON text, UnknownCommand, or the command's error.
    [[nodiscard]] foundation::HostResult<std::string>
    CallCommand(std::string_view command, std::string_view widgetId,
                const EngineInterface& engine, std::string_view payload) const;

    // ── Queries ───────────────────────────────────────────────────────

    /// Retrieve a registered plugin by name (nullptr if not found).
    [[nodiscard]] const IPlugin* GetPlugin(std::string_view name) const;

    /// Commands of one plugin in declaration order (empty if not found).
    [[nodiscard]] std::vector<std::string> PluginCommands(std::string_view name) const;

    /// Plugin names, sorted.
    [[nodiscard]] std::vector<std::string> PluginNames() const;

    /// Command names across all plugins, sorted.
    [[nodiscard]] std::vector<std::string> CommandNames() const;

    [[nodiscard]] std::size_t PluginCount() const noexcept { return plugins_.size(); }
    [[nodiscard]] std::size_t CommandCount() const noexcept { return commands_.size(); }
    [[nodiscard]] bool HasPlugin(std::string_view name) const;
    [[nodiscard]] bool HasCommand(std::string_view name) const;

private:
    struct PluginEntry {
        std::unique_ptr<IPlugin> plugin;
        std::vector<std::string> commandNames;  ///< Declaration order.
    };

    std::unordered_map<std::string, PluginEntry> plugins_;
    std::unordered_map<std::string, std::unique_ptr<ICommand>> commands_;
};

}  // namespace wph::plugin
