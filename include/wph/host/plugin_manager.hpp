#pragma once

/// @file plugin_manager.hpp
/// @brief PluginManager: aggregates loaded plugins and routes command calls.

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "wph/foundation/host_result.hpp"
#include "wph/host/plugin_loader.hpp"
#include "wph/host/plugin_types.hpp"
#include "wph/plugin/abi.h"

namespace wph::host {

/// Owns every loaded plugin and the command → plugin index.
///
/// Invariants:
///   - every plugin name is unique;
///   - every command name belongs to exactly one plugin;
///   - the command index always matches the registered plugins.
///
/// A plugin whose name or any command name collides is rejected as a whole
/// and destroyed; nothing is registered. Not internally synchronized; see
/// SharedPluginManager for the locked facade.
class PluginManager {
public:
    /// @param callbacks  Engine callbacks handed to every plugin at init.
    explicit PluginManager(WphEngineCallbacks callbacks);
    ~PluginManager();

    // Non-copyable, movable.
    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;
    PluginManager(PluginManager&&) noexcept;
    PluginManager& operator=(PluginManager&&) noexcept;

    // ── Loading ────────────────────────────────────────────────────────

    /// Load a plugin library and register it and its commands.
    ///
    /// @return The plugin name, a load error from PluginLoader, or
    ///         PluginConflict when the name or a command is already taken.
    [[nodiscard]] foundation::HostResult<std::string>
    LoadPlugin(const std::filesystem::path& path);

    /// Load every plugin library found directly in @p dir.
    ///
    /// Candidates (regular files with the platform extension) are visited
    /// in sorted order. A missing or unreadable directory aborts with
    /// PluginLoadFailed; per-candidate failures are recorded in the report,
    /// logged as one warning and skipped.
    [[nodiscard]] foundation::HostResult<DirectoryLoadReport>
    LoadPluginsFromDir(const std::filesystem::path& dir);

    // ── Unloading ──────────────────────────────────────────────────────

    /// Remove a plugin and its commands, then destroy it and close its
    /// library.
    [[nodiscard]] foundation::HostResult<void> UnloadPlugin(std::string_view name);

    /// Unload all plugins.
    void UnloadAll();

    /// Replace a loaded plugin with a fresh copy of its library.
    ///
    /// Not supported: returns NotImplemented for a loaded plugin (which
    /// stays loaded and callable) and PluginNotFound otherwise.
    [[nodiscard]] foundation::HostResult<void> ReloadPlugin(std::string_view name);

    // ── Dispatch ───────────────────────────────────────────────────────

    /// Call a command with a JSON payload and parse its JSON result.
    [[nodiscard]] foundation::HostResult<nlohmann::json>
    CallCommand(std::string_view command, std::string_view widgetId,
                const nlohmann::json& payload) const;

    /// Call a command with raw JSON text and return the plugin's raw text.
    [[nodiscard]] foundation::HostResult<std::string>
    CallCommandRaw(std::string_view command, std::string_view widgetId,
                   std::string_view payload) const;

    // ── Queries ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t PluginCount() const noexcept { return plugins_.size(); }
    [[nodiscard]] std::size_t CommandCount() const noexcept { return commands_.size(); }

    /// Names of all loaded plugins, sorted.
    [[nodiscard]] std::vector<std::string> PluginNames() const;

    /// Names of all routable commands, sorted.
    [[nodiscard]] std::vector<std::string> CommandNames() const;

    [[nodiscard]] bool HasPlugin(std::string_view name) const;
    [[nodiscard]] bool HasCommand(std::string_view name) const;

    [[nodiscard]] std::optional<PluginInfo> GetPluginInfo(std::string_view name) const;

    /// Identity of every loaded plugin, sorted by name.
    [[nodiscard]] std::vector<PluginInfo> AllPluginInfo() const;

    /// Name of the plugin that owns @p command.
    [[nodiscard]] std::optional<std::string> FindPluginForCommand(std::string_view command) const;

    /// Path the plugin was loaded from.
    [[nodiscard]] std::optional<std::filesystem::path> GetPluginPath(std::string_view name) const;

    /// Lifecycle state of a plugin; PluginNotFound if it is not loaded.
    [[nodiscard]] foundation::HostResult<PluginState> GetPluginState(std::string_view name) const;

    [[nodiscard]] const WphEngineCallbacks& Callbacks() const noexcept { return callbacks_; }

private:
    /// Internal bookkeeping for a loaded plugin.
    struct PluginEntry {
        std::unique_ptr<LoadedPlugin> plugin;
        PluginState state = PluginState::Unloaded;
        std::chrono::steady_clock::time_point loadedAt;
    };

    /// Run collision checks and insert into both maps.
    [[nodiscard]] foundation::HostResult<std::string>
    registerPlugin(std::unique_ptr<LoadedPlugin> plugin);

    /// Move @p entry to @p next and log the transition at debug level.
    static void transition(const std::string& name, PluginEntry& entry, PluginState next);

    /// Find the plugin that serves @p command.
    [[nodiscard]] foundation::HostResult<const LoadedPlugin*>
    route(std::string_view command) const;

    /// All loaded plugins keyed by name.
    std::unordered_map<std::string, PluginEntry> plugins_;

    /// Command name → owning plugin name.
    std::unordered_map<std::string, std::string> commands_;

    WphEngineCallbacks callbacks_;
};

}  // namespace wph::host
