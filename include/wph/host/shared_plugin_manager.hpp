#pragma once

/// @file shared_plugin_manager.hpp
/// @brief SharedPluginManager: reader/writer-locked facade over PluginManager.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "wph/foundation/host_result.hpp"
#include "wph/host/plugin_manager.hpp"

namespace wph::host {

/// Thread-safe wrapper owning one PluginManager.
///
/// Calls and queries take a shared lock; loading and unloading take an
/// exclusive lock. An unload therefore waits for every in-flight call to
/// return before any library is closed.
class SharedPluginManager {
public:
    explicit SharedPluginManager(WphEngineCallbacks callbacks);

    SharedPluginManager(const SharedPluginManager&) = delete;
    SharedPluginManager& operator=(const SharedPluginManager&) = delete;

    // ── Exclusive ──────────────────────────────────────────────────────

    [[nodiscard]] foundation::HostResult<std::string> LoadPlugin(const std::filesystem::path& path);
    [[nodiscard]] foundation::HostResult<DirectoryLoadReport>
    LoadPluginsFromDir(const std::filesystem::path& dir);
    [[nodiscard]] foundation::HostResult<void> UnloadPlugin(std::string_view name);
    void UnloadAll();
    [[nodiscard]] foundation::HostResult<void> ReloadPlugin(std::string_view name);

    // ── Shared ─────────────────────────────────────────────────────────

    [[nodiscard]] foundation::HostResult<nlohmann::json>
    CallCommand(std::string_view command, std::string_view widgetId,
                const nlohmann::json& payload) const;
    [[nodiscard]] foundation::HostResult<std::string>
    CallCommandRaw(std::string_view command, std::string_view widgetId,
                   std::string_view payload) const;

    [[nodiscard]] std::size_t PluginCount() const;
    [[nodiscard]] std::size_t CommandCount() const;
    [[nodiscard]] std::vector<std::string> PluginNames() const;
    [[nodiscard]] std::vector<std::string> CommandNames() const;
    [[nodiscard]] bool HasPlugin(std::string_view name) const;
    [[nodiscard]] bool HasCommand(std::string_view name) const;
    [[nodiscard]] std::optional<PluginInfo> GetPluginInfo(std::string_view name) const;
    [[nodiscard]] std::vector<PluginInfo> AllPluginInfo() const;
    [[nodiscard]] std::optional<std::string> FindPluginForCommand(std::string_view command) const;
    [[nodiscard]] std::optional<std::filesystem::path> GetPluginPath(std::string_view name) const;
    [[nodiscard]] foundation::HostResult<PluginState> GetPluginState(std::string_view name) const;

private:
    mutable std::shared_mutex mutex_;
    PluginManager manager_;
};

}  // namespace wph::host
