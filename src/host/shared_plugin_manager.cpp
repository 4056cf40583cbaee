/// @file shared_plugin_manager.cpp
/// @brief SharedPluginManager implementation.

#include "wph/host/shared_plugin_manager.hpp"

#include <mutex>

using wph::foundation::HostResult;

namespace wph::host {

SharedPluginManager::SharedPluginManager(WphEngineCallbacks callbacks) : manager_(callbacks) {}

// ── Exclusive ───────────────────────────────────────────────────────────

HostResult<std::string> SharedPluginManager::LoadPlugin(const std::filesystem::path& path) {
    std::unique_lock lock(mutex_);
    return manager_.LoadPlugin(path);
}

HostResult<DirectoryLoadReport>
SharedPluginManager::LoadPluginsFromDir(const std::filesystem::path& dir) {
    std::unique_lock lock(mutex_);
    return manager_.LoadPluginsFromDir(dir);
}

HostResult<void> SharedPluginManager::UnloadPlugin(std::string_view name) {
    std::unique_lock lock(mutex_);
    return manager_.UnloadPlugin(name);
}

void SharedPluginManager::UnloadAll() {
    std::unique_lock lock(mutex_);
    manager_.UnloadAll();
}

HostResult<void> SharedPluginManager::ReloadPlugin(std::string_view name) {
    std::unique_lock lock(mutex_);
    return manager_.ReloadPlugin(name);
}

// ── Shared ──────────────────────────────────────────────────────────────

HostResult<nlohmann::json> SharedPluginManager::CallCommand(std::string_view command,
                                                            std::string_view widgetId,
                                                            const nlohmann::json& payload) const {
    std::shared_lock lock(mutex_);
    return manager_.CallCommand(command, widgetId, payload);
}

HostResult<std::string> SharedPluginManager::CallCommandRaw(std::string_view command,
                                                            std::string_view widgetId,
                                                            std::string_view payload) const {
    std::shared_lock lock(mutex_);
    return manager_.CallCommandRaw(command, widgetId, payload);
}

std::size_t SharedPluginManager::PluginCount() const {
    std::shared_lock lock(mutex_);
    return manager_.PluginCount();
}

std::size_t SharedPluginManager::CommandCount() const {
    std::shared_lock lock(mutex_);
    return manager_.CommandCount();
}

std::vector<std::string> SharedPluginManager::PluginNames() const {
    std::shared_lock lock(mutex_);
    return manager_.PluginNames();
}

std::vector<std::string> SharedPluginManager::CommandNames() const {
    std::shared_lock lock(mutex_);
    return manager_.CommandNames();
}

bool SharedPluginManager::HasPlugin(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return manager_.HasPlugin(name);
}

bool SharedPluginManager::HasCommand(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return manager_.HasCommand(name);
}

std::optional<PluginInfo> SharedPluginManager::GetPluginInfo(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return manager_.GetPluginInfo(name);
}

std::vector<PluginInfo> SharedPluginManager::AllPluginInfo() const {
    std::shared_lock lock(mutex_);
    return manager_.AllPluginInfo();
}

std::optional<std::string> SharedPluginManager::FindPluginForCommand(std::string_view command) const {
    std::shared_lock lock(mutex_);
    return manager_.FindPluginForCommand(command);
}

std::optional<std::filesystem::path> SharedPluginManager::GetPluginPath(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return manager_.GetPluginPath(name);
}

HostResult<PluginState> SharedPluginManager::GetPluginState(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return manager_.GetPluginState(name);
}

}  // namespace wph::host
