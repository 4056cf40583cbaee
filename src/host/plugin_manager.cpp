/// @file plugin_manager.cpp
/// @brief PluginManager implementation: registration, routing, directory
///        scanning and unloading.

#include "wph/host/plugin_manager.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "wph/foundation/host_logger.hpp"

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;
using wph::foundation::LogCategory;
using wph::foundation::LogContext;
using wph::foundation::LogLevel;

namespace wph::host {

// ── Construction / destruction ──────────────────────────────────────────

PluginManager::PluginManager(WphEngineCallbacks callbacks) : callbacks_(callbacks) {}

PluginManager::~PluginManager() {
    UnloadAll();
}

PluginManager::PluginManager(PluginManager&& other) noexcept
    : plugins_(std::move(other.plugins_)),
      commands_(std::move(other.commands_)),
      callbacks_(other.callbacks_) {
    other.plugins_.clear();
    other.commands_.clear();
}

PluginManager& PluginManager::operator=(PluginManager&& other) noexcept {
    if (this != &other) {
        UnloadAll();
        plugins_ = std::move(other.plugins_);
        commands_ = std::move(other.commands_);
        callbacks_ = other.callbacks_;
        other.plugins_.clear();
        other.commands_.clear();
    }
    return *this;
}

// ── Loading ─────────────────────────────────────────────────────────────

HostResult<std::string> PluginManager::LoadPlugin(const std::filesystem::path& path) {
    auto loaded = PluginLoader::Load(path, callbacks_);
    if (loaded.hasError()) {
        WPH_LOG_WARN(LogCategory::Manager,
                     "Failed to load plugin " + path.string() + ": " +
                         std::string(loaded.error().message()));
        return HostResult<std::string>::err(loaded.error());
    }
    return registerPlugin(std::move(loaded).value());
}

HostResult<std::string> PluginManager::registerPlugin(std::unique_ptr<LoadedPlugin> plugin) {
    const auto& info = plugin->Info();

    // Check every collision before touching either map. On error the
    // LoadedPlugin goes out of scope, which destroys it and closes the library.
    if (plugins_.count(info.name) > 0) {
        WPH_LOG_WARN(LogCategory::Manager,
                     "Rejected plugin '" + info.name + "' from " + plugin->Path().string() +
                         ": name already registered");
        return HostResult<std::string>::err(HostError(
            ErrorCode::PluginConflict, "Plugin '" + info.name + "' is already loaded"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& command : info.commands) {
        auto owner = commands_.find(command);
        if (owner != commands_.end()) {
            WPH_LOG_WARN(LogCategory::Manager,
                         "Rejected plugin '" + info.name + "': command '" + command +
                             "' is provided by '" + owner->second + "'");
            return HostResult<std::string>::err(HostError(
                ErrorCode::PluginConflict,
                "Command '" + command + "' of plugin '" + info.name +
                    "' is already provided by plugin '" + owner->second + "'"));
        }
        if (!seen.insert(command).second) {
            return HostResult<std::string>::err(HostError(
                ErrorCode::PluginConflict,
                "Plugin '" + info.name + "' declares command '" + command + "' twice"));
        }
    }

    std::string name = info.name;
    PluginEntry entry;
    entry.plugin = std::move(plugin);
    entry.loadedAt = std::chrono::steady_clock::now();
    transition(name, entry, PluginState::Loading);

    auto& slot = plugins_.emplace(name, std::move(entry)).first->second;
    for (const auto& command : slot.plugin->Info().commands) {
        commands_.emplace(command, name);
    }
    transition(name, slot, PluginState::Active);

    LogContext ctx;
    ctx.pluginName = name;
    ctx.extra["version"] = slot.plugin->Info().version;
    ctx.extra["commands"] = std::to_string(slot.plugin->Info().commands.size());
    foundation::HostLogger::instance().logWithContext(LogLevel::Info, LogCategory::Manager,
                                                      "Plugin loaded", ctx);

    return HostResult<std::string>::ok(std::move(name));
}

void PluginManager::transition(const std::string& name, PluginEntry& entry, PluginState next) {
    WPH_LOG_DEBUG(LogCategory::Manager,
                  "Plugin '" + name + "': " + std::string(pluginStateName(entry.state)) + " -> " +
                      std::string(pluginStateName(next)));
    entry.state = next;
}

HostResult<DirectoryLoadReport> PluginManager::LoadPluginsFromDir(const std::filesystem::path& dir) {
    using ReportResult = HostResult<DirectoryLoadReport>;
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return ReportResult::err(HostError(ErrorCode::PluginLoadFailed,
                                           "Plugin directory not found: " + dir.string()));
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return ReportResult::err(HostError(
            ErrorCode::PluginLoadFailed,
            "Failed to read plugin directory " + dir.string() + ": " + ec.message()));
    }

    DirectoryLoadReport report;
    std::vector<fs::path> candidates;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& candidate = it->path();
        if (PluginLoader::IsValidPluginPath(candidate)) {
            candidates.push_back(candidate);
        }
    }
    if (ec) {
        report.failures.push_back(LoadFailure{
            dir, HostError(ErrorCode::PluginLoadFailed,
                           "Failed to read directory entry: " + ec.message())});
    }

    std::sort(candidates.begin(), candidates.end());
    for (const auto& candidate : candidates) {
        auto loaded = LoadPlugin(candidate);
        if (loaded.hasError()) {
            report.failures.push_back(LoadFailure{candidate, loaded.error()});
            continue;
        }
        report.loaded.push_back(std::move(loaded).value());
    }

    if (!report.failures.empty()) {
        std::string summary = std::to_string(report.failures.size()) +
                              " plugin(s) in " + dir.string() + " failed to load:";
        for (const auto& failure : report.failures) {
            summary += "\n  " + failure.path.string() + ": " + std::string(failure.error.message());
        }
        WPH_LOG_WARN(LogCategory::Manager, summary);
    }

    WPH_LOG_INFO(LogCategory::Manager,
                 "Loaded " + std::to_string(report.loaded.size()) + " plugin(s) from " +
                     dir.string());
    return ReportResult::ok(std::move(report));
}

// ── Unloading ───────────────────────────────────────────────────────────

HostResult<void> PluginManager::UnloadPlugin(std::string_view name) {
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end()) {
        return HostResult<void>::err(
            HostError(ErrorCode::PluginNotFound, "Plugin not found: " + std::string(name)));
    }

    transition(it->first, it->second, PluginState::Unloading);
    for (const auto& command : it->second.plugin->Info().commands) {
        commands_.erase(command);
    }

    // Detach the entry first so the maps are consistent while destroy runs.
    auto plugin = std::move(it->second.plugin);
    plugins_.erase(it);
    plugin.reset();
    WPH_LOG_DEBUG(LogCategory::Manager,
                  "Plugin '" + std::string(name) + "': Unloading -> Unloaded");

    WPH_LOG_INFO(LogCategory::Manager, "Unloaded plugin '" + std::string(name) + "'");
    return HostResult<void>::ok();
}

void PluginManager::UnloadAll() {
    auto names = PluginNames();
    for (const auto& name : names) {
        auto result = UnloadPlugin(name);
        if (result.hasError()) {
            WPH_LOG_ERROR(LogCategory::Manager, std::string(result.error().message()));
        }
    }
}

HostResult<void> PluginManager::ReloadPlugin(std::string_view name) {
    if (!HasPlugin(name)) {
        return HostResult<void>::err(
            HostError(ErrorCode::PluginNotFound, "Plugin not found: " + std::string(name)));
    }
    return HostResult<void>::err(HostError(
        ErrorCode::NotImplemented,
        "Reloading plugin '" + std::string(name) + "' is not supported; unload and load it instead"));
}

// ── Dispatch ────────────────────────────────────────────────────────────

HostResult<const LoadedPlugin*> PluginManager::route(std::string_view command) const {
    auto it = commands_.find(std::string(command));
    if (it == commands_.end()) {
        return HostResult<const LoadedPlugin*>::err(
            HostError(ErrorCode::UnknownCommand, "Unknown command: " + std::string(command)));
    }
    auto owner = plugins_.find(it->second);
    if (owner == plugins_.end() || owner->second.state != PluginState::Active) {
        return HostResult<const LoadedPlugin*>::err(HostError(
            ErrorCode::DispatchFailed,
            "Plugin '" + it->second + "' serving '" + std::string(command) + "' is not active"));
    }
    return HostResult<const LoadedPlugin*>::ok(owner->second.plugin.get());
}

HostResult<std::string> PluginManager::CallCommandRaw(std::string_view command,
                                                      std::string_view widgetId,
                                                      std::string_view payload) const {
    auto target = route(command);
    if (target.hasError()) {
        return HostResult<std::string>::err(target.error());
    }
    return target.value()->CallCommand(command, widgetId, payload);
}

HostResult<nlohmann::json> PluginManager::CallCommand(std::string_view command,
                                                      std::string_view widgetId,
                                                      const nlohmann::json& payload) const {
    using JsonResult = HostResult<nlohmann::json>;

    std::string payloadText;
    try {
        payloadText = payload.dump();
    } catch (const nlohmann::json::exception& e) {
        return JsonResult::err(HostError(
            ErrorCode::InvalidPayload,
            "Cannot serialize payload for '" + std::string(command) + "': " + e.what()));
    }

    auto raw = CallCommandRaw(command, widgetId, payloadText);
    if (raw.hasError()) {
        return JsonResult::err(raw.error());
    }

    auto parsed = nlohmann::json::parse(raw.value(), nullptr, false);
    if (parsed.is_discarded()) {
        return JsonResult::err(HostError(
            ErrorCode::InvalidResult,
            "Command '" + std::string(command) + "' returned malformed JSON"));
    }
    return JsonResult::ok(std::move(parsed));
}

// ── Queries ─────────────────────────────────────────────────────────────

std::vector<std::string> PluginManager::PluginNames() const {
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& [name, entry] : plugins_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginManager::CommandNames() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& [name, owner] : commands_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginManager::HasPlugin(std::string_view name) const {
    return plugins_.count(std::string(name)) > 0;
}

bool PluginManager::HasCommand(std::string_view name) const {
    return commands_.count(std::string(name)) > 0;
}

std::optional<PluginInfo> PluginManager::GetPluginInfo(std::string_view name) const {
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end()) {
        return std::nullopt;
    }
    return it->second.plugin->Info();
}

std::vector<PluginInfo> PluginManager::AllPluginInfo() const {
    std::vector<PluginInfo> infos;
    infos.reserve(plugins_.size());
    for (const auto& name : PluginNames()) {
        infos.push_back(plugins_.at(name).plugin->Info());
    }
    return infos;
}

std::optional<std::string> PluginManager::FindPluginForCommand(std::string_view command) const {
    auto it = commands_.find(std::string(command));
    if (it == commands_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::filesystem::path> PluginManager::GetPluginPath(std::string_view name) const {
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end()) {
        return std::nullopt;
    }
    return it->second.plugin->Path();
}

HostResult<PluginState> PluginManager::GetPluginState(std::string_view name) const {
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end()) {
        return HostResult<PluginState>::err(
            HostError(ErrorCode::PluginNotFound, "Plugin not found: " + std::string(name)));
    }
    return HostResult<PluginState>::ok(it->second.state);
}

}  // namespace wph::host
