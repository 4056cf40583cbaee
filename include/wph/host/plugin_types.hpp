#pragma once

/// @file plugin_types.hpp
/// @brief Host-side plugin types: PluginInfo, PluginState, DirectoryLoadReport.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "wph/foundation/host_error.hpp"

namespace wph::host {

/// Identity of a loaded plugin, deep-copied from its WphPluginInfo.
struct PluginInfo {
    std::string name;
    std::string version;
    std::vector<std::string> commands;  ///< Declaration order.
};

/// Per-slot lifecycle.
///
/// State machine:
///   Unloaded ──LoadPlugin()──→ Loading ──registered──→ Active
///       ↑                                                │
///       └──────────── Unloading ←── UnloadPlugin() ──────┘
///
/// A failed load returns straight to Unloaded and leaves no entry behind.
enum class PluginState : uint8_t {
    Unloaded,   ///< Not present in the manager.
    Loading,    ///< Accepted by the collision checks; commands being indexed.
    Active,     ///< Registered; its commands are routable.
    Unloading   ///< Being destroyed; its commands are no longer routable.
};

constexpr std::string_view pluginStateName(PluginState state) {
    switch (state) {
        case PluginState::Unloaded:  return "Unloaded";
        case PluginState::Loading:   return "Loading";
        case PluginState::Active:    return "Active";
        case PluginState::Unloading: return "Unloading";
    }
    return "Unknown";
}

/// One candidate that a directory scan could not load.
struct LoadFailure {
    std::filesystem::path path;
    foundation::HostError error;
};

/// Outcome of PluginManager::LoadPluginsFromDir().
struct DirectoryLoadReport {
    std::vector<std::string> loaded;   ///< Names of the plugins now registered.
    std::vector<LoadFailure> failures; ///< Skipped candidates with their errors.
};

}  // namespace wph::host
