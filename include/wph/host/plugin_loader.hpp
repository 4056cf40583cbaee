#pragma once

/// @file plugin_loader.hpp
/// @brief PluginLoader and LoadedPlugin: opening one plugin library and
///        calling into it safely.

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "wph/foundation/host_result.hpp"
#include "wph/host/plugin_types.hpp"
#include "wph/host/shared_library.hpp"
#include "wph/plugin/abi.h"

namespace wph::host {

/// Platform file extension of plugin libraries, including the dot.
#if defined(_WIN32)
inline constexpr std::string_view kPluginExtension = ".dll";
#elif defined(__APPLE__)
inline constexpr std::string_view kPluginExtension = ".dylib";
#else
inline constexpr std::string_view kPluginExtension = ".so";
#endif

/// A plugin library that completed the init handshake.
///
/// Owns the library handle and the resolved entry points; the entry points
/// never leave this object. Destruction calls plugin_destroy exactly once and
/// then closes the library. Move-only.
class LoadedPlugin {
public:
    ~LoadedPlugin();

    LoadedPlugin(const LoadedPlugin&) = delete;
    LoadedPlugin& operator=(const LoadedPlugin&) = delete;
    LoadedPlugin(LoadedPlugin&& other) noexcept;
    LoadedPlugin& operator=(LoadedPlugin&& other) noexcept;

    /// Invoke a command exported by this plugin.
    ///
    /// The result string is copied and released through plugin_free_string
    /// exactly once, whether or not it is valid UTF-8.
    /// @return The plugin's JSON text, or InvalidPayload / CommandFailed /
    ///         InvalidResult.
    [[nodiscard]] foundation::HostResult<std::string>
    CallCommand(std::string_view command, std::string_view widgetId,
                std::string_view payload) const;

    [[nodiscard]] const PluginInfo& Info() const noexcept { return info_; }
    [[nodiscard]] const std::string& Name() const noexcept { return info_.name; }
    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    friend class PluginLoader;

    LoadedPlugin(SharedLibrary library, WphPluginCallCommandFn callCommand,
                 WphPluginDestroyFn destroy, WphPluginFreeStringFn freeString,
                 PluginInfo info, std::filesystem::path path) noexcept;

    void release() noexcept;

    SharedLibrary library_;
    WphPluginCallCommandFn callCommand_ = nullptr;
    WphPluginDestroyFn destroy_ = nullptr;
    WphPluginFreeStringFn freeString_ = nullptr;
    PluginInfo info_;
    std::filesystem::path path_;
};

/// Opens plugin libraries and performs the init handshake.
class PluginLoader {
public:
    /// Load one plugin library.
    ///
    /// 1. Open the library.
    /// 2. Resolve plugin_init, plugin_call_command, plugin_destroy and
    ///    plugin_free_string.
    /// 3. Call plugin_init with @p callbacks. A nonzero code fails without
    ///    calling plugin_destroy; an unusable WphPluginInfo or ABI version
    ///    mismatch fails after calling it.
    /// 4. Copy the plugin's identity and bundle everything into LoadedPlugin.
    ///
    /// @return The loaded plugin, or PluginLoadFailed / PluginInitFailed /
    ///         PluginVersionMismatch.
    [[nodiscard]] static foundation::HostResult<std::unique_ptr<LoadedPlugin>>
    Load(const std::filesystem::path& path, WphEngineCallbacks callbacks);

    /// True if @p path is an existing regular file with the platform plugin
    /// extension. Advisory only; Load() is the real test.
    [[nodiscard]] static bool IsValidPluginPath(const std::filesystem::path& path);
};

}  // namespace wph::host
