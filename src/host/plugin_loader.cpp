/// @file plugin_loader.cpp
/// @brief PluginLoader and LoadedPlugin implementation.

#include "wph/host/plugin_loader.hpp"

#include <system_error>
#include <utility>

#include "wph/foundation/host_logger.hpp"
#include "wph/foundation/text_validator.hpp"

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;
using wph::foundation::LogCategory;
using wph::foundation::TextValidator;

namespace wph::host {

// ── LoadedPlugin ────────────────────────────────────────────────────────

LoadedPlugin::LoadedPlugin(SharedLibrary library, WphPluginCallCommandFn callCommand,
                           WphPluginDestroyFn destroy, WphPluginFreeStringFn freeString,
                           PluginInfo info, std::filesystem::path path) noexcept
    : library_(std::move(library)),
      callCommand_(callCommand),
      destroy_(destroy),
      freeString_(freeString),
      info_(std::move(info)),
      path_(std::move(path)) {}

LoadedPlugin::~LoadedPlugin() {
    release();
}

LoadedPlugin::LoadedPlugin(LoadedPlugin&& other) noexcept
    : library_(std::move(other.library_)),
      callCommand_(std::exchange(other.callCommand_, nullptr)),
      destroy_(std::exchange(other.destroy_, nullptr)),
      freeString_(std::exchange(other.freeString_, nullptr)),
      info_(std::move(other.info_)),
      path_(std::move(other.path_)) {}

LoadedPlugin& LoadedPlugin::operator=(LoadedPlugin&& other) noexcept {
    if (this != &other) {
        release();
        library_ = std::move(other.library_);
        callCommand_ = std::exchange(other.callCommand_, nullptr);
        destroy_ = std::exchange(other.destroy_, nullptr);
        freeString_ = std::exchange(other.freeString_, nullptr);
        info_ = std::move(other.info_);
        path_ = std::move(other.path_);
    }
    return *this;
}

void LoadedPlugin::release() noexcept {
    // destroy must run while the library is still mapped.
    if (destroy_ != nullptr) {
        destroy_();
        destroy_ = nullptr;
    }
    callCommand_ = nullptr;
    freeString_ = nullptr;
    library_.Close();
}

HostResult<std::string> LoadedPlugin::CallCommand(std::string_view command,
                                                  std::string_view widgetId,
                                                  std::string_view payload) const {
    using TextResult = HostResult<std::string>;

    if (callCommand_ == nullptr) {
        return TextResult::err(HostError(ErrorCode::DispatchFailed,
                                         "Plugin '" + info_.name + "' is no longer loaded"));
    }
    if (TextValidator::hasInteriorNul(command) || TextValidator::hasInteriorNul(widgetId) ||
        TextValidator::hasInteriorNul(payload)) {
        return TextResult::err(HostError(
            ErrorCode::InvalidPayload,
            "Arguments for '" + std::string(command) + "' contain an interior NUL byte"));
    }

    std::string commandText(command);
    std::string widgetText(widgetId);
    std::string payloadText(payload);

    char* raw = nullptr;
    int32_t rc = callCommand_(commandText.c_str(), widgetText.c_str(), payloadText.c_str(), &raw);
    if (rc != WPH_STATUS_OK) {
        return TextResult::err(HostError(
            ErrorCode::CommandFailed,
            "Command '" + commandText + "' failed in plugin '" + info_.name +
                "' with code " + std::to_string(rc)));
    }
    if (raw == nullptr) {
        return TextResult::err(HostError(
            ErrorCode::InvalidResult,
            "Command '" + commandText + "' returned a null result"));
    }

    auto deleter = [release = freeString_](char* str) { release(str); };
    std::unique_ptr<char, decltype(deleter)> owned(raw, deleter);

    std::string text(owned.get());
    if (!TextValidator::isValidUtf8(text)) {
        return TextResult::err(HostError(
            ErrorCode::InvalidResult,
            "Command '" + commandText + "' returned a result that is not UTF-8"));
    }
    return TextResult::ok(std::move(text));
}

// ── PluginLoader ────────────────────────────────────────────────────────

namespace {

/// Copy the C identity the plugin reported into a PluginInfo.
HostResult<PluginInfo> copyPluginInfo(const WphPluginInfo& raw, const std::filesystem::path& path) {
    auto fail = [&path](std::string reason) {
        return HostResult<PluginInfo>::err(
            HostError(ErrorCode::PluginLoadFailed, reason + ": " + path.string()));
    };

    if (raw.name == nullptr) {
        return fail("Plugin reported a null name");
    }
    PluginInfo info;
    info.name = raw.name;
    if (info.name.empty() || !TextValidator::isValidUtf8(info.name)) {
        return fail("Plugin reported an empty or non-UTF-8 name");
    }

    if (raw.version != nullptr) {
        info.version = raw.version;
        if (!TextValidator::isValidUtf8(info.version)) {
            return fail("Plugin reported a non-UTF-8 version");
        }
    }

    if (raw.command_count > 0 && raw.commands == nullptr) {
        return fail("Plugin reported commands without a command table");
    }
    info.commands.reserve(raw.command_count);
    for (std::size_t i = 0; i < raw.command_count; ++i) {
        if (raw.commands[i] == nullptr) {
            return fail("Plugin reported a null command name");
        }
        std::string name(raw.commands[i]);
        if (name.empty() || !TextValidator::isValidUtf8(name)) {
            return fail("Plugin reported an empty or non-UTF-8 command name");
        }
        info.commands.push_back(std::move(name));
    }
    return HostResult<PluginInfo>::ok(std::move(info));
}

}  // namespace

HostResult<std::unique_ptr<LoadedPlugin>> PluginLoader::Load(const std::filesystem::path& path,
                                                             WphEngineCallbacks callbacks) {
    using LoadResult = HostResult<std::unique_ptr<LoadedPlugin>>;

    WPH_LOG_DEBUG(LogCategory::Loader, "Opening plugin library " + path.string());

    auto opened = SharedLibrary::Open(path);
    if (opened.hasError()) {
        return LoadResult::err(opened.error());
    }
    auto library = std::move(opened).value();

    auto init = library.Function<WphPluginInitFn>(WPH_SYMBOL_INIT);
    auto callCommand = library.Function<WphPluginCallCommandFn>(WPH_SYMBOL_CALL_COMMAND);
    auto destroy = library.Function<WphPluginDestroyFn>(WPH_SYMBOL_DESTROY);
    auto freeString = library.Function<WphPluginFreeStringFn>(WPH_SYMBOL_FREE_STRING);

    const char* missing = nullptr;
    if (init == nullptr) {
        missing = WPH_SYMBOL_INIT;
    } else if (callCommand == nullptr) {
        missing = WPH_SYMBOL_CALL_COMMAND;
    } else if (destroy == nullptr) {
        missing = WPH_SYMBOL_DESTROY;
    } else if (freeString == nullptr) {
        missing = WPH_SYMBOL_FREE_STRING;
    }
    if (missing != nullptr) {
        return LoadResult::err(HostError(
            ErrorCode::PluginLoadFailed,
            "Symbol '" + std::string(missing) + "' not found in: " + path.string()));
    }

    WphPluginInfo raw{};
    int32_t rc = init(callbacks, &raw);
    if (rc != WPH_STATUS_OK) {
        return LoadResult::err(HostError(
            ErrorCode::PluginInitFailed,
            "plugin_init failed with code " + std::to_string(rc) + " for: " + path.string()));
    }

    // From here on the plugin is initialized and must be destroyed on failure.
    if (raw.abi_version != WPH_ABI_VERSION) {
        destroy();
        return LoadResult::err(HostError(
            ErrorCode::PluginVersionMismatch,
            "Plugin ABI version " + std::to_string(raw.abi_version) + " does not match host " +
                std::to_string(WPH_ABI_VERSION) + ": " + path.string()));
    }

    auto info = copyPluginInfo(raw, path);
    if (info.hasError()) {
        destroy();
        return LoadResult::err(info.error());
    }

    WPH_LOG_DEBUG(LogCategory::Loader,
                  "Initialized plugin '" + info.value().name + "' from " + path.string());

    return LoadResult::ok(std::unique_ptr<LoadedPlugin>(
        new LoadedPlugin(std::move(library), callCommand, destroy, freeString,
                         std::move(info).value(), path)));
}

bool PluginLoader::IsValidPluginPath(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return path.extension().string() == kPluginExtension;
}

}  // namespace wph::host
