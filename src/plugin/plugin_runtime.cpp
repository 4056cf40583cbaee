/// @file plugin_runtime.cpp
/// @brief PluginRuntime implementation.

#include "wph/plugin/plugin_runtime.hpp"

#include <cstring>
#include <mutex>

#include "wph/foundation/text_validator.hpp"

using wph::foundation::TextValidator;

namespace wph::plugin {

// ── Lifecycle ───────────────────────────────────────────────────────────

int32_t PluginRuntime::Init(std::unique_ptr<IPlugin> plugin, WphEngineCallbacks callbacks,
                            WphPluginInfo* out) {
    if (!plugin || out == nullptr) {
        return WPH_STATUS_INVALID_ARGUMENT;
    }

    std::unique_lock lock(mutex_);
    if (initialized_) {
        // The loader hands out one mapping per library, so a second open of
        // the same file lands here. Report the live identity; the host then
        // rejects it by name and its destroy only drops this reference.
        ++initCount_;
        describe(out);
        return WPH_STATUS_OK;
    }

    engine_ = EngineInterface(callbacks);
    name_ = std::string(plugin->Name());
    version_ = std::string(plugin->Version());

    auto registered = registry_.RegisterPlugin(std::move(plugin));
    if (registered.hasError()) {
        engine_.LogError(std::string(registered.error().message()));
        registry_.Clear();
        name_.clear();
        version_.clear();
        return WPH_STATUS_ERROR;
    }

    commandNames_ = registry_.PluginCommands(name_);
    commandPtrs_.clear();
    commandPtrs_.reserve(commandNames_.size());
    for (const auto& name : commandNames_) {
        commandPtrs_.push_back(name.c_str());
    }

    describe(out);
    initialized_ = true;
    initCount_ = 1;
    return WPH_STATUS_OK;
}

void PluginRuntime::describe(WphPluginInfo* out) const {
    out->name = name_.c_str();
    out->version = version_.c_str();
    out->commands = commandPtrs_.empty() ? nullptr : commandPtrs_.data();
    out->command_count = commandPtrs_.size();
    out->abi_version = WPH_ABI_VERSION;
}

void PluginRuntime::Destroy() {
    std::unique_lock lock(mutex_);
    if (initCount_ > 1) {
        --initCount_;
        return;
    }
    initCount_ = 0;
    registry_.Clear();
    commandPtrs_.clear();
    commandNames_.clear();
    name_.clear();
    version_.clear();
    engine_ = EngineInterface();
    initialized_ = false;
}

bool PluginRuntime::IsInitialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

// ── Dispatch ────────────────────────────────────────────────────────────

int32_t PluginRuntime::Call(const char* command, const char* widgetId, const char* payload,
                            char** resultOut) const {
    if (command == nullptr || widgetId == nullptr || resultOut == nullptr) {
        return WPH_STATUS_INVALID_ARGUMENT;
    }

    std::shared_lock lock(mutex_);
    if (!initialized_) {
        return WPH_STATUS_NOT_INITIALIZED;
    }

    std::string_view commandText(command);
    std::string_view widgetText(widgetId);
    std::string_view payloadText = payload != nullptr ? std::string_view(payload) : std::string_view();
    if (!TextValidator::isValidUtf8(commandText) || !TextValidator::isValidUtf8(widgetText) ||
        !TextValidator::isValidUtf8(payloadText)) {
        return WPH_STATUS_INVALID_ARGUMENT;
    }

    auto result = registry_.CallCommand(commandText, widgetText, engine_, payloadText);
    if (result.hasError()) {
        engine_.LogError("Command '" + std::string(commandText) + "' failed: " +
                         std::string(result.error().message()));
        return WPH_STATUS_ERROR;
    }

    *resultOut = AllocateString(result.value());
    return WPH_STATUS_OK;
}

// ── String ownership ────────────────────────────────────────────────────

char* PluginRuntime::AllocateString(std::string_view text) {
    auto* buffer = new char[text.size() + 1];
    std::memcpy(buffer, text.data(), text.size());
    buffer[text.size()] = '\0';
    return buffer;
}

void PluginRuntime::FreeString(char* str) noexcept {
    delete[] str;
}

PluginRuntime& PluginRuntime::Instance() {
    static PluginRuntime runtime;
    return runtime;
}

// ── Free functions ──────────────────────────────────────────────────────

namespace runtime {

int32_t InitPlugin(std::unique_ptr<IPlugin> plugin, WphEngineCallbacks callbacks,
                   WphPluginInfo* out) {
    return PluginRuntime::Instance().Init(std::move(plugin), callbacks, out);
}

int32_t CallCommand(const char* command, const char* widgetId, const char* payload,
                    char** resultOut) {
    return PluginRuntime::Instance().Call(command, widgetId, payload, resultOut);
}

void DestroyPlugin() {
    PluginRuntime::Instance().Destroy();
}

char* AllocateString(std::string_view text) {
    return PluginRuntime::AllocateString(text);
}

void FreeString(char* str) noexcept {
    PluginRuntime::FreeString(str);
}

}  // namespace runtime

}  // namespace wph::plugin
