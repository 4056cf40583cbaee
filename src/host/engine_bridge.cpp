/// @file engine_bridge.cpp
/// @brief EngineBridge implementation and the C callback trampolines.

#include "wph/host/engine_bridge.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <system_error>

#include "wph/foundation/host_logger.hpp"
#include "wph/plugin/engine_interface.hpp"

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostLogger;
using wph::foundation::HostResult;
using wph::foundation::LogCategory;
using wph::foundation::LogLevel;
using wph::plugin::EngineLogLevel;

namespace wph::host {

namespace {

std::shared_mutex& resolverMutex() {
    static std::shared_mutex mutex;
    return mutex;
}

std::shared_ptr<const WidgetDirResolver>& resolverSlot() {
    static std::shared_ptr<const WidgetDirResolver> slot;
    return slot;
}

std::shared_ptr<const WidgetDirResolver> currentResolver() {
    std::shared_lock lock(resolverMutex());
    return resolverSlot();
}

LogLevel mapEngineLevel(EngineLogLevel level) {
    switch (level) {
        case EngineLogLevel::Error: return LogLevel::Error;
        case EngineLogLevel::Warn:  return LogLevel::Warning;
        case EngineLogLevel::Info:  return LogLevel::Info;
        case EngineLogLevel::Debug: return LogLevel::Debug;
        case EngineLogLevel::Trace: return LogLevel::Trace;
    }
    return LogLevel::Info;
}

// ── Trampolines ─────────────────────────────────────────────────────────

int32_t widgetDirTrampoline(const char* widgetId, char** out) noexcept {
    if (widgetId == nullptr || out == nullptr) {
        return WPH_STATUS_INVALID_ARGUMENT;
    }
    try {
        auto resolver = currentResolver();
        if (!resolver || !*resolver) {
            WPH_LOG_WARN(LogCategory::Engine, "widget_dir called without an installed resolver");
            return WPH_STATUS_ERROR;
        }

        auto resolved = (*resolver)(widgetId);
        if (resolved.hasError()) {
            WPH_LOG_DEBUG(LogCategory::Engine,
                          "widget_dir failed for '" + std::string(widgetId) +
                              "': " + std::string(resolved.error().message()));
            return WPH_STATUS_ERROR;
        }

        auto text = resolved.value().string();
        auto* buffer = static_cast<char*>(std::malloc(text.size() + 1));
        if (buffer == nullptr) {
            return WPH_STATUS_ERROR;
        }
        std::memcpy(buffer, text.c_str(), text.size() + 1);
        *out = buffer;
        return WPH_STATUS_OK;
    } catch (const std::exception& e) {
        WPH_LOG_ERROR(LogCategory::Engine, std::string("widget_dir resolver threw: ") + e.what());
        return WPH_STATUS_ERROR;
    }
}

void logTrampoline(int32_t level, const char* message) noexcept {
    if (message == nullptr) {
        return;
    }
    try {
        auto mapped = mapEngineLevel(plugin::EngineLogLevelFromInt(level));
        HostLogger::instance().log(mapped, LogCategory::Plugin, message);
    } catch (const std::exception&) {
        // Plugin logging is fire-and-forget; a failed write drops the message.
        return;
    }
}

}  // namespace

// ── EngineBridge ────────────────────────────────────────────────────────

void EngineBridge::Install(WidgetDirResolver resolver) {
    auto shared = std::make_shared<const WidgetDirResolver>(std::move(resolver));
    std::unique_lock lock(resolverMutex());
    resolverSlot() = std::move(shared);
}

void EngineBridge::Uninstall() {
    std::unique_lock lock(resolverMutex());
    resolverSlot().reset();
}

bool EngineBridge::IsInstalled() {
    auto resolver = currentResolver();
    return resolver && *resolver;
}

WphEngineCallbacks EngineBridge::Callbacks() noexcept {
    return WphEngineCallbacks{&widgetDirTrampoline, &logTrampoline};
}

WidgetDirResolver EngineBridge::RootedResolver(std::filesystem::path root) {
    return [root = std::move(root)](std::string_view widgetId)
               -> HostResult<std::filesystem::path> {
        using PathResult = HostResult<std::filesystem::path>;
        if (widgetId.empty() || widgetId == "." || widgetId == ".." ||
            widgetId.find('/') != std::string_view::npos ||
            widgetId.find('\\') != std::string_view::npos) {
            return PathResult::err(HostError(ErrorCode::InvalidWidgetId,
                                             "Invalid widget id: '" + std::string(widgetId) + "'"));
        }

        std::error_code ec;
        auto dir = std::filesystem::absolute(root / std::string(widgetId), ec);
        if (ec) {
            return PathResult::err(HostError(
                ErrorCode::CallbackFailed,
                "Cannot resolve directory of widget '" + std::string(widgetId) + "': " + ec.message()));
        }
        return PathResult::ok(dir.lexically_normal());
    };
}

}  // namespace wph::host
