/// @file engine_interface.cpp
/// @brief EngineInterface implementation.

#include "wph/plugin/engine_interface.hpp"

#include <cstdlib>
#include <string>

#include "wph/foundation/text_validator.hpp"

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;
using wph::foundation::TextValidator;

namespace wph::plugin {

namespace {

/// Owns a malloc'd string returned by the host.
struct HostString {
    char* ptr = nullptr;

    HostString() = default;
    HostString(const HostString&) = delete;
    HostString& operator=(const HostString&) = delete;
    ~HostString() { std::free(ptr); }
};

}  // namespace

HostResult<std::filesystem::path> EngineInterface::WidgetDir(std::string_view widgetId) const {
    using PathResult = HostResult<std::filesystem::path>;

    if (TextValidator::hasInteriorNul(widgetId)) {
        return PathResult::err(
            HostError(ErrorCode::InvalidWidgetId, "widget id contains an interior NUL byte"));
    }
    if (callbacks_.widget_dir == nullptr) {
        return PathResult::err(
            HostError(ErrorCode::CallbackFailed, "host did not provide a widget_dir callback"));
    }

    std::string id(widgetId);
    HostString out;
    int32_t rc = callbacks_.widget_dir(id.c_str(), &out.ptr);
    if (rc != WPH_STATUS_OK) {
        return PathResult::err(HostError(
            ErrorCode::CallbackFailed,
            "widget_dir failed for '" + id + "' with code " + std::to_string(rc)));
    }
    if (out.ptr == nullptr) {
        return PathResult::err(
            HostError(ErrorCode::CallbackFailed, "widget_dir returned a null path for '" + id + "'"));
    }

    std::string_view raw(out.ptr);
    if (!TextValidator::isValidUtf8(raw)) {
        return PathResult::err(
            HostError(ErrorCode::CallbackFailed, "widget_dir returned a path that is not UTF-8"));
    }
    return PathResult::ok(std::filesystem::path(std::string(raw)));
}

void EngineInterface::Log(EngineLogLevel level, std::string_view message) const {
    if (callbacks_.log == nullptr) {
        return;
    }
    if (TextValidator::hasInteriorNul(message) || !TextValidator::isValidUtf8(message)) {
        return;
    }
    std::string text(message);
    callbacks_.log(static_cast<int32_t>(level), text.c_str());
}

}  // namespace wph::plugin
