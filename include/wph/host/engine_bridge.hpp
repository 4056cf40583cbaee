#pragma once

/// @file engine_bridge.hpp
/// @brief EngineBridge: host services exposed to plugins as C callbacks.

#include <filesystem>
#include <functional>
#include <string_view>

#include "wph/foundation/host_result.hpp"
#include "wph/plugin/abi.h"

namespace wph::host {

/// Resolves a widget id to the widget's sandbox directory.
using WidgetDirResolver =
    std::function<foundation::HostResult<std::filesystem::path>(std::string_view widgetId)>;

/// Builds the WphEngineCallbacks value handed to every plugin.
///
/// C function pointers carry no context, so the resolver is installed
/// process-wide. `log` forwards plugin messages to HostLogger under the
/// Plugin category. Without an installed resolver `widget_dir` fails.
class EngineBridge {
public:
    /// Install the widget directory resolver used by `widget_dir`.
    static void Install(WidgetDirResolver resolver);

    /// Remove the installed resolver.
    static void Uninstall();

    [[nodiscard]] static bool IsInstalled();

    /// The callbacks value to pass to PluginManager.
    [[nodiscard]] static WphEngineCallbacks Callbacks() noexcept;

    /// Resolver mapping a widget id to `<root>/<id>`.
    ///
    /// Rejects empty ids and ids that are not a single path component
    /// (separators, `.` or `..`) with InvalidWidgetId. The returned path is
    /// absolute.
    [[nodiscard]] static WidgetDirResolver RootedResolver(std::filesystem::path root);
};

}  // namespace wph::host
