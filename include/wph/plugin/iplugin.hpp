#pragma once

/// @file iplugin.hpp
/// @brief IPlugin abstract interface that every widget plugin implements.

#include <memory>
#include <string_view>
#include <vector>

#include "wph/plugin/command.hpp"
#include "wph/version.hpp"

namespace wph::plugin {

/// Ordered list of commands a plugin exposes.
using CommandList = std::vector<std::unique_ptr<ICommand>>;

/// Abstract base class for widget plugins.
///
/// A plugin is an identity plus a list of commands. The SDK runtime calls
/// Commands() once, during plugin_init, and owns the returned objects until
/// plugin_destroy.
///
/// @see WPH_PLUGIN_EXPORT
class IPlugin {
public:
    virtual ~IPlugin() = default;

    /// Plugin name. Must be unique among the plugins loaded by a host.
    [[nodiscard]] virtual std::string_view Name() const = 0;

    /// Plugin version. Defaults to the SDK version the plugin was built with.
    [[nodiscard]] virtual std::string_view Version() const { return WPH_VERSION_STRING; }

    /// Create the commands this plugin exposes, in declaration order.
    [[nodiscard]] virtual CommandList Commands() const = 0;
};

/// Build a CommandList from default-constructible command types.
///
/// @code
///   CommandList Commands() const override {
///       return MakeCommands<ReadFile, WriteFile>();
///   }
/// @endcode
template <typename... Cs>
[[nodiscard]] CommandList MakeCommands() {
    CommandList commands;
    commands.reserve(sizeof...(Cs));
    (commands.push_back(std::make_unique<Cs>()), ...);
    return commands;
}

}  // namespace wph::plugin
