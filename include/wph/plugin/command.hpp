#pragma once

/// @file command.hpp
/// @brief ICommand interface and the TypedCommand<In, Out> JSON adapter.

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "wph/foundation/host_result.hpp"
#include "wph/foundation/text_validator.hpp"
#include "wph/plugin/engine_interface.hpp"

namespace wph::plugin {

/// One named operation exposed by a plugin.
///
/// Implementations must be safe to call from several threads at once; the
/// host issues concurrent calls under a shared lock.
class ICommand {
public:
    virtual ~ICommand() = default;

    /// Command name as seen by widgets. Must be unique across all plugins.
    [[nodiscard]] virtual std::string_view Name() const = 0;

    /// Execute the command with a JSON payload and produce JSON text.
    ///
    /// @param widgetId  Id of the widget issuing the call.
    /// @param engine    Host services (widget directory lookup, logging).
    /// @param payload   UTF-8 JSON text; empty or blank means `null`.
    [[nodiscard]] virtual foundation::HostResult<std::string>
    Run(std::string_view widgetId, const EngineInterface& engine,
        std::string_view payload) const = 0;
};

/// Input type for commands that take no arguments.
///
/// Accepts `null`, an absent payload, or an object (fields ignored).
struct NoInput {};

inline void from_json(const nlohmann::json& j, NoInput& /*unused*/) {
    if (!j.is_null() && !j.is_object()) {
        throw std::invalid_argument("expected null or an object");
    }
}

/// Output type for commands that return nothing. Serializes as `null`.
struct NoOutput {};

inline void to_json(nlohmann::json& j, const NoOutput& /*unused*/) {
    j = nullptr;
}

/// Adapter that implements ICommand on top of strongly typed input and
/// output values.
///
/// `In` must be default-constructible and convertible from JSON through
/// nlohmann's `from_json`; `Out` must be convertible to JSON via `to_json`.
/// Parse and conversion failures become InvalidPayload, a std::exception
/// thrown by RunTyped() CommandFailed, serialization failures InvalidResult.
/// No std::exception leaves Run().
///
/// Example:
/// @code
///   struct DoubleIn { int value = 0; };
///   struct DoubleOut { int doubled = 0; };
///   NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DoubleIn, value)
///   NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DoubleOut, doubled)
///
///   class DoubleCommand : public TypedCommand<DoubleIn, DoubleOut> {
///   public:
///       std::string_view Name() const override { return "double"; }
///       HostResult<DoubleOut> RunTyped(std::string_view, const EngineInterface&,
///                                      DoubleIn in) const override {
///           return HostResult<DoubleOut>::ok({in.value * 2});
///       }
///   };
/// @endcode
template <typename In, typename Out>
class TypedCommand : public ICommand {
public:
    using Input = In;
    using Output = Out;

    /// Typed command body.
    [[nodiscard]] virtual foundation::HostResult<Out>
    RunTyped(std::string_view widgetId, const EngineInterface& engine, In input) const = 0;

    [[nodiscard]] foundation::HostResult<std::string>
    Run(std::string_view widgetId, const EngineInterface& engine,
        std::string_view payload) const final {
        using foundation::ErrorCode;
        using foundation::HostError;
        using TextResult = foundation::HostResult<std::string>;

        nlohmann::json document;
        if (!foundation::TextValidator::isBlank(payload)) {
            document = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
            if (document.is_discarded()) {
                return TextResult::err(HostError(
                    ErrorCode::InvalidPayload,
                    "Invalid payload for '" + std::string(Name()) + "': malformed JSON"));
            }
        }

        In input{};
        try {
            input = document.get<In>();
        } catch (const std::exception& e) {
            return TextResult::err(HostError(
                ErrorCode::InvalidPayload,
                "Invalid payload for '" + std::string(Name()) + "': " + e.what()));
        }

        std::optional<foundation::HostResult<Out>> output;
        try {
            output.emplace(RunTyped(widgetId, engine, std::move(input)));
        } catch (const std::exception& e) {
            return TextResult::err(HostError(
                ErrorCode::CommandFailed,
                "Command '" + std::string(Name()) + "' threw: " + e.what()));
        }
        if (output->hasError()) {
            return TextResult::err(output->error());
        }

        try {
            nlohmann::json serialized = output->value();
            return TextResult::ok(serialized.dump());
        } catch (const std::exception& e) {
            return TextResult::err(HostError(
                ErrorCode::InvalidResult,
                "Failed to serialize result of '" + std::string(Name()) + "': " + e.what()));
        }
    }
};

}  // namespace wph::plugin
