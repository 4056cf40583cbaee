#pragma once

/// @file host_error.hpp
/// @brief Error type used with Result<T, HostError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "wph/foundation/error_code.hpp"

namespace wph::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data for debugging.
class HostError {
public:
    HostError() = default;

    explicit HostError(ErrorCode code)
        : code_(code) {}

    HostError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    HostError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace wph::foundation
