#pragma once

/// @file host_result.hpp
/// @brief HostResult<T> type alias used across the host and the plugin SDK.

#include "wph/core/result.hpp"
#include "wph/foundation/host_error.hpp"

namespace wph::foundation {

/// Result type specialized with HostError.
///
/// Example:
/// @code
///   HostResult<std::filesystem::path> resolve(std::string_view id) {
///       if (id.empty()) {
///           return HostResult<std::filesystem::path>::err(
///               HostError(ErrorCode::InvalidWidgetId, "empty widget id"));
///       }
///       return HostResult<std::filesystem::path>::ok(root / id);
///   }
/// @endcode
template <typename T>
using HostResult = wph::Result<T, HostError>;

}  // namespace wph::foundation
