#pragma once

/// @file wph.hpp
/// @brief Umbrella header for host applications embedding the plugin host.

#include "wph/core/result.hpp"
#include "wph/foundation/config_manager.hpp"
#include "wph/foundation/error_code.hpp"
#include "wph/foundation/host_error.hpp"
#include "wph/foundation/host_logger.hpp"
#include "wph/foundation/host_result.hpp"
#include "wph/host/engine_bridge.hpp"
#include "wph/host/plugin_loader.hpp"
#include "wph/host/plugin_manager.hpp"
#include "wph/host/plugin_types.hpp"
#include "wph/host/shared_plugin_manager.hpp"
#include "wph/version.hpp"
