/// @file sys_plugin_export.cpp
/// @brief C exports of the "sys" plugin library.

#include "wph/plugin/plugin_export.hpp"
#include "wph/plugins/sys_plugin.hpp"

WPH_PLUGIN_EXPORT(wph::plugins::sys::SysPlugin)
