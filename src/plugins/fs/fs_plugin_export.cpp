/// @file fs_plugin_export.cpp
/// @brief C exports of the "fs" plugin library.

#include "wph/plugin/plugin_export.hpp"
#include "wph/plugins/fs_plugin.hpp"

WPH_PLUGIN_EXPORT(wph::plugins::fs::FsPlugin)
