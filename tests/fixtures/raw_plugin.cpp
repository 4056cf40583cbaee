/// @file raw_plugin.cpp
/// @brief Hand-written plugin "raw" that misbehaves on purpose.
///
/// Commands:
///   - "bad_utf8": succeeds with a result that is not valid UTF-8
///   - "no_result": succeeds without setting the result
///   - "fail": returns -7
///   - "echo_raw": returns the payload text unchanged

#include <cstring>

#include "wph/plugin/abi.h"

namespace {

int gFreeCalls = 0;
int gDestroyCalls = 0;

char* copyString(const char* text) {
    auto size = std::strlen(text) + 1;
    auto* buffer = new char[size];
    std::memcpy(buffer, text, size);
    return buffer;
}

}  // namespace

extern "C" {

WPH_PLUGIN_API int32_t plugin_init(WphEngineCallbacks /*callbacks*/, WphPluginInfo* out) {
    static const char* const kCommands[] = {"bad_utf8", "no_result", "fail", "echo_raw"};
    out->name = "raw";
    out->version = "0.1.0";
    out->commands = kCommands;
    out->command_count = 4;
    out->abi_version = WPH_ABI_VERSION;
    return WPH_STATUS_OK;
}

WPH_PLUGIN_API int32_t plugin_call_command(const char* command, const char* /*widget_id*/,
                                           const char* payload, char** result_out) {
    if (std::strcmp(command, "bad_utf8") == 0) {
        *result_out = copyString("\"\xC3\x28\"");
        return WPH_STATUS_OK;
    }
    if (std::strcmp(command, "no_result") == 0) {
        return WPH_STATUS_OK;
    }
    if (std::strcmp(command, "fail") == 0) {
        return -7;
    }
    if (std::strcmp(command, "echo_raw") == 0) {
        *result_out = copyString(payload);
        return WPH_STATUS_OK;
    }
    return WPH_STATUS_INVALID_ARGUMENT;
}

WPH_PLUGIN_API void plugin_destroy(void) {
    ++gDestroyCalls;
}

WPH_PLUGIN_API void plugin_free_string(char* str) {
    ++gFreeCalls;
    delete[] str;
}

WPH_PLUGIN_API int fixture_free_calls(void) { return gFreeCalls; }
WPH_PLUGIN_API int fixture_destroy_calls(void) { return gDestroyCalls; }

}  // extern "C"
