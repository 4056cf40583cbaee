/*
 * abi.h - C binary interface shared by the widget plugin host and plugins.
 *
 * C99-compatible. Everything that crosses the host/plugin boundary is either
 * a fixed-width integer, a null-terminated UTF-8 string or a function pointer.
 *
 * Ownership: the producer of a heap string allocates it and the consumer
 * releases it through the producer's release path exactly once. Strings
 * returned by plugin_call_command are released with plugin_free_string.
 * Strings returned by the host's widget_dir callback are allocated with
 * malloc and released by the plugin with free.
 */
#ifndef WPH_PLUGIN_ABI_H
#define WPH_PLUGIN_ABI_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Platform exports ------------------------------------------------------- */
#if defined(_WIN32) || defined(_WIN64)
    #define WPH_PLUGIN_API __declspec(dllexport)
#else
    #if defined(__GNUC__) || defined(__clang__)
        #define WPH_PLUGIN_API __attribute__((visibility("default")))
    #else
        #define WPH_PLUGIN_API
    #endif
#endif

/* Version and status codes ------------------------------------------------ */
#define WPH_ABI_VERSION ((uint32_t)1u)

#define WPH_STATUS_OK                ((int32_t)0)
#define WPH_STATUS_ERROR             ((int32_t)-1)
#define WPH_STATUS_INVALID_ARGUMENT  ((int32_t)-2)
#define WPH_STATUS_NOT_INITIALIZED   ((int32_t)-3)

/* Engine log levels passed through WphEngineCallbacks.log. */
#define WPH_LOG_LEVEL_ERROR ((int32_t)0)
#define WPH_LOG_LEVEL_WARN  ((int32_t)1)
#define WPH_LOG_LEVEL_INFO  ((int32_t)2)
#define WPH_LOG_LEVEL_DEBUG ((int32_t)3)
#define WPH_LOG_LEVEL_TRACE ((int32_t)4)

/* Host services ----------------------------------------------------------- */

/* Resolves a widget id to its directory. Returns 0 and stores a malloc'd
 * UTF-8 path in *out on success. */
typedef int32_t (*WphWidgetDirFn)(const char* widget_id, char** out);

/* Forwards a message to the host log. Fire-and-forget. */
typedef void (*WphLogFn)(int32_t level, const char* message);

typedef struct WphEngineCallbacks {
    WphWidgetDirFn widget_dir;
    WphLogFn       log;
} WphEngineCallbacks;

/* Plugin identity --------------------------------------------------------- */

/* Filled by plugin_init. All pointers are owned by the plugin and remain
 * valid until plugin_destroy; the host copies them immediately. */
typedef struct WphPluginInfo {
    const char*        name;
    const char*        version;
    const char* const* commands;
    size_t             command_count;
    uint32_t           abi_version;
} WphPluginInfo;

/* Required exports -------------------------------------------------------- */
typedef int32_t (*WphPluginInitFn)(WphEngineCallbacks callbacks, WphPluginInfo* out);
typedef int32_t (*WphPluginCallCommandFn)(const char* command,
                                          const char* widget_id,
                                          const char* payload,
                                          char** result_out);
typedef void (*WphPluginDestroyFn)(void);
typedef void (*WphPluginFreeStringFn)(char* str);

#define WPH_SYMBOL_INIT         "plugin_init"
#define WPH_SYMBOL_CALL_COMMAND "plugin_call_command"
#define WPH_SYMBOL_DESTROY      "plugin_destroy"
#define WPH_SYMBOL_FREE_STRING  "plugin_free_string"

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* WPH_PLUGIN_ABI_H */
