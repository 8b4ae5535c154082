#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef enum WEBFRAME_LOG_LEVEL
    {
        WEBFRAME_LOG_LEVEL_TRACE    = 0,
        WEBFRAME_LOG_LEVEL_DEBUG    = 1,
        WEBFRAME_LOG_LEVEL_INFO     = 2,
        WEBFRAME_LOG_LEVEL_WARN     = 3,
        WEBFRAME_LOG_LEVEL_ERROR    = 4,
        WEBFRAME_LOG_LEVEL_CRITICAL = 5,
        WEBFRAME_LOG_LEVEL_OFF      = 6,
    } WEBFRAME_LOG_LEVEL;

    typedef void (*webframe_log_callback)(WEBFRAME_LOG_LEVEL level, const char *message, void *user_data);

    /**
     * @brief Message of the most recent failing call on the calling thread, or null if there was none.
     * @note The buffer is owned by the library and is overwritten by the next failing call on this thread.
     */
    WEBFRAME_EXPORT const char *webframe_get_last_error(void);
    WEBFRAME_EXPORT int32_t webframe_get_last_error_code(void);
    WEBFRAME_EXPORT void webframe_clear_last_error(void);

    /**
     * @brief Forwards every log record to @p callback. Passing null removes a previously installed callback.
     * @note The callback may be invoked from any thread.
     */
    WEBFRAME_EXPORT void webframe_set_log_callback(webframe_log_callback callback, void *user_data);
    WEBFRAME_EXPORT void webframe_set_log_level(WEBFRAME_LOG_LEVEL level);

    WEBFRAME_EXPORT const char *webframe_version(void);
    WEBFRAME_EXPORT uint32_t webframe_abi_version(void);
    WEBFRAME_EXPORT const char *webframe_library_name(void);

    /**
     * @brief Releases a string that was returned as owned by this library.
     */
    WEBFRAME_EXPORT void webframe_string_free(char *string);

#ifdef __cplusplus
}
#endif
