#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include <webframe/export.h>

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

    struct webframe_app;
    struct webframe_window;
    struct webframe_proxy;

    typedef struct webframe_app webframe_app;
    typedef struct webframe_window webframe_window;
    typedef struct webframe_proxy webframe_proxy;

    typedef enum WEBFRAME_ERROR
    {
        WEBFRAME_ERROR_SUCCESS                 = 0,
        WEBFRAME_ERROR_INVALID_HANDLE          = 1,
        WEBFRAME_ERROR_WINDOW_CREATION_FAILED  = 2,
        WEBFRAME_ERROR_WEBVIEW_CREATION_FAILED = 3,
        WEBFRAME_ERROR_NAVIGATION_FAILED       = 4,
        WEBFRAME_ERROR_SCRIPT_ERROR            = 5,
        WEBFRAME_ERROR_PROTOCOL_ERROR          = 6,
        WEBFRAME_ERROR_INVALID_PARAMETER       = 7,
        WEBFRAME_ERROR_NOT_SUPPORTED           = 8,
        WEBFRAME_ERROR_DIALOG_CANCELLED        = 9,
        WEBFRAME_ERROR_NOTIFICATION_FAILED     = 10,
        WEBFRAME_ERROR_ICON_LOAD_FAILED        = 11,
        WEBFRAME_ERROR_EVENT_LOOP_ERROR        = 12,
        WEBFRAME_ERROR_UNKNOWN                 = 255,
    } WEBFRAME_ERROR;

    /**
     * @brief Outcome of an operation that can fail for more than one reason.
     *
     * @note `error_message` points into the calling thread's last-error buffer. It stays valid until the next
     * failing call on the same thread and is null on success.
     */
    typedef struct webframe_result
    {
        bool success;
        int32_t error_code;
        const char *error_message;
    } webframe_result;

    typedef struct webframe_size
    {
        double width;
        double height;
    } webframe_size;

    typedef struct webframe_position
    {
        double x;
        double y;
    } webframe_position;

    typedef enum WEBFRAME_CONTROL_FLOW
    {
        WEBFRAME_CONTROL_FLOW_POLL = 0,
        WEBFRAME_CONTROL_FLOW_WAIT = 1,
        WEBFRAME_CONTROL_FLOW_EXIT = 2,
    } WEBFRAME_CONTROL_FLOW;

#ifdef __cplusplus
}
#endif
