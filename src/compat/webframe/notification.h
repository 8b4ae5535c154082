#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef enum WEBFRAME_URGENCY
    {
        WEBFRAME_URGENCY_LOW      = 0,
        WEBFRAME_URGENCY_NORMAL   = 1,
        WEBFRAME_URGENCY_CRITICAL = 2,
    } WEBFRAME_URGENCY;

    typedef struct webframe_notification_options
    {
        const char *title;
        const char *body;
        const char *icon;
        /** -1 uses the desktop default, 0 never expires. */
        int32_t timeout_ms;
        WEBFRAME_URGENCY urgency;
    } webframe_notification_options;

    WEBFRAME_EXPORT void webframe_notification_options_default(webframe_notification_options *options);
    WEBFRAME_EXPORT bool webframe_notification_show(const webframe_notification_options *options);

#ifdef __cplusplus
}
#endif
