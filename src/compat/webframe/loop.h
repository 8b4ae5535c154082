#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    /**
     * @brief Creates a proxy that injects events into the loop of @p app from any thread.
     * @note The proxy may outlive the application; sends fail once the loop has stopped.
     */
    WEBFRAME_EXPORT webframe_proxy *webframe_app_create_proxy(webframe_app *app);
    WEBFRAME_EXPORT void webframe_proxy_free(webframe_proxy *proxy);

    WEBFRAME_EXPORT bool webframe_proxy_send_user_event(webframe_proxy *proxy, const char *payload);
    WEBFRAME_EXPORT bool webframe_proxy_send_menu_event(webframe_proxy *proxy, const char *menu_id);
    WEBFRAME_EXPORT bool webframe_proxy_send_tray_event(webframe_proxy *proxy, const char *tray_id,
                                                        const char *event_type);
    WEBFRAME_EXPORT bool webframe_proxy_request_exit(webframe_proxy *proxy);

#ifdef __cplusplus
}
#endif
