#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef void (*webframe_message_callback)(webframe_window *window, const char *message, void *user_data);
    typedef bool (*webframe_closing_callback)(webframe_window *window, void *user_data);
    typedef void (*webframe_resized_callback)(webframe_window *window, double width, double height, void *user_data);
    typedef void (*webframe_moved_callback)(webframe_window *window, double x, double y, void *user_data);
    typedef void (*webframe_focus_callback)(webframe_window *window, bool focused, void *user_data);
    typedef bool (*webframe_navigation_callback)(webframe_window *window, const char *url, void *user_data);

    /**
     * @note Each setter replaces the previous registration of its kind. Passing a null callback clears it.
     * @note Callbacks run on the loop thread; a callback that blocks stalls every window.
     */
    WEBFRAME_EXPORT void webframe_window_set_message_callback(webframe_window *window, webframe_message_callback callback,
                                                              void *user_data);

    /**
     * @note Without a closing callback every close request is approved.
     */
    WEBFRAME_EXPORT void webframe_window_set_closing_callback(webframe_window *window, webframe_closing_callback callback,
                                                              void *user_data);

    WEBFRAME_EXPORT void webframe_window_set_resized_callback(webframe_window *window, webframe_resized_callback callback,
                                                              void *user_data);

    WEBFRAME_EXPORT void webframe_window_set_moved_callback(webframe_window *window, webframe_moved_callback callback,
                                                            void *user_data);

    WEBFRAME_EXPORT void webframe_window_set_focus_callback(webframe_window *window, webframe_focus_callback callback,
                                                            void *user_data);

    /**
     * @note Without a navigation callback every navigation is allowed.
     */
    WEBFRAME_EXPORT void webframe_window_set_navigation_callback(webframe_window *window,
                                                                 webframe_navigation_callback callback,
                                                                 void *user_data);

#ifdef __cplusplus
}
#endif
