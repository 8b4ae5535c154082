#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef struct webframe_window_params
    {
        const char *title;
        /** Takes precedence over `html` when both are set. */
        const char *url;
        const char *html;
        const char *user_agent;
        const char *data_directory;

        bool has_position;
        double x;
        double y;

        double width;
        double height;
        /** 0 leaves the dimension unconstrained. */
        double min_width;
        double min_height;
        double max_width;
        double max_height;

        bool resizable;
        bool fullscreen;
        bool maximized;
        bool minimized;
        bool visible;
        bool transparent;
        bool decorations;
        bool always_on_top;
        bool devtools_enabled;
        bool autoplay_enabled;
    } webframe_window_params;

    WEBFRAME_EXPORT void webframe_window_params_default(webframe_window_params *params);

    /**
     * @brief Creates a window with an embedded webview. Passing null for @p params uses the defaults.
     * @note Must be called on the thread that runs (or will run) the loop of @p app.
     */
    WEBFRAME_EXPORT webframe_window *webframe_window_create(webframe_app *app, const webframe_window_params *params);

    /**
     * @brief Destroys @p window without consulting its closing callback. The handle is invalid afterwards.
     */
    WEBFRAME_EXPORT void webframe_window_destroy(webframe_window *window);

    /**
     * @brief Queues destruction of @p window on the loop thread. Safe to call from any thread.
     */
    WEBFRAME_EXPORT bool webframe_window_post_destroy(webframe_window *window);

    /**
     * @brief Requests a close, as if the user had clicked the close button. The closing callback decides.
     */
    WEBFRAME_EXPORT void webframe_window_close(webframe_window *window);

    WEBFRAME_EXPORT uint64_t webframe_window_id(webframe_window *window);
    WEBFRAME_EXPORT webframe_app *webframe_window_app(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_visible(webframe_window *window, bool visible);
    WEBFRAME_EXPORT bool webframe_window_is_visible(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_title(webframe_window *window, const char *title);

    /**
     * @note Thread-local scratch, valid until the next call on this thread.
     */
    WEBFRAME_EXPORT const char *webframe_window_get_title(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_size(webframe_window *window, double width, double height);
    WEBFRAME_EXPORT webframe_size webframe_window_get_size(webframe_window *window);
    WEBFRAME_EXPORT void webframe_window_set_min_size(webframe_window *window, double width, double height);
    WEBFRAME_EXPORT void webframe_window_set_max_size(webframe_window *window, double width, double height);

    WEBFRAME_EXPORT void webframe_window_set_position(webframe_window *window, double x, double y);
    WEBFRAME_EXPORT webframe_position webframe_window_get_position(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_minimize(webframe_window *window);
    WEBFRAME_EXPORT void webframe_window_maximize(webframe_window *window);
    WEBFRAME_EXPORT void webframe_window_unmaximize(webframe_window *window);
    WEBFRAME_EXPORT bool webframe_window_is_minimized(webframe_window *window);
    WEBFRAME_EXPORT bool webframe_window_is_maximized(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_fullscreen(webframe_window *window, bool fullscreen);
    WEBFRAME_EXPORT bool webframe_window_is_fullscreen(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_focus(webframe_window *window);
    WEBFRAME_EXPORT bool webframe_window_is_focused(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_resizable(webframe_window *window, bool resizable);
    WEBFRAME_EXPORT bool webframe_window_is_resizable(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_decorations(webframe_window *window, bool decorations);
    WEBFRAME_EXPORT bool webframe_window_is_decorated(webframe_window *window);

    WEBFRAME_EXPORT void webframe_window_set_always_on_top(webframe_window *window, bool always_on_top);
    WEBFRAME_EXPORT bool webframe_window_is_always_on_top(webframe_window *window);

    /**
     * @brief Starts moving the window with the pointer. Call from a mouse-down handler.
     */
    WEBFRAME_EXPORT void webframe_window_start_drag(webframe_window *window);

    /**
     * @brief JSON object describing the monitor the window is on, or null if it cannot be determined.
     * @note Thread-local scratch, valid until the next call on this thread.
     */
    WEBFRAME_EXPORT const char *webframe_window_current_monitor(webframe_window *window);

#ifdef __cplusplus
}
#endif
