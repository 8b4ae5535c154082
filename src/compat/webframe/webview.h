#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    WEBFRAME_EXPORT webframe_result webframe_webview_navigate(webframe_window *window, const char *url);
    WEBFRAME_EXPORT webframe_result webframe_webview_load_html(webframe_window *window, const char *html);

    /**
     * @brief Runs @p script in the page. Fire and forget: the result of the script is not returned.
     */
    WEBFRAME_EXPORT webframe_result webframe_webview_evaluate_script(webframe_window *window, const char *script);

    /**
     * @brief Delivers @p message to the page's `window.webframe.onmessage` handler. Safe to call from any thread.
     */
    WEBFRAME_EXPORT webframe_result webframe_webview_send_message(webframe_window *window, const char *message);

    /**
     * @return The current url, or null. Release it with `webframe_string_free`.
     */
    WEBFRAME_EXPORT char *webframe_webview_get_url(webframe_window *window);

    WEBFRAME_EXPORT webframe_result webframe_webview_set_zoom(webframe_window *window, double zoom);

    /**
     * @note No-op for windows created with `devtools_enabled` unset.
     */
    WEBFRAME_EXPORT void webframe_webview_open_devtools(webframe_window *window);
    WEBFRAME_EXPORT void webframe_webview_close_devtools(webframe_window *window);
    WEBFRAME_EXPORT bool webframe_webview_is_devtools_open(webframe_window *window);

    WEBFRAME_EXPORT void webframe_webview_reload(webframe_window *window);
    WEBFRAME_EXPORT void webframe_webview_go_back(webframe_window *window);
    WEBFRAME_EXPORT void webframe_webview_go_forward(webframe_window *window);

#ifdef __cplusplus
}
#endif
