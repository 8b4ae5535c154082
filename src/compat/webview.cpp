#include "webframe/webview.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"
#include "log.hpp"

#include <cmath>

using webframe::compat::entry;

namespace
{
    template <typename Fn>
    webframe_result with_webview(const char *where, webframe_window *window, Fn &&fn)
    {
        if (!window)
        {
            return webframe::InvalidHandle(where);
        }

        return webframe::GuardResult(where, [&] { fn(*entry(window)); });
    }

    template <typename Fn>
    void with_webview_void(const char *where, webframe_window *window, Fn &&fn)
    {
        if (!window)
        {
            webframe::InvalidHandle(where);
            return;
        }

        webframe::GuardVoid(where, [&] { fn(*entry(window)); });
    }
} // namespace

extern "C"
{
    webframe_result webframe_webview_navigate(webframe_window *window, const char *url)
    {
        return with_webview("webframe_webview_navigate", window, [url](webframe::WindowEntry &target) {
            if (!url || !*url)
            {
                throw webframe::Error(webframe::ErrorCode::kNavigationFailed, "url is empty");
            }

            target.webview->Navigate(webframe::compat::to_string(url, "url"));
        });
    }

    webframe_result webframe_webview_load_html(webframe_window *window, const char *html)
    {
        return with_webview("webframe_webview_load_html", window, [html](webframe::WindowEntry &target) {
            if (!html)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "html is null");
            }

            target.webview->LoadHtml(webframe::compat::to_string(html, "html"));
        });
    }

    webframe_result webframe_webview_evaluate_script(webframe_window *window, const char *script)
    {
        return with_webview("webframe_webview_evaluate_script", window, [script](webframe::WindowEntry &target) {
            if (!script)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "script is null");
            }

            target.webview->Evaluate(webframe::compat::to_string(script, "script"));
        });
    }

    webframe_result webframe_webview_send_message(webframe_window *window, const char *message)
    {
        return with_webview("webframe_webview_send_message", window, [message](webframe::WindowEntry &target) {
            if (!message)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "message is null");
            }

            target.app->PostToWebview(target.id, webframe::compat::to_string(message, "message"));
        });
    }

    char *webframe_webview_get_url(webframe_window *window)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_webview_get_url");
            return nullptr;
        }

        return webframe::Guard("webframe_webview_get_url", static_cast<char *>(nullptr), [window]() -> char * {
            const auto url = entry(window)->webview->Url();
            if (!url)
            {
                return nullptr;
            }

            return webframe::compat::alloc(*url);
        });
    }

    webframe_result webframe_webview_set_zoom(webframe_window *window, double zoom)
    {
        return with_webview("webframe_webview_set_zoom", window, [zoom](webframe::WindowEntry &target) {
            if (!std::isfinite(zoom))
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "zoom must be finite");
            }

            target.webview->SetZoom(zoom);
        });
    }

    void webframe_webview_open_devtools(webframe_window *window)
    {
        with_webview_void("webframe_webview_open_devtools", window, [](webframe::WindowEntry &target) {
            if (!target.devtools_enabled)
            {
                webframe::log::Get()->debug("devtools are disabled for window {}", target.id);
                return;
            }

            target.webview->SetDevtoolsOpen(true);
        });
    }

    void webframe_webview_close_devtools(webframe_window *window)
    {
        with_webview_void("webframe_webview_close_devtools", window, [](webframe::WindowEntry &target) {
            if (!target.devtools_enabled)
            {
                return;
            }

            target.webview->SetDevtoolsOpen(false);
        });
    }

    bool webframe_webview_is_devtools_open(webframe_window *window)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_webview_is_devtools_open");
            return false;
        }

        return webframe::Guard("webframe_webview_is_devtools_open", false,
                               [window] { return entry(window)->webview->DevtoolsOpen(); });
    }

    void webframe_webview_reload(webframe_window *window)
    {
        with_webview_void("webframe_webview_reload", window,
                          [](webframe::WindowEntry &target) { target.webview->Reload(); });
    }

    void webframe_webview_go_back(webframe_window *window)
    {
        with_webview_void("webframe_webview_go_back", window,
                          [](webframe::WindowEntry &target) { target.webview->Back(); });
    }

    void webframe_webview_go_forward(webframe_window *window)
    {
        with_webview_void("webframe_webview_go_forward", window,
                          [](webframe::WindowEntry &target) { target.webview->Forward(); });
    }
}
