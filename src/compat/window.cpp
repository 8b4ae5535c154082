#include "webframe/window.h"
#include "webframe/callbacks.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"
#include "serializer.hpp"

#include <cmath>
#include <limits>

using webframe::compat::entry;

namespace
{
    bool fits_int(double value)
    {
        return std::isfinite(value) && value >= static_cast<double>(std::numeric_limits<int>::min()) &&
               value <= static_cast<double>(std::numeric_limits<int>::max());
    }

    void check_size(double width, double height, const char *what)
    {
        if (!fits_int(width) || !fits_int(height) || width < 0 || height < 0)
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter,
                                  std::string(what) + " must be finite, non-negative and within int range");
        }
    }

    void check_position(double x, double y)
    {
        if (!fits_int(x) || !fits_int(y))
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "position must be finite and within int range");
        }
    }

    webframe::WindowConfig to_config(const webframe_window_params &params)
    {
        using webframe::compat::to_optional;
        using webframe::compat::to_string;

        check_size(params.width, params.height, "size");
        check_size(params.min_width, params.min_height, "minimum size");
        check_size(params.max_width, params.max_height, "maximum size");

        webframe::WindowConfig config;

        config.title          = to_string(params.title, "title");
        config.url            = to_optional(params.url, "url");
        config.html           = to_optional(params.html, "html");
        config.user_agent     = to_optional(params.user_agent, "user_agent");
        config.data_directory = to_optional(params.data_directory, "data_directory");

        if (config.url)
        {
            config.html.reset();
        }

        if (params.has_position)
        {
            check_position(params.x, params.y);
            config.position = webframe::Position{params.x, params.y};
        }

        config.size     = {params.width, params.height};
        config.min_size = {params.min_width, params.min_height};
        config.max_size = {params.max_width, params.max_height};

        config.resizable        = params.resizable;
        config.fullscreen       = params.fullscreen;
        config.maximized        = params.maximized;
        config.minimized        = params.minimized;
        config.visible          = params.visible;
        config.transparent      = params.transparent;
        config.decorations      = params.decorations;
        config.always_on_top    = params.always_on_top;
        config.devtools_enabled = params.devtools_enabled;
        config.autoplay_enabled = params.autoplay_enabled;

        return config;
    }

    template <typename Fn>
    void with_window(const char *where, webframe_window *window, Fn &&fn)
    {
        if (!window)
        {
            webframe::InvalidHandle(where);
            return;
        }

        webframe::GuardVoid(where, [&] { fn(*entry(window)->window); });
    }

    template <typename T, typename Fn>
    T query_window(const char *where, webframe_window *window, T fallback, Fn &&fn)
    {
        if (!window)
        {
            webframe::InvalidHandle(where);
            return fallback;
        }

        return webframe::Guard(where, fallback, [&] { return fn(*entry(window)->window); });
    }
} // namespace

extern "C"
{
    void webframe_window_params_default(webframe_window_params *params)
    {
        if (!params)
        {
            return;
        }

        *params = webframe_window_params{
            .title            = "",
            .url              = nullptr,
            .html             = nullptr,
            .user_agent       = nullptr,
            .data_directory   = nullptr,
            .has_position     = false,
            .x                = 0,
            .y                = 0,
            .width            = 800,
            .height           = 600,
            .min_width        = 0,
            .min_height       = 0,
            .max_width        = 0,
            .max_height       = 0,
            .resizable        = true,
            .fullscreen       = false,
            .maximized        = false,
            .minimized        = false,
            .visible          = true,
            .transparent      = false,
            .decorations      = true,
            .always_on_top    = false,
            .devtools_enabled = true,
            .autoplay_enabled = false,
        };
    }

    webframe_window *webframe_window_create(webframe_app *app, const webframe_window_params *params)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_window_create");
            return nullptr;
        }

        return webframe::Guard("webframe_window_create", static_cast<webframe_window *>(nullptr), [&] {
            webframe_window_params defaults;
            webframe_window_params_default(&defaults);

            return app->app->CreateWindow(to_config(params ? *params : defaults)).handle();
        });
    }

    void webframe_window_destroy(webframe_window *window)
    {
        if (!window)
        {
            return;
        }

        webframe::GuardVoid("webframe_window_destroy", [window] {
            auto *target = entry(window);
            target->app->DestroyWindow(target->id);
        });
    }

    bool webframe_window_post_destroy(webframe_window *window)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_post_destroy");
            return false;
        }

        return webframe::Guard("webframe_window_post_destroy", false, [window] {
            auto *target = entry(window);
            target->app->PostDestroy(target->id);
            return true;
        });
    }

    void webframe_window_close(webframe_window *window)
    {
        with_window("webframe_window_close", window, [](webframe::NativeWindow &native) { native.RequestClose(); });
    }

    uint64_t webframe_window_id(webframe_window *window)
    {
        return window ? entry(window)->id : 0;
    }

    webframe_app *webframe_window_app(webframe_window *window)
    {
        if (!window)
        {
            return nullptr;
        }

        return static_cast<webframe_app *>(entry(window)->app->host());
    }

    void webframe_window_set_visible(webframe_window *window, bool visible)
    {
        with_window("webframe_window_set_visible", window,
                    [visible](webframe::NativeWindow &native) { native.SetVisible(visible); });
    }

    bool webframe_window_is_visible(webframe_window *window)
    {
        return query_window("webframe_window_is_visible", window, false,
                            [](webframe::NativeWindow &native) { return native.Visible(); });
    }

    void webframe_window_set_title(webframe_window *window, const char *title)
    {
        with_window("webframe_window_set_title", window, [title](webframe::NativeWindow &native) {
            native.SetTitle(webframe::compat::to_string(title, "title"));
        });
    }

    const char *webframe_window_get_title(webframe_window *window)
    {
        return query_window("webframe_window_get_title", window, static_cast<const char *>(nullptr),
                            [](webframe::NativeWindow &native) { return webframe::compat::scratch(native.Title()); });
    }

    void webframe_window_set_size(webframe_window *window, double width, double height)
    {
        with_window("webframe_window_set_size", window, [width, height](webframe::NativeWindow &native) {
            check_size(width, height, "size");
            native.SetSize({width, height});
        });
    }

    webframe_size webframe_window_get_size(webframe_window *window)
    {
        return query_window("webframe_window_get_size", window, webframe_size{0, 0},
                            [](webframe::NativeWindow &native) {
                                const auto size = native.GetSize();
                                return webframe_size{size.width, size.height};
                            });
    }

    void webframe_window_set_min_size(webframe_window *window, double width, double height)
    {
        with_window("webframe_window_set_min_size", window, [width, height](webframe::NativeWindow &native) {
            check_size(width, height, "minimum size");
            native.SetMinSize({width, height});
        });
    }

    void webframe_window_set_max_size(webframe_window *window, double width, double height)
    {
        with_window("webframe_window_set_max_size", window, [width, height](webframe::NativeWindow &native) {
            check_size(width, height, "maximum size");
            native.SetMaxSize({width, height});
        });
    }

    void webframe_window_set_position(webframe_window *window, double x, double y)
    {
        with_window("webframe_window_set_position", window,
                    [x, y](webframe::NativeWindow &native) {
                        check_position(x, y);
                        native.SetPosition({x, y});
                    });
    }

    webframe_position webframe_window_get_position(webframe_window *window)
    {
        return query_window("webframe_window_get_position", window, webframe_position{0, 0},
                            [](webframe::NativeWindow &native) {
                                const auto position = native.GetPosition();
                                return webframe_position{position.x, position.y};
                            });
    }

    void webframe_window_minimize(webframe_window *window)
    {
        with_window("webframe_window_minimize", window,
                    [](webframe::NativeWindow &native) { native.SetMinimized(true); });
    }

    void webframe_window_maximize(webframe_window *window)
    {
        with_window("webframe_window_maximize", window,
                    [](webframe::NativeWindow &native) { native.SetMaximized(true); });
    }

    void webframe_window_unmaximize(webframe_window *window)
    {
        with_window("webframe_window_unmaximize", window,
                    [](webframe::NativeWindow &native) { native.SetMaximized(false); });
    }

    bool webframe_window_is_minimized(webframe_window *window)
    {
        return query_window("webframe_window_is_minimized", window, false,
                            [](webframe::NativeWindow &native) { return native.Minimized(); });
    }

    bool webframe_window_is_maximized(webframe_window *window)
    {
        return query_window("webframe_window_is_maximized", window, false,
                            [](webframe::NativeWindow &native) { return native.Maximized(); });
    }

    void webframe_window_set_fullscreen(webframe_window *window, bool fullscreen)
    {
        with_window("webframe_window_set_fullscreen", window,
                    [fullscreen](webframe::NativeWindow &native) { native.SetFullscreen(fullscreen); });
    }

    bool webframe_window_is_fullscreen(webframe_window *window)
    {
        return query_window("webframe_window_is_fullscreen", window, false,
                            [](webframe::NativeWindow &native) { return native.Fullscreen(); });
    }

    void webframe_window_focus(webframe_window *window)
    {
        with_window("webframe_window_focus", window, [](webframe::NativeWindow &native) { native.Focus(); });
    }

    bool webframe_window_is_focused(webframe_window *window)
    {
        return query_window("webframe_window_is_focused", window, false,
                            [](webframe::NativeWindow &native) { return native.Focused(); });
    }

    void webframe_window_set_resizable(webframe_window *window, bool resizable)
    {
        with_window("webframe_window_set_resizable", window,
                    [resizable](webframe::NativeWindow &native) { native.SetResizable(resizable); });
    }

    bool webframe_window_is_resizable(webframe_window *window)
    {
        return query_window("webframe_window_is_resizable", window, false,
                            [](webframe::NativeWindow &native) { return native.Resizable(); });
    }

    void webframe_window_set_decorations(webframe_window *window, bool decorations)
    {
        with_window("webframe_window_set_decorations", window,
                    [decorations](webframe::NativeWindow &native) { native.SetDecorated(decorations); });
    }

    bool webframe_window_is_decorated(webframe_window *window)
    {
        return query_window("webframe_window_is_decorated", window, false,
                            [](webframe::NativeWindow &native) { return native.Decorated(); });
    }

    void webframe_window_set_always_on_top(webframe_window *window, bool always_on_top)
    {
        with_window("webframe_window_set_always_on_top", window,
                    [always_on_top](webframe::NativeWindow &native) { native.SetAlwaysOnTop(always_on_top); });
    }

    bool webframe_window_is_always_on_top(webframe_window *window)
    {
        return query_window("webframe_window_is_always_on_top", window, false,
                            [](webframe::NativeWindow &native) { return native.AlwaysOnTop(); });
    }

    void webframe_window_start_drag(webframe_window *window)
    {
        with_window("webframe_window_start_drag", window, [](webframe::NativeWindow &native) { native.StartDrag(); });
    }

    const char *webframe_window_current_monitor(webframe_window *window)
    {
        return query_window("webframe_window_current_monitor", window, static_cast<const char *>(nullptr),
                            [](webframe::NativeWindow &native) -> const char * {
                                const auto monitor = native.CurrentMonitor();
                                if (!monitor)
                                {
                                    return nullptr;
                                }
                                return webframe::compat::scratch(webframe::SerializeMonitor(*monitor));
                            });
    }

    // ========================================================================
    // Callbacks
    // ========================================================================

    void webframe_window_set_message_callback(webframe_window *window, webframe_message_callback callback,
                                              void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_message_callback");
            return;
        }

        entry(window)->callbacks.message.Set(callback, user_data);
    }

    void webframe_window_set_closing_callback(webframe_window *window, webframe_closing_callback callback,
                                              void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_closing_callback");
            return;
        }

        entry(window)->callbacks.closing.Set(callback, user_data);
    }

    void webframe_window_set_resized_callback(webframe_window *window, webframe_resized_callback callback,
                                              void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_resized_callback");
            return;
        }

        entry(window)->callbacks.resized.Set(callback, user_data);
    }

    void webframe_window_set_moved_callback(webframe_window *window, webframe_moved_callback callback,
                                            void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_moved_callback");
            return;
        }

        entry(window)->callbacks.moved.Set(callback, user_data);
    }

    void webframe_window_set_focus_callback(webframe_window *window, webframe_focus_callback callback,
                                            void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_focus_callback");
            return;
        }

        entry(window)->callbacks.focus.Set(callback, user_data);
    }

    void webframe_window_set_navigation_callback(webframe_window *window, webframe_navigation_callback callback,
                                                 void *user_data)
    {
        if (!window)
        {
            webframe::InvalidHandle("webframe_window_set_navigation_callback");
            return;
        }

        entry(window)->callbacks.navigation.Set(callback, user_data);
    }
}
