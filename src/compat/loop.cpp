#include "webframe/loop.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"

extern "C"
{
    webframe_proxy *webframe_app_create_proxy(webframe_app *app)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_app_create_proxy");
            return nullptr;
        }

        return webframe::Guard("webframe_app_create_proxy", static_cast<webframe_proxy *>(nullptr),
                               [app] { return new webframe_proxy{.channel = app->app->channel()}; });
    }

    void webframe_proxy_free(webframe_proxy *proxy)
    {
        delete proxy;
    }

    bool webframe_proxy_send_user_event(webframe_proxy *proxy, const char *payload)
    {
        if (!proxy || !proxy->channel)
        {
            webframe::InvalidHandle("webframe_proxy_send_user_event");
            return false;
        }

        return webframe::Guard("webframe_proxy_send_user_event", false, [&] {
            return proxy->channel->Send(webframe::event::UserEvent{webframe::compat::to_string(payload, "payload")});
        });
    }

    bool webframe_proxy_send_menu_event(webframe_proxy *proxy, const char *menu_id)
    {
        if (!proxy || !proxy->channel)
        {
            webframe::InvalidHandle("webframe_proxy_send_menu_event");
            return false;
        }

        return webframe::Guard("webframe_proxy_send_menu_event", false, [&] {
            return proxy->channel->Send(webframe::event::MenuEvent{webframe::compat::to_string(menu_id, "menu_id")});
        });
    }

    bool webframe_proxy_send_tray_event(webframe_proxy *proxy, const char *tray_id, const char *event_type)
    {
        if (!proxy || !proxy->channel)
        {
            webframe::InvalidHandle("webframe_proxy_send_tray_event");
            return false;
        }

        return webframe::Guard("webframe_proxy_send_tray_event", false, [&] {
            return proxy->channel->Send(webframe::event::TrayEvent{
                webframe::compat::to_string(tray_id, "tray_id"),
                webframe::compat::to_string(event_type, "event_type"),
            });
        });
    }

    bool webframe_proxy_request_exit(webframe_proxy *proxy)
    {
        if (!proxy || !proxy->channel)
        {
            webframe::InvalidHandle("webframe_proxy_request_exit");
            return false;
        }

        return webframe::Guard("webframe_proxy_request_exit", false,
                               [proxy] { return proxy->channel->Send(webframe::message::Exit{}); });
    }
}
