#include "webframe/shortcut.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"

extern "C"
{
    uint32_t webframe_shortcut_register(webframe_app *app, const char *accelerator)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_shortcut_register");
            return 0;
        }

        return webframe::Guard("webframe_shortcut_register", std::uint32_t{0}, [&] {
            if (!accelerator)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "accelerator is null");
            }

            return app->app->shortcuts().Register(webframe::compat::to_string(accelerator, "accelerator"));
        });
    }

    bool webframe_shortcut_unregister(webframe_app *app, uint32_t id)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_shortcut_unregister");
            return false;
        }

        return webframe::Guard("webframe_shortcut_unregister", false,
                               [&] { return app->app->shortcuts().Unregister(id); });
    }

    void webframe_shortcut_unregister_all(webframe_app *app)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_shortcut_unregister_all");
            return;
        }

        webframe::GuardVoid("webframe_shortcut_unregister_all", [app] { app->app->shortcuts().UnregisterAll(); });
    }

    void webframe_app_set_shortcut_callback(webframe_app *app, webframe_shortcut_callback callback, void *user_data)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_app_set_shortcut_callback");
            return;
        }

        if (!callback)
        {
            app->app->SetShortcutHandler({});
            return;
        }

        app->app->SetShortcutHandler([callback, user_data](std::uint32_t id) { callback(id, user_data); });
    }
}
