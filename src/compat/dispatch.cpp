#include "webframe/dispatch.h"

#include "app.hpp"

#include "guard.hpp"

extern "C"
{
    void webframe_invoke(webframe_app *app, webframe_invoke_callback callback, void *user_data)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_invoke");
            return;
        }

        if (!callback)
        {
            webframe::Fail("webframe_invoke", webframe::ErrorCode::kInvalidParameter, "callback is null");
            return;
        }

        webframe::GuardVoid("webframe_invoke",
                            [&] { app->app->Invoke([callback, user_data] { callback(user_data); }); });
    }

    bool webframe_invoke_sync(webframe_app *app, webframe_invoke_callback callback, void *user_data)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_invoke_sync");
            return false;
        }

        if (!callback)
        {
            webframe::Fail("webframe_invoke_sync", webframe::ErrorCode::kInvalidParameter, "callback is null");
            return false;
        }

        return webframe::Guard("webframe_invoke_sync", false, [&] {
            if (!app->app->InvokeSync([callback, user_data] { callback(user_data); }))
            {
                throw webframe::Error(webframe::ErrorCode::kEventLoopError,
                                      "event loop stopped before the work could run");
            }
            return true;
        });
    }
}
