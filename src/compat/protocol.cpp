#include "webframe/protocol.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"
#include "log.hpp"

extern "C"
{
    webframe_result webframe_register_protocol(webframe_app *app, const char *scheme, webframe_protocol_handler handler,
                                               void *user_data)
    {
        if (!app || !app->app)
        {
            return webframe::InvalidHandle("webframe_register_protocol");
        }

        return webframe::GuardResult("webframe_register_protocol", [&] {
            if (!scheme)
            {
                throw webframe::Error(webframe::ErrorCode::kProtocolError, "scheme is null");
            }

            auto name = webframe::compat::to_string(scheme, "scheme");

            app->app->protocols().Register(name, {.callback = handler, .user_data = user_data});

            if (app->app->WindowCount() > 0)
            {
                webframe::log::Get()->info("'{}' protocol registered after windows were created; only new windows use it",
                                           name);
            }
        });
    }

    bool webframe_unregister_protocol(webframe_app *app, const char *scheme)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_unregister_protocol");
            return false;
        }

        if (!scheme)
        {
            return false;
        }

        return webframe::Guard("webframe_unregister_protocol", false,
                               [&] { return app->app->protocols().Unregister(scheme); });
    }
}
