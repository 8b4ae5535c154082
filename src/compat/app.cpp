#include "webframe/app.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"
#include "log.hpp"
#include "platform.hpp"
#include "serializer.hpp"

#include <memory>
#include <utility>

namespace
{
    webframe::AppOptions to_options(const webframe_app_options &options)
    {
        webframe::AppOptions rtn;

        if (options.id)
        {
            rtn.id = webframe::compat::to_string(options.id, "id");
        }

        if (rtn.id.empty())
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "application id is empty");
        }

        rtn.quit_on_last_window_closed = options.quit_on_last_window_closed;
        return rtn;
    }

    std::unique_ptr<webframe::Backend> make_backend(WEBFRAME_BACKEND backend, const std::string &id)
    {
        switch (backend)
        {
        case WEBFRAME_BACKEND_NATIVE:
            return webframe::CreateSaucerBackend(id);
        case WEBFRAME_BACKEND_HEADLESS:
            return webframe::CreateHeadlessBackend();
        }

        throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "unknown backend");
    }

    webframe_result run(const char *where, webframe_app *app, webframe::Application::EventHandler handler)
    {
        if (!app || !app->app)
        {
            return webframe::InvalidHandle(where);
        }

        return webframe::GuardResult(where, [&] { app->app->Run(std::move(handler)); });
    }
} // namespace

extern "C"
{
    void webframe_app_options_default(webframe_app_options *options)
    {
        if (!options)
        {
            return;
        }

        *options = webframe_app_options{
            .id                         = "webframe",
            .backend                    = WEBFRAME_BACKEND_NATIVE,
            .quit_on_last_window_closed = true,
        };
    }

    webframe_app *webframe_app_create(void)
    {
        webframe_app_options options;
        webframe_app_options_default(&options);

        return webframe_app_create_with_options(&options);
    }

    webframe_app *webframe_app_create_with_options(const webframe_app_options *options)
    {
        if (!options)
        {
            webframe::Fail("webframe_app_create_with_options", webframe::ErrorCode::kInvalidParameter,
                           "options are null");
            return nullptr;
        }

        return webframe::Guard("webframe_app_create_with_options", static_cast<webframe_app *>(nullptr), [&] {
            auto converted = to_options(*options);
            auto backend   = make_backend(options->backend, converted.id);

            auto rtn = std::make_unique<webframe_app>();
            rtn->app = std::make_unique<webframe::Application>(std::move(backend), std::move(converted));
            rtn->app->set_host(rtn.get());

            return rtn.release();
        });
    }

    void webframe_app_destroy(webframe_app *app)
    {
        if (!app)
        {
            return;
        }

        if (app->app && app->app->state() == webframe::LoopState::kRunning)
        {
            webframe::Fail("webframe_app_destroy", webframe::ErrorCode::kEventLoopError,
                           "cannot destroy an application while its event loop is running");
            return;
        }

        webframe::GuardVoid("webframe_app_destroy", [app] { delete app; });
    }

    webframe_result webframe_app_run(webframe_app *app)
    {
        return run("webframe_app_run", app, {});
    }

    webframe_result webframe_app_pump(webframe_app *app, webframe_event_callback callback, void *user_data)
    {
        if (!callback)
        {
            return run("webframe_app_pump", app, {});
        }

        return run("webframe_app_pump", app, [callback, user_data](const webframe::Event &event) {
            const auto json = webframe::Serialize(event);

            switch (callback(json.c_str(), user_data))
            {
            case WEBFRAME_CONTROL_FLOW_WAIT:
                return webframe::ControlFlow::kWait;
            case WEBFRAME_CONTROL_FLOW_EXIT:
                return webframe::ControlFlow::kExit;
            case WEBFRAME_CONTROL_FLOW_POLL:
                break;
            }

            return webframe::ControlFlow::kPoll;
        });
    }

    void webframe_app_quit(webframe_app *app)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_app_quit");
            return;
        }

        webframe::GuardVoid("webframe_app_quit", [app] { app->app->Quit(); });
    }

    size_t webframe_app_window_count(webframe_app *app)
    {
        if (!app || !app->app)
        {
            return 0;
        }

        return app->app->WindowCount();
    }

    bool webframe_app_is_running(webframe_app *app)
    {
        return app && app->app && app->app->state() == webframe::LoopState::kRunning;
    }

    const char *webframe_app_backend_name(webframe_app *app)
    {
        if (!app || !app->app)
        {
            return nullptr;
        }

        return app->app->backend().Name();
    }

    const char *webframe_backend_version(webframe_app *app)
    {
        if (!app || !app->app)
        {
            return nullptr;
        }

        return webframe::Guard("webframe_backend_version", static_cast<const char *>(nullptr),
                               [app] { return webframe::compat::scratch(app->app->backend().Version()); });
    }

    const char *webframe_app_available_monitors(webframe_app *app)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_app_available_monitors");
            return nullptr;
        }

        return webframe::Guard("webframe_app_available_monitors", static_cast<const char *>(nullptr), [app] {
            return webframe::compat::scratch(webframe::SerializeMonitors(app->app->backend().Monitors()));
        });
    }
}
