#pragma once

#include "application.hpp"
#include "channel.hpp"

#include <memory>
#include <string>

struct webframe_app
{
    std::unique_ptr<webframe::Application> app;
};

struct webframe_proxy
{
    std::shared_ptr<webframe::EventChannel> channel;
};

namespace webframe::compat
{
    inline WindowEntry *entry(webframe_window *window)
    {
        return WindowEntry::From(window);
    }

    inline Application *application(webframe_app *app)
    {
        return app ? app->app.get() : nullptr;
    }
} // namespace webframe::compat
