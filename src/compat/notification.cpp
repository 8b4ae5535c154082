#include "webframe/notification.h"

#include "string.hpp"

#include "guard.hpp"
#include "platform.hpp"

namespace
{
    webframe::Notification to_notification(const webframe_notification_options &options)
    {
        using webframe::compat::to_string;

        if (!options.title || !*options.title)
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "notification title is required");
        }

        if (options.timeout_ms < -1)
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "timeout must be -1 or greater");
        }

        webframe::Notification rtn;

        rtn.title      = to_string(options.title, "title");
        rtn.body       = to_string(options.body, "body");
        rtn.icon       = to_string(options.icon, "icon");
        rtn.timeout_ms = options.timeout_ms;

        switch (options.urgency)
        {
        case WEBFRAME_URGENCY_LOW:
            rtn.urgency = webframe::Urgency::kLow;
            break;
        case WEBFRAME_URGENCY_NORMAL:
            rtn.urgency = webframe::Urgency::kNormal;
            break;
        case WEBFRAME_URGENCY_CRITICAL:
            rtn.urgency = webframe::Urgency::kCritical;
            break;
        default:
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "unknown urgency");
        }

        return rtn;
    }
} // namespace

extern "C"
{
    void webframe_notification_options_default(webframe_notification_options *options)
    {
        if (!options)
        {
            return;
        }

        *options = webframe_notification_options{
            .title      = nullptr,
            .body       = nullptr,
            .icon       = nullptr,
            .timeout_ms = -1,
            .urgency    = WEBFRAME_URGENCY_NORMAL,
        };
    }

    bool webframe_notification_show(const webframe_notification_options *options)
    {
        if (!options)
        {
            webframe::Fail("webframe_notification_show", webframe::ErrorCode::kInvalidParameter, "options are null");
            return false;
        }

        return webframe::Guard("webframe_notification_show", false, [options] {
            webframe::platform::ShowNotification(to_notification(*options));
            return true;
        });
    }
}
