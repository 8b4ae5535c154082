#include "webframe/error.h"

#include "error.hpp"
#include "guard.hpp"
#include "log.hpp"

#include <cstdlib>

namespace
{
    constexpr std::uint32_t abi_version = 2;
}

extern "C"
{
    const char *webframe_get_last_error(void)
    {
        return webframe::last_error::Message();
    }

    int32_t webframe_get_last_error_code(void)
    {
        return static_cast<int32_t>(webframe::last_error::Code());
    }

    void webframe_clear_last_error(void)
    {
        webframe::last_error::Clear();
    }

    void webframe_set_log_callback(webframe_log_callback callback, void *user_data)
    {
        webframe::GuardVoid("webframe_set_log_callback", [&] {
            if (!callback)
            {
                webframe::log::SetHostCallback({});
                return;
            }

            webframe::log::SetHostCallback([callback, user_data](spdlog::level::level_enum level, const char *message)
                                           { callback(static_cast<WEBFRAME_LOG_LEVEL>(level), message, user_data); });
        });
    }

    void webframe_set_log_level(WEBFRAME_LOG_LEVEL level)
    {
        if (level < WEBFRAME_LOG_LEVEL_TRACE || level > WEBFRAME_LOG_LEVEL_OFF)
        {
            webframe::Fail("webframe_set_log_level", webframe::ErrorCode::kInvalidParameter, "unknown log level");
            return;
        }

        webframe::GuardVoid("webframe_set_log_level",
                            [level] { webframe::log::SetLevel(static_cast<spdlog::level::level_enum>(level)); });
    }

    const char *webframe_version(void)
    {
        return WEBFRAME_VERSION_STRING;
    }

    uint32_t webframe_abi_version(void)
    {
        return abi_version;
    }

    const char *webframe_library_name(void)
    {
        return "webframe";
    }

    void webframe_string_free(char *string)
    {
        std::free(string);
    }
}
