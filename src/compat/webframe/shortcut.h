#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef void (*webframe_shortcut_callback)(uint32_t id, void *user_data);

    /**
     * @brief Registers a system-wide shortcut such as `CmdOrCtrl+Shift+K`.
     * @return A non-zero id, or 0 on failure.
     */
    WEBFRAME_EXPORT uint32_t webframe_shortcut_register(webframe_app *app, const char *accelerator);
    WEBFRAME_EXPORT bool webframe_shortcut_unregister(webframe_app *app, uint32_t id);
    WEBFRAME_EXPORT void webframe_shortcut_unregister_all(webframe_app *app);

    /**
     * @brief Invoked on the loop thread whenever a registered shortcut fires.
     * @note Pumped loops additionally receive a `global-shortcut` event.
     */
    WEBFRAME_EXPORT void webframe_app_set_shortcut_callback(webframe_app *app, webframe_shortcut_callback callback,
                                                            void *user_data);

#ifdef __cplusplus
}
#endif
