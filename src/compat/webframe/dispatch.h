#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef void (*webframe_invoke_callback)(void *user_data);

    /**
     * @brief Runs @p callback on the loop thread. Returns immediately.
     * @note If the work cannot be queued it is dropped and the reason is stored as the last error.
     */
    WEBFRAME_EXPORT void webframe_invoke(webframe_app *app, webframe_invoke_callback callback, void *user_data);

    /**
     * @brief Runs @p callback on the loop thread and blocks until it has finished.
     * @return False if the work was never run, because the loop stopped first or because the caller is the loop
     * thread itself.
     */
    WEBFRAME_EXPORT bool webframe_invoke_sync(webframe_app *app, webframe_invoke_callback callback, void *user_data);

#ifdef __cplusplus
}
#endif
