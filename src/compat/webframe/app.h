#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef enum WEBFRAME_BACKEND
    {
        WEBFRAME_BACKEND_NATIVE   = 0,
        WEBFRAME_BACKEND_HEADLESS = 1,
    } WEBFRAME_BACKEND;

    typedef struct webframe_app_options
    {
        const char *id;
        WEBFRAME_BACKEND backend;
        bool quit_on_last_window_closed;
    } webframe_app_options;

    /**
     * @brief Receives every event of a pumped loop as a JSON record with a `type` discriminator.
     * @return How the loop should continue.
     */
    typedef WEBFRAME_CONTROL_FLOW (*webframe_event_callback)(const char *event, void *user_data);

    WEBFRAME_EXPORT void webframe_app_options_default(webframe_app_options *options);

    WEBFRAME_EXPORT webframe_app *webframe_app_create(void);
    WEBFRAME_EXPORT webframe_app *webframe_app_create_with_options(const webframe_app_options *options);

    /**
     * @brief Releases the application and every window it still owns.
     * @note Refused while the loop of @p app is running.
     */
    WEBFRAME_EXPORT void webframe_app_destroy(webframe_app *app);

    /**
     * @brief Runs the event loop on the calling thread until it exits.
     * @note The loop can only be run once per application.
     */
    WEBFRAME_EXPORT webframe_result webframe_app_run(webframe_app *app);

    /**
     * @brief Like `webframe_app_run`, but delivers every event to @p callback and lets it steer the loop.
     */
    WEBFRAME_EXPORT webframe_result webframe_app_pump(webframe_app *app, webframe_event_callback callback,
                                                      void *user_data);

    /**
     * @brief Asks the loop to exit after the current iteration. Safe to call from any thread.
     */
    WEBFRAME_EXPORT void webframe_app_quit(webframe_app *app);

    WEBFRAME_EXPORT size_t webframe_app_window_count(webframe_app *app);
    WEBFRAME_EXPORT bool webframe_app_is_running(webframe_app *app);

    WEBFRAME_EXPORT const char *webframe_app_backend_name(webframe_app *app);
    WEBFRAME_EXPORT const char *webframe_backend_version(webframe_app *app);

    /**
     * @brief JSON array describing every monitor.
     * @note Thread-local scratch, valid until the next call on this thread.
     */
    WEBFRAME_EXPORT const char *webframe_app_available_monitors(webframe_app *app);

#ifdef __cplusplus
}
#endif
