#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef struct webframe_dialog_filter
    {
        const char *name;
        const char *const *extensions;
        size_t extension_count;
    } webframe_dialog_filter;

    typedef struct webframe_dialog_options
    {
        const char *title;
        const char *default_path;
        const webframe_dialog_filter *filters;
        size_t filter_count;
        bool directory;
        bool multiple;
    } webframe_dialog_options;

    typedef struct webframe_dialog_selection
    {
        char **paths;
        size_t count;
    } webframe_dialog_selection;

    /**
     * @note A cancelled dialog yields an empty selection and sets `WEBFRAME_ERROR_DIALOG_CANCELLED`.
     * @note Release the selection with `webframe_dialog_selection_free`.
     */
    WEBFRAME_EXPORT webframe_dialog_selection webframe_dialog_open(webframe_app *app,
                                                                   const webframe_dialog_options *options);

    /**
     * @return The chosen path, or null. Release it with `webframe_string_free`.
     */
    WEBFRAME_EXPORT char *webframe_dialog_save(webframe_app *app, const webframe_dialog_options *options);

    WEBFRAME_EXPORT void webframe_dialog_selection_free(webframe_dialog_selection *selection);

    /**
     * @brief Opens a path or url with the handler the desktop associates with it.
     */
    WEBFRAME_EXPORT bool webframe_desktop_open(webframe_app *app, const char *path);

#ifdef __cplusplus
}
#endif
