#include "webframe/desktop.h"

#include "app.hpp"
#include "string.hpp"

#include "guard.hpp"

#include <cstdlib>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    using webframe::DialogRequest;

    std::string to_pattern(std::string_view extension)
    {
        if (extension.starts_with("*."))
        {
            extension.remove_prefix(2);
        }
        else if (extension.starts_with('.'))
        {
            extension.remove_prefix(1);
        }

        if (extension.empty() || extension == "*")
        {
            return "*";
        }

        return "*." + std::string{extension};
    }

    DialogRequest to_request(const webframe_dialog_options *options, DialogRequest::Kind kind)
    {
        DialogRequest rtn;
        rtn.kind = kind;

        if (!options)
        {
            return rtn;
        }

        rtn.title        = webframe::compat::to_string(options->title, "title");
        rtn.default_path = webframe::compat::to_optional(options->default_path, "default_path");

        if (options->filter_count > 0 && !options->filters)
        {
            throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "filters are null");
        }

        for (std::size_t i = 0; i < options->filter_count; ++i)
        {
            const auto &filter = options->filters[i];

            if (filter.extension_count > 0 && !filter.extensions)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "filter extensions are null");
            }

            for (std::size_t k = 0; k < filter.extension_count; ++k)
            {
                if (filter.extensions[k])
                {
                    rtn.filters.push_back(to_pattern(webframe::compat::to_string(filter.extensions[k], "extension")));
                }
            }
        }

        return rtn;
    }

    DialogRequest::Kind open_kind(const webframe_dialog_options *options)
    {
        if (options && options->directory)
        {
            return DialogRequest::Kind::kOpenFolder;
        }

        if (options && options->multiple)
        {
            return DialogRequest::Kind::kOpenFiles;
        }

        return DialogRequest::Kind::kOpenFile;
    }

    std::vector<std::string> pick(webframe_app *app, const DialogRequest &request)
    {
        auto result = app->app->backend().PickPaths(request);

        if (!result || result->empty())
        {
            throw webframe::Error(webframe::ErrorCode::kDialogCancelled, "dialog was cancelled");
        }

        return std::move(result).value();
    }
} // namespace

extern "C"
{
    webframe_dialog_selection webframe_dialog_open(webframe_app *app, const webframe_dialog_options *options)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_dialog_open");
            return {nullptr, 0};
        }

        return webframe::Guard("webframe_dialog_open", webframe_dialog_selection{nullptr, 0}, [&] {
            const auto paths = pick(app, to_request(options, open_kind(options)));

            auto **rtn = static_cast<char **>(std::calloc(paths.size(), sizeof(char *)));
            if (!rtn)
            {
                throw webframe::Error(webframe::ErrorCode::kUnknown, "out of memory");
            }

            webframe_dialog_selection selection{rtn, paths.size()};

            try
            {
                for (std::size_t i = 0; i < paths.size(); ++i)
                {
                    rtn[i] = webframe::compat::alloc(paths[i]);
                }
            }
            catch (const webframe::Error &)
            {
                webframe_dialog_selection_free(&selection);
                throw;
            }

            return selection;
        });
    }

    char *webframe_dialog_save(webframe_app *app, const webframe_dialog_options *options)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_dialog_save");
            return nullptr;
        }

        return webframe::Guard("webframe_dialog_save", static_cast<char *>(nullptr), [&] {
            const auto paths = pick(app, to_request(options, DialogRequest::Kind::kSave));
            return webframe::compat::alloc(paths.front());
        });
    }

    void webframe_dialog_selection_free(webframe_dialog_selection *selection)
    {
        if (!selection || !selection->paths)
        {
            return;
        }

        for (std::size_t i = 0; i < selection->count; ++i)
        {
            std::free(selection->paths[i]);
        }

        std::free(selection->paths);

        selection->paths = nullptr;
        selection->count = 0;
    }

    bool webframe_desktop_open(webframe_app *app, const char *path)
    {
        if (!app || !app->app)
        {
            webframe::InvalidHandle("webframe_desktop_open");
            return false;
        }

        return webframe::Guard("webframe_desktop_open", false, [&] {
            if (!path || !*path)
            {
                throw webframe::Error(webframe::ErrorCode::kInvalidParameter, "path is empty");
            }

            return app->app->backend().OpenExternal(webframe::compat::to_string(path, "path"));
        });
    }
}
