// tests/support.hpp
//
// Shared helpers for driving a headless application through the C API.

#pragma once

#include <webframe/webframe.h>

#include "app.hpp"
#include "platform_headless.hpp"

#include <glaze/glaze.hpp>
#include <glaze/json/generic.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace webframe::test {

inline webframe_app* create_headless_app(bool quit_on_last_window_closed = true) {
    webframe_app_options options;
    webframe_app_options_default(&options);

    options.id = "webframe.tests";
    options.backend = WEBFRAME_BACKEND_HEADLESS;
    options.quit_on_last_window_closed = quit_on_last_window_closed;

    return webframe_app_create_with_options(&options);
}

inline HeadlessBackend& headless(webframe_app* app) {
    return static_cast<HeadlessBackend&>(app->app->backend());
}

inline HeadlessWebview& webview_of(webframe_app* app, webframe_window* window) {
    return *headless(app).FindWebview(webframe_window_id(window));
}

inline std::string id_string(webframe_window* window) {
    return std::to_string(webframe_window_id(window));
}

// Destroys the application when the test scope ends.
class ScopedApp {
public:
    explicit ScopedApp(bool quit_on_last_window_closed = true)
        : app_(create_headless_app(quit_on_last_window_closed)) {}

    ~ScopedApp() { webframe_app_destroy(app_); }

    ScopedApp(const ScopedApp&) = delete;
    ScopedApp& operator=(const ScopedApp&) = delete;

    webframe_app* get() const { return app_; }
    operator webframe_app*() const { return app_; }

private:
    webframe_app* app_;
};

// ============================================================================
// Recorder
// Pump callback that keeps every event and lets a test steer the loop.
// Gives up after `max_iterations` loop iterations so a broken test cannot hang.
// ============================================================================

struct Recorder {
    using Handler = std::function<WEBFRAME_CONTROL_FLOW(glz::json_t& event, const std::string& type)>;

    std::deque<glz::json_t> events;
    std::vector<std::string> types;
    std::vector<std::string> malformed;

    Handler on_event;
    std::size_t max_iterations = 10000;
    std::size_t iterations = 0;

    static WEBFRAME_CONTROL_FLOW callback(const char* json, void* user_data) {
        auto& self = *static_cast<Recorder*>(user_data);

        auto parsed = glz::read_json<glz::json_t>(std::string_view{json});
        if (!parsed) {
            self.malformed.emplace_back(json);
            return WEBFRAME_CONTROL_FLOW_EXIT;
        }

        auto& event = self.events.emplace_back(std::move(*parsed));
        const auto type = event["type"].get<std::string>();
        self.types.push_back(type);

        auto flow = WEBFRAME_CONTROL_FLOW_POLL;
        if (self.on_event) {
            flow = self.on_event(event, type);
        }

        if (type == "main-events-cleared" && ++self.iterations >= self.max_iterations) {
            return WEBFRAME_CONTROL_FLOW_EXIT;
        }

        return flow;
    }

    webframe_result pump(webframe_app* app) {
        return webframe_app_pump(app, &Recorder::callback, this);
    }

    std::size_t count(std::string_view type) const {
        std::size_t n = 0;
        for (const auto& t : types) {
            if (t == type)
                ++n;
        }
        return n;
    }

    // First recorded event of `type`, or null.
    glz::json_t* first(std::string_view type) {
        for (std::size_t i = 0; i < types.size(); ++i) {
            if (types[i] == type)
                return &events[i];
        }
        return nullptr;
    }

    // Event types with the per-iteration bookkeeping filtered out.
    std::vector<std::string> significant() const {
        std::vector<std::string> out;
        for (const auto& t : types) {
            if (t != "main-events-cleared")
                out.push_back(t);
        }
        return out;
    }
};

// Stops the loop at the end of the first iteration.
inline Recorder::Handler exit_after_first_iteration() {
    return [](glz::json_t&, const std::string& type) {
        return type == "main-events-cleared" ? WEBFRAME_CONTROL_FLOW_EXIT : WEBFRAME_CONTROL_FLOW_POLL;
    };
}

} // namespace webframe::test
