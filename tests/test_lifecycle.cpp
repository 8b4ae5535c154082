// tests/test_lifecycle.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "support.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace webframe::test;

namespace {

struct CloseVotes {
    std::vector<bool> answers;
    std::size_t asked = 0;
};

bool vote_on_close(webframe_window*, void* user_data) {
    auto& votes = *static_cast<CloseVotes*>(user_data);
    const bool answer = votes.asked < votes.answers.size() ? votes.answers[votes.asked] : true;
    ++votes.asked;
    return answer;
}

void destroy_self(webframe_window* window, const char*, void*) {
    webframe_window_destroy(window);
}

} // namespace

TEST_CASE("closing callback can deny and later allow a close") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    const auto id = webframe_window_id(window);

    CloseVotes votes{{false, true}};
    webframe_window_set_closing_callback(window, &vote_on_close, &votes);

    headless(app).SimulateCloseRequest(id);
    headless(app).SimulateCloseRequest(id);

    Recorder recorder;
    const auto result = recorder.pump(app);

    REQUIRE(result.success);
    CHECK(votes.asked == 2);
    CHECK(recorder.count("window-close-requested") == 2);
    CHECK(recorder.count("window-destroyed") == 1);
    CHECK(webframe_app_window_count(app) == 0);

    // Closing the last window ends the loop.
    REQUIRE_FALSE(recorder.types.empty());
    CHECK(recorder.types.back() == "loop-destroyed");
}

TEST_CASE("window without a closing callback closes on request") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    const auto id = id_string(window);
    webframe_window_close(window);

    Recorder recorder;
    REQUIRE(recorder.pump(app).success);

    auto* destroyed = recorder.first("window-destroyed");
    REQUIRE(destroyed != nullptr);
    CHECK((*destroyed)["window_id"].get<std::string>() == id);
    CHECK(webframe_app_window_count(app) == 0);
}

TEST_CASE("loop keeps running after the last window when quit_on_last_window_closed is off") {
    ScopedApp app{false};
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    webframe_window_close(window);

    bool destroyed = false;
    int iterations_after = 0;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "window-destroyed") {
            destroyed = true;
        } else if (type == "main-events-cleared" && destroyed && ++iterations_after == 3) {
            webframe_app_quit(app);
        }
        return WEBFRAME_CONTROL_FLOW_POLL;
    };

    REQUIRE(recorder.pump(app).success);

    CHECK(destroyed);
    CHECK(iterations_after >= 3);
    CHECK(recorder.count("user-exit") == 1);
}

TEST_CASE("event sequence starts with new-events and ends with loop-destroyed") {
    ScopedApp app;

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();

    REQUIRE(recorder.pump(app).success);
    REQUIRE(recorder.types.size() >= 3);

    CHECK(recorder.types.front() == "new-events");
    CHECK(recorder.types.back() == "loop-destroyed");
    CHECK(recorder.count("loop-destroyed") == 1);

    auto* started = recorder.first("new-events");
    REQUIRE(started != nullptr);
    CHECK((*started)["cause"].get<std::string>() == "init");
}

TEST_CASE("running a loop twice reports an event loop error") {
    ScopedApp app;

    Recorder first;
    first.on_event = exit_after_first_iteration();
    REQUIRE(first.pump(app).success);

    const auto again = webframe_app_run(app);
    CHECK_FALSE(again.success);
    CHECK(again.error_code == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
    REQUIRE(again.error_message != nullptr);
    CHECK(std::string{again.error_message} == webframe_get_last_error());
}

TEST_CASE("windows cannot be created after the loop stopped") {
    ScopedApp app;

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();
    REQUIRE(recorder.pump(app).success);

    webframe_clear_last_error();
    CHECK(webframe_window_create(app, nullptr) == nullptr);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
}

TEST_CASE("backend failure ends the loop with an event loop error") {
    ScopedApp app;
    headless(app).SimulateFailure("display connection lost");

    Recorder recorder;
    const auto result = recorder.pump(app);

    CHECK_FALSE(result.success);
    CHECK(result.error_code == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
    REQUIRE(result.error_message != nullptr);
    CHECK(std::string{result.error_message}.find("display connection lost") != std::string::npos);

    REQUIRE_FALSE(recorder.types.empty());
    CHECK(recorder.types.back() == "loop-destroyed");
    CHECK_FALSE(webframe_app_is_running(app));
}

TEST_CASE("destroying the application from inside its loop is refused") {
    ScopedApp app;

    int32_t refused_with = 0;
    bool running_inside = false;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type != "new-events")
            return WEBFRAME_CONTROL_FLOW_POLL;

        running_inside = webframe_app_is_running(app);
        webframe_app_destroy(app);
        refused_with = webframe_get_last_error_code();
        return WEBFRAME_CONTROL_FLOW_EXIT;
    };

    CHECK_FALSE(webframe_app_is_running(app));
    REQUIRE(recorder.pump(app).success);

    CHECK(running_inside);
    CHECK(refused_with == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
    CHECK_FALSE(webframe_app_is_running(app));
}

TEST_CASE("window destroyed from its own message callback is released safely") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    webframe_window_set_message_callback(window, &destroy_self, nullptr);
    headless(app).SimulateMessage(webframe_window_id(window), "goodbye");

    Recorder recorder;
    REQUIRE(recorder.pump(app).success);

    CHECK(recorder.count("window-destroyed") == 1);
    CHECK(webframe_app_window_count(app) == 0);
}

TEST_CASE("post_destroy from another thread removes the window on the loop thread") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    bool posted = false;
    std::thread worker;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "new-events") {
            worker = std::thread([&] { posted = webframe_window_post_destroy(window); });
        }
        return WEBFRAME_CONTROL_FLOW_WAIT;
    };

    REQUIRE(recorder.pump(app).success);
    worker.join();

    CHECK(posted);
    CHECK(recorder.count("window-destroyed") == 1);
    CHECK(webframe_app_window_count(app) == 0);
}

TEST_CASE("destroying a window outside the loop skips the closing callback") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    CloseVotes votes{{false}};
    webframe_window_set_closing_callback(window, &vote_on_close, &votes);

    webframe_window_destroy(window);

    CHECK(votes.asked == 0);
    CHECK(webframe_app_window_count(app) == 0);
}
