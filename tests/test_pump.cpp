// tests/test_pump.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "support.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace webframe::test;
using namespace std::chrono_literals;

TEST_CASE("exit on the first event stops the loop immediately") {
    ScopedApp app;

    Recorder recorder;
    recorder.on_event = [](glz::json_t&, const std::string&) { return WEBFRAME_CONTROL_FLOW_EXIT; };

    REQUIRE(recorder.pump(app).success);

    const std::vector<std::string> expected{"new-events", "loop-destroyed"};
    CHECK(recorder.types == expected);
}

TEST_CASE("wait blocks until a proxy event wakes the loop") {
    ScopedApp app;
    auto* proxy = webframe_app_create_proxy(app);
    REQUIRE(proxy != nullptr);

    std::thread sender;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "new-events") {
            sender = std::thread([proxy] {
                std::this_thread::sleep_for(20ms);
                webframe_proxy_send_user_event(proxy, "hello");
            });
        }
        if (type == "user-event")
            return WEBFRAME_CONTROL_FLOW_EXIT;
        return WEBFRAME_CONTROL_FLOW_WAIT;
    };

    REQUIRE(recorder.pump(app).success);
    sender.join();

    auto* event = recorder.first("user-event");
    REQUIRE(event != nullptr);
    CHECK((*event)["payload"].get<std::string>() == "hello");

    // A waiting loop does not spin while the sender sleeps.
    CHECK(recorder.count("main-events-cleared") <= 2);

    webframe_proxy_free(proxy);
}

TEST_CASE("proxy events are delivered in the order they were sent") {
    ScopedApp app;
    auto* proxy = webframe_app_create_proxy(app);
    REQUIRE(proxy != nullptr);

    // Accepted before the loop starts.
    CHECK(webframe_proxy_send_user_event(proxy, "{\"n\":1}"));
    CHECK(webframe_proxy_send_menu_event(proxy, "file.open"));
    CHECK(webframe_proxy_send_tray_event(proxy, "tray-1", "click"));
    CHECK(webframe_proxy_request_exit(proxy));

    Recorder recorder;
    REQUIRE(recorder.pump(app).success);

    const std::vector<std::string> expected{"new-events", "user-event", "menu-event", "tray-event", "user-exit",
                                            "loop-destroyed"};
    CHECK(recorder.significant() == expected);

    CHECK((*recorder.first("user-event"))["payload"].get<std::string>() == "{\"n\":1}");
    CHECK((*recorder.first("menu-event"))["menu_id"].get<std::string>() == "file.open");

    auto& tray = *recorder.first("tray-event");
    CHECK(tray["tray_id"].get<std::string>() == "tray-1");
    CHECK(tray["event_type"].get<std::string>() == "click");

    webframe_proxy_free(proxy);
}

TEST_CASE("proxy sends fail once the loop has stopped") {
    webframe_proxy* proxy = nullptr;

    {
        ScopedApp app;
        proxy = webframe_app_create_proxy(app);
        REQUIRE(proxy != nullptr);

        Recorder recorder;
        recorder.on_event = exit_after_first_iteration();
        REQUIRE(recorder.pump(app).success);

        CHECK_FALSE(webframe_proxy_send_user_event(proxy, "late"));
    }

    // The proxy outlives the application.
    CHECK_FALSE(webframe_proxy_send_menu_event(proxy, "late"));
    CHECK_FALSE(webframe_proxy_request_exit(proxy));

    webframe_proxy_free(proxy);
}

TEST_CASE("proxy payloads must be valid utf-8") {
    ScopedApp app;
    auto* proxy = webframe_app_create_proxy(app);
    REQUIRE(proxy != nullptr);

    CHECK_FALSE(webframe_proxy_send_user_event(proxy, "\xff\xfe"));
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_INVALID_PARAMETER);

    webframe_proxy_free(proxy);
}

TEST_CASE("pump without a callback behaves like run") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    webframe_window_close(window);

    const auto result = webframe_app_pump(app, nullptr, nullptr);
    CHECK(result.success);
    CHECK(webframe_app_window_count(app) == 0);
}

TEST_CASE("quit from another thread ends a waiting loop") {
    ScopedApp app{false};

    std::thread quitter;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "new-events") {
            quitter = std::thread([&app] {
                std::this_thread::sleep_for(10ms);
                webframe_app_quit(app);
            });
        }
        return WEBFRAME_CONTROL_FLOW_WAIT;
    };

    REQUIRE(recorder.pump(app).success);
    quitter.join();

    CHECK(recorder.count("user-exit") == 1);
    CHECK(recorder.types.back() == "loop-destroyed");
}

TEST_CASE("backend events without a dedicated record arrive as raw") {
    ScopedApp app;
    headless(app).SimulateRaw("decorations toggled");

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();
    REQUIRE(recorder.pump(app).success);

    auto* raw = recorder.first("raw");
    REQUIRE(raw != nullptr);
    CHECK((*raw)["debug"].get<std::string>() == "decorations toggled");
}

TEST_CASE("every delivered event is well-formed json") {
    ScopedApp app;
    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    const auto id = webframe_window_id(window);
    headless(app).SimulateResize(id, {1024, 768});
    headless(app).SimulateMove(id, {10, 20});
    headless(app).SimulateFocus(id, true);
    headless(app).SimulateRaw("with \"quotes\" and \\ backslash");

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();
    REQUIRE(recorder.pump(app).success);

    CHECK(recorder.malformed.empty());
    CHECK(recorder.count("window-resized") == 1);
    CHECK(recorder.count("window-moved") == 1);
    CHECK(recorder.count("window-focused") == 1);
}
