// tests/test_serializer.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "serializer.hpp"

#include <glaze/glaze.hpp>
#include <glaze/json/generic.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

glz::json_t parse(const std::string& json) {
    auto parsed = glz::read_json<glz::json_t>(json);
    REQUIRE_MESSAGE(parsed.has_value(), "not json: " << json);
    return std::move(*parsed);
}

std::string type_of(const webframe::Event& event) {
    return parse(webframe::Serialize(event))["type"].get<std::string>();
}

} // namespace

TEST_CASE("every event maps to its type discriminator") {
    using namespace webframe::event;

    const std::vector<std::pair<webframe::Event, std::string>> vocabulary{
        {NewEvents{"init"}, "new-events"},
        {MainEventsCleared{}, "main-events-cleared"},
        {LoopDestroyed{}, "loop-destroyed"},
        {CloseRequested{1}, "window-close-requested"},
        {Destroyed{1}, "window-destroyed"},
        {Resized{1, {1, 2}}, "window-resized"},
        {Moved{1, {3, 4}}, "window-moved"},
        {Focused{1, true}, "window-focused"},
        {Minimized{1, true}, "window-minimized"},
        {Maximized{1, false}, "window-maximized"},
        {Navigated{1, "https://example.com"}, "webview-navigated"},
        {PageLoad{1, false}, "webview-page-load"},
        {TitleChanged{1, "t"}, "webview-title-changed"},
        {UserExit{}, "user-exit"},
        {UserEvent{"p"}, "user-event"},
        {MenuEvent{"m"}, "menu-event"},
        {TrayEvent{"t", "click"}, "tray-event"},
        {GlobalShortcut{7, "Ctrl+K", {}}, "global-shortcut"},
        {Raw{"?"}, "raw"},
    };

    CHECK(vocabulary.size() == std::variant_size_v<webframe::Event>);

    for (const auto& [event, expected] : vocabulary) {
        INFO("expected " << expected);
        CHECK(type_of(event) == expected);
    }
}

TEST_CASE("type is the first key of every record") {
    const auto json = webframe::Serialize(webframe::event::Resized{3, {640, 480}});
    CHECK(json.rfind("{\"type\":", 0) == 0);
}

TEST_CASE("window ids are serialized as strings") {
    auto json = parse(webframe::Serialize(webframe::event::Destroyed{18446744073709551615ull}));
    REQUIRE(json["window_id"].is_string());
    CHECK(json["window_id"].get<std::string>() == "18446744073709551615");
}

TEST_CASE("geometry and state fields") {
    auto resized = parse(webframe::Serialize(webframe::event::Resized{2, {800, 600}}));
    CHECK(resized["size"]["width"].get<double>() == 800);
    CHECK(resized["size"]["height"].get<double>() == 600);

    auto moved = parse(webframe::Serialize(webframe::event::Moved{2, {-5, 7.5}}));
    CHECK(moved["position"]["x"].get<double>() == -5);
    CHECK(moved["position"]["y"].get<double>() == 7.5);

    auto focused = parse(webframe::Serialize(webframe::event::Focused{2, true}));
    CHECK(focused["focused"].get<bool>());

    auto started = parse(webframe::Serialize(webframe::event::PageLoad{2, false}));
    CHECK(started["state"].get<std::string>() == "started");

    auto finished = parse(webframe::Serialize(webframe::event::PageLoad{2, true}));
    CHECK(finished["state"].get<std::string>() == "finished");
}

TEST_CASE("global shortcut carries id accelerator and modifiers") {
    webframe::event::GlobalShortcut shortcut{.id = 4, .accelerator = "Ctrl+Shift+K", .modifiers = {}};
    shortcut.modifiers.control = true;
    shortcut.modifiers.shift = true;

    auto json = parse(webframe::Serialize(shortcut));
    CHECK(json["id"].get<double>() == 4);
    CHECK(json["accelerator"].get<std::string>() == "Ctrl+Shift+K");
    CHECK(json["modifiers"]["control"].get<bool>());
    CHECK(json["modifiers"]["shift"].get<bool>());
    CHECK_FALSE(json["modifiers"]["alt"].get<bool>());
    CHECK_FALSE(json["modifiers"]["super"].get<bool>());
}

TEST_CASE("string payloads are escaped") {
    const std::string payload = "line one\nline \"two\"\t\\ ✓";

    auto json = parse(webframe::Serialize(webframe::event::UserEvent{payload}));
    CHECK(json["payload"].get<std::string>() == payload);

    const auto quoted = webframe::QuoteJson(payload);
    CHECK(quoted.front() == '"');
    CHECK(quoted.back() == '"');
    CHECK(quoted.find('\n') == std::string::npos);

    std::string decoded;
    CHECK_FALSE(bool(glz::read_json(decoded, quoted)));
    CHECK(decoded == payload);
}

TEST_CASE("monitors serialize as objects") {
    const webframe::Monitor monitor{"DP-1", 2.0, {1920, 0}, {2560, 1440}};

    auto single = parse(webframe::SerializeMonitor(monitor));
    CHECK(single["name"].get<std::string>() == "DP-1");
    CHECK(single["scale_factor"].get<double>() == 2.0);
    CHECK(single["position"]["x"].get<double>() == 1920);
    CHECK(single["size"]["width"].get<double>() == 2560);

    auto list = parse(webframe::SerializeMonitors({monitor, monitor}));
    REQUIRE(list.is_array());
    CHECK(list.get<glz::json_t::array_t>().size() == 2);

    auto empty = parse(webframe::SerializeMonitors({}));
    REQUIRE(empty.is_array());
    CHECK(empty.get<glz::json_t::array_t>().empty());
}
