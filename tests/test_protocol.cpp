// tests/test_protocol.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "support.hpp"

#include "protocol.hpp"

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace webframe::test;

namespace {

struct Site {
    std::string url;
    std::string method;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    uint64_t window_id = 0;

    std::string page = "<h1>home</h1>";
    webframe_header cache{"Cache-Control", "no-store"};
    uint16_t status = 0;
    const char* mime = "text/html";
    bool accept = true;

    int calls = 0;
    int releases = 0;
};

void release_site(void* user_data) {
    ++static_cast<Site*>(user_data)->releases;
}

bool serve_site(const webframe_protocol_request* request, webframe_protocol_response* response, void* user_data) {
    auto& site = *static_cast<Site*>(user_data);
    ++site.calls;

    site.url = request->url;
    site.method = request->method;
    site.window_id = request->window_id;
    site.headers.clear();
    for (size_t i = 0; i < request->header_count; ++i)
        site.headers.emplace_back(request->headers[i].name, request->headers[i].value);
    site.body.assign(reinterpret_cast<const char*>(request->body), request->body_length);

    response->status = site.status;
    response->mime_type = site.mime;
    response->headers = &site.cache;
    response->header_count = 1;
    response->body = reinterpret_cast<const uint8_t*>(site.page.data());
    response->body_length = site.page.size();
    response->release = &release_site;
    response->release_user_data = &site;

    return site.accept;
}

std::string body_of(const webframe::ProtocolResponse& response) {
    return {response.body.begin(), response.body.end()};
}

} // namespace

TEST_CASE("scheme names follow the url grammar") {
    CHECK(webframe::IsValidScheme("app"));
    CHECK(webframe::IsValidScheme("my-app+v1.2"));
    CHECK(webframe::IsValidScheme("A1"));

    CHECK_FALSE(webframe::IsValidScheme(""));
    CHECK_FALSE(webframe::IsValidScheme("1app"));
    CHECK_FALSE(webframe::IsValidScheme("app://"));
    CHECK_FALSE(webframe::IsValidScheme("my app"));
}

TEST_CASE("scheme of a url is lower-cased") {
    CHECK(webframe::SchemeOf("APP://index.html") == "app");
    CHECK(webframe::SchemeOf("https://example.com") == "https");
    CHECK(webframe::SchemeOf("about:blank") == "about");

    CHECK_FALSE(webframe::SchemeOf("index.html").has_value());
    CHECK_FALSE(webframe::SchemeOf("/relative/path").has_value());
    CHECK_FALSE(webframe::SchemeOf("app:").has_value());
}

TEST_CASE("register_protocol rejects malformed schemes and null handlers") {
    ScopedApp app;
    Site site;

    auto result = webframe_register_protocol(app, "1abc", &serve_site, &site);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == WEBFRAME_ERROR_PROTOCOL_ERROR);

    result = webframe_register_protocol(app, nullptr, &serve_site, &site);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == WEBFRAME_ERROR_PROTOCOL_ERROR);

    result = webframe_register_protocol(app, "app", nullptr, nullptr);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == WEBFRAME_ERROR_INVALID_PARAMETER);

    result = webframe_register_protocol(nullptr, "app", &serve_site, &site);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == WEBFRAME_ERROR_INVALID_HANDLE);
}

TEST_CASE("requests for an unknown scheme are answered with 404") {
    ScopedApp app;

    webframe::ProtocolRequest request;
    request.url = "missing://index.html";

    const auto response = headless(app).SimulateProtocolRequest("missing", request);
    CHECK(response.status == 404);
}

TEST_CASE("requests are routed to the registered handler") {
    ScopedApp app;
    Site site;

    REQUIRE(webframe_register_protocol(app, "app", &serve_site, &site).success);

    auto* window = webframe_window_create(app, nullptr);
    REQUIRE(window != nullptr);

    webframe::ProtocolRequest request;
    request.url = "app://index.html?x=1";
    request.method = "POST";
    request.headers = {{"Accept", "text/html"}, {"X-Trace", "42"}};
    request.body = {'p', 'i', 'n', 'g'};
    request.window = webframe_window_id(window);

    const auto response = headless(app).SimulateProtocolRequest("app", request);

    CHECK(site.calls == 1);
    CHECK(site.url == "app://index.html?x=1");
    CHECK(site.method == "POST");
    CHECK(site.body == "ping");
    CHECK(site.window_id == webframe_window_id(window));
    REQUIRE(site.headers.size() == 2);
    CHECK(site.headers[1].first == "X-Trace");
    CHECK(site.headers[1].second == "42");

    // A zero status means success.
    CHECK(response.status == 200);
    CHECK(response.mime_type == "text/html");
    CHECK(body_of(response) == "<h1>home</h1>");
    REQUIRE(response.headers.count("Cache-Control") == 1);
    CHECK(response.headers.at("Cache-Control") == "no-store");

    CHECK(site.releases == 1);
}

TEST_CASE("a declined request is a 404 and still releases the response") {
    ScopedApp app;
    Site site;
    site.accept = false;

    REQUIRE(webframe_register_protocol(app, "app", &serve_site, &site).success);

    webframe::ProtocolRequest request;
    request.url = "app://secret";

    const auto response = headless(app).SimulateProtocolRequest("app", request);
    CHECK(response.status == 404);
    CHECK(response.body.empty());
    CHECK(site.releases == 1);
}

TEST_CASE("explicit status and missing mime type are honoured") {
    ScopedApp app;
    Site site;
    site.status = 201;
    site.mime = nullptr;

    REQUIRE(webframe_register_protocol(app, "app", &serve_site, &site).success);

    webframe::ProtocolRequest request;
    request.url = "app://created";

    const auto response = headless(app).SimulateProtocolRequest("app", request);
    CHECK(response.status == 201);
    CHECK(response.mime_type == "application/octet-stream");
}

TEST_CASE("schemes match case-insensitively and can be unregistered") {
    ScopedApp app;
    Site site;

    REQUIRE(webframe_register_protocol(app, "App", &serve_site, &site).success);

    webframe::ProtocolRequest request;
    request.url = "app://index.html";
    CHECK(headless(app).SimulateProtocolRequest("APP", request).status == 200);

    CHECK(webframe_unregister_protocol(app, "app"));
    CHECK_FALSE(webframe_unregister_protocol(app, "app"));
    CHECK_FALSE(webframe_unregister_protocol(app, nullptr));

    CHECK(headless(app).SimulateProtocolRequest("app", request).status == 404);
    CHECK(site.calls == 1);
}

TEST_CASE("registered schemes are handed to webviews created afterwards") {
    ScopedApp app;
    Site site;

    auto* before = webframe_window_create(app, nullptr);
    REQUIRE(webframe_register_protocol(app, "app", &serve_site, &site).success);
    auto* after = webframe_window_create(app, nullptr);

    REQUIRE(before != nullptr);
    REQUIRE(after != nullptr);

    CHECK(webview_of(app, before).schemes().empty());

    const auto& schemes = webview_of(app, after).schemes();
    REQUIRE(schemes.size() == 1);
    CHECK(schemes.front() == "app");
}

TEST_CASE("protocol handlers can be called off the loop thread") {
    ScopedApp app;
    Site site;

    REQUIRE(webframe_register_protocol(app, "app", &serve_site, &site).success);

    int status = 0;
    std::thread worker([&] {
        webframe::ProtocolRequest request;
        request.url = "app://from-worker";
        status = headless(app).SimulateProtocolRequest("app", request).status;
    });
    worker.join();

    CHECK(status == 200);
    CHECK(site.url == "app://from-worker");
}
