// tests/test_desktop.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "support.hpp"

#include <string>
#include <vector>

using namespace webframe::test;
using Kind = webframe::DialogRequest::Kind;

TEST_CASE("cancelled dialog yields an empty selection") {
    ScopedApp app;
    headless(app).SetDialogResult(std::nullopt);

    webframe_clear_last_error();
    auto selection = webframe_dialog_open(app, nullptr);

    CHECK(selection.paths == nullptr);
    CHECK(selection.count == 0);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_DIALOG_CANCELLED);

    webframe_dialog_selection_free(&selection);

    headless(app).SetDialogResult(std::vector<std::string>{});
    CHECK(webframe_dialog_save(app, nullptr) == nullptr);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_DIALOG_CANCELLED);
}

TEST_CASE("open dialog returns every chosen path") {
    ScopedApp app;
    headless(app).SetDialogResult(std::vector<std::string>{"/home/user/a.png", "/home/user/Bilder/ü.jpg"});

    webframe_dialog_options options{};
    options.title = "Pick images";
    options.multiple = true;

    auto selection = webframe_dialog_open(app, &options);
    REQUIRE(selection.count == 2);
    REQUIRE(selection.paths != nullptr);
    CHECK(std::string{selection.paths[0]} == "/home/user/a.png");
    CHECK(std::string{selection.paths[1]} == "/home/user/Bilder/ü.jpg");

    webframe_dialog_selection_free(&selection);
    CHECK(selection.paths == nullptr);
    CHECK(selection.count == 0);

    const auto& request = headless(app).last_dialog();
    REQUIRE(request.has_value());
    CHECK(request->kind == Kind::kOpenFiles);
    CHECK(request->title == "Pick images");
}

TEST_CASE("dialog kind follows the directory and multiple flags") {
    ScopedApp app;
    headless(app).SetDialogResult(std::vector<std::string>{"/tmp"});

    webframe_dialog_options options{};

    auto selection = webframe_dialog_open(app, &options);
    webframe_dialog_selection_free(&selection);
    CHECK(headless(app).last_dialog()->kind == Kind::kOpenFile);

    options.directory = true;
    options.multiple = true;
    selection = webframe_dialog_open(app, &options);
    webframe_dialog_selection_free(&selection);
    CHECK(headless(app).last_dialog()->kind == Kind::kOpenFolder);

    char* saved = webframe_dialog_save(app, &options);
    REQUIRE(saved != nullptr);
    CHECK(std::string{saved} == "/tmp");
    webframe_string_free(saved);
    CHECK(headless(app).last_dialog()->kind == Kind::kSave);
}

TEST_CASE("dialog filters become glob patterns") {
    ScopedApp app;
    headless(app).SetDialogResult(std::vector<std::string>{"/tmp/x.png"});

    const char* images[] = {"png", ".jpg", "*.gif"};
    const char* everything[] = {"*"};
    const webframe_dialog_filter filters[] = {
        {"Images", images, 3},
        {"All files", everything, 1},
    };

    webframe_dialog_options options{};
    options.default_path = "/tmp";
    options.filters = filters;
    options.filter_count = 2;

    auto selection = webframe_dialog_open(app, &options);
    webframe_dialog_selection_free(&selection);

    const auto& request = headless(app).last_dialog();
    REQUIRE(request.has_value());
    REQUIRE(request->default_path.has_value());
    CHECK(*request->default_path == "/tmp");

    const std::vector<std::string> expected{"*.png", "*.jpg", "*.gif", "*"};
    CHECK(request->filters == expected);
}

TEST_CASE("filters without extensions are invalid parameters") {
    ScopedApp app;
    headless(app).SetDialogResult(std::vector<std::string>{"/tmp/x.png"});

    webframe_dialog_options options{};
    options.filter_count = 1;

    auto selection = webframe_dialog_open(app, &options);
    CHECK(selection.count == 0);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_INVALID_PARAMETER);
}

TEST_CASE("desktop open hands the target to the desktop") {
    ScopedApp app;

    CHECK(webframe_desktop_open(app, "https://example.com"));
    CHECK(webframe_desktop_open(app, "/tmp/report.pdf"));

    const std::vector<std::string> expected{"https://example.com", "/tmp/report.pdf"};
    CHECK(headless(app).opened() == expected);

    CHECK_FALSE(webframe_desktop_open(app, ""));
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_INVALID_PARAMETER);
}
