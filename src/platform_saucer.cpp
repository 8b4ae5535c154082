/**
 * saucer backend
 *
 * Native windows and webviews. The saucer loop is driven one iteration at a
 * time from Application::Run, so every toolkit callback lands on the loop
 * thread.
 */

#include "platform.hpp"

#include "bridge.hpp"
#include "error.hpp"
#include "log.hpp"

#ifdef nil
#define WEBFRAME_RESTORE_NIL_MACRO 1
#pragma push_macro("nil")
#undef nil
#endif

#include <saucer/app.hpp>
#include <saucer/modules/desktop.hpp>
#include <saucer/modules/loop.hpp>
#include <saucer/smartview.hpp>

#ifdef WEBFRAME_RESTORE_NIL_MACRO
#pragma pop_macro("nil")
#undef WEBFRAME_RESTORE_NIL_MACRO
#endif

// <windows.h> may arrive through the saucer headers.
#ifdef CreateWindow
#undef CreateWindow
#endif

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace webframe {

namespace {

class SaucerBackend;

// saucer::screen carries no scale, so every monitor reports 1.0.
Monitor ToMonitor(const saucer::screen& screen) {
  return Monitor{
    .name = screen.name,
    .scale_factor = 1.0,
    .position = {static_cast<double>(screen.position.x), static_cast<double>(screen.position.y)},
    .size = {static_cast<double>(screen.size.w), static_cast<double>(screen.size.h)},
  };
}

// ============================================================================
// SaucerWindow
// ============================================================================

class SaucerWindow : public NativeWindow {
public:
  SaucerWindow(SaucerBackend& backend, WindowSink& sink, WindowId id, std::shared_ptr<saucer::window> window);
  ~SaucerWindow() override;

  WindowId Id() const override { return id_; }

  std::string Title() const override { return window_->title(); }
  void SetTitle(const std::string& title) override { window_->set_title(title); }

  Size GetSize() const override {
    const auto size = window_->size();
    return {static_cast<double>(size.w), static_cast<double>(size.h)};
  }
  void SetSize(Size size) override {
    window_->set_size({.w = static_cast<int>(size.width), .h = static_cast<int>(size.height)});
  }
  void SetMinSize(Size size) override {
    window_->set_min_size({.w = static_cast<int>(size.width), .h = static_cast<int>(size.height)});
  }
  void SetMaxSize(Size size) override {
    window_->set_max_size({.w = static_cast<int>(size.width), .h = static_cast<int>(size.height)});
  }

  Position GetPosition() const override {
    const auto position = window_->position();
    return {static_cast<double>(position.x), static_cast<double>(position.y)};
  }
  void SetPosition(Position position) override {
    window_->set_position({.x = static_cast<int>(position.x), .y = static_cast<int>(position.y)});
    last_position_ = GetPosition();
  }

  bool Visible() const override { return window_->visible(); }
  void SetVisible(bool visible) override {
    if (visible) {
      window_->show();
    } else {
      window_->hide();
    }
  }

  bool Minimized() const override { return window_->minimized(); }
  void SetMinimized(bool minimized) override { window_->set_minimized(minimized); }

  bool Maximized() const override { return window_->maximized(); }
  void SetMaximized(bool maximized) override { window_->set_maximized(maximized); }

  bool Fullscreen() const override { return window_->fullscreen(); }
  void SetFullscreen(bool fullscreen) override { window_->set_fullscreen(fullscreen); }

  bool Focused() const override { return window_->focused(); }
  void Focus() override { window_->focus(); }

  bool Resizable() const override { return window_->resizable(); }
  void SetResizable(bool resizable) override { window_->set_resizable(resizable); }

  bool Decorated() const override { return window_->decorations() != saucer::window::decoration::none; }
  void SetDecorated(bool decorated) override {
    window_->set_decorations(decorated ? saucer::window::decoration::full : saucer::window::decoration::none);
  }

  bool AlwaysOnTop() const override { return window_->always_on_top(); }
  void SetAlwaysOnTop(bool always_on_top) override { window_->set_always_on_top(always_on_top); }

  void StartDrag() override { window_->start_drag(); }

  void RequestClose() override { window_->close(); }

  std::optional<Monitor> CurrentMonitor() const override {
    const auto screen = window_->screen();
    if (!screen.has_value()) {
      return std::nullopt;
    }
    return ToMonitor(screen.value());
  }

  // saucer has no move notification, so the position is compared after every iteration.
  void CheckPosition() {
    const auto position = GetPosition();
    if (position == last_position_) {
      return;
    }
    last_position_ = position;
    sink_.OnEvent(event::Moved{id_, position});
  }

  const std::shared_ptr<saucer::window>& native() const { return window_; }

private:
  SaucerBackend& backend_;
  WindowSink& sink_;
  WindowId id_;
  std::shared_ptr<saucer::window> window_;
  Position last_position_;

  std::uint64_t on_resize_ = 0;
  std::uint64_t on_focus_ = 0;
  std::uint64_t on_minimize_ = 0;
  std::uint64_t on_maximize_ = 0;
  std::uint64_t on_decorated_ = 0;
  std::uint64_t on_close_ = 0;
};

// ============================================================================
// SaucerWebview
// ============================================================================

class SaucerWebview : public NativeWebview {
public:
  SaucerWebview(WindowSink& sink, WindowId id, saucer::smartview view, const WindowConfig& config,
                const std::vector<std::string>& schemes);
  ~SaucerWebview() override;

  void Navigate(const std::string& url) override {
    if (!SchemeOf(url)) {
      throw Error(ErrorCode::kNavigationFailed, "'" + url + "' is not an absolute url");
    }
    view_.set_url(url);
  }

  void LoadHtml(const std::string& html) override { view_.set_html(html); }

  void Evaluate(const std::string& script) override { view_.saucer::webview::execute(script); }

  std::optional<std::string> Url() const override {
    const auto url = view_.url();
    if (!url.has_value()) {
      return std::nullopt;
    }
    return url->string();
  }

  void SetZoom(double) override {
    throw Error(ErrorCode::kNotSupported, "zoom is not available with the saucer backend");
  }

  bool DevtoolsOpen() const override { return view_.dev_tools(); }
  void SetDevtoolsOpen(bool open) override { view_.set_dev_tools(open); }

  void Reload() override { view_.reload(); }
  void Back() override { view_.back(); }
  void Forward() override { view_.forward(); }

private:
  void HandleScheme(const std::string& scheme);

  WindowSink& sink_;
  WindowId id_;
  saucer::smartview view_;

  std::uint64_t on_message_ = 0;
  std::uint64_t on_navigate_ = 0;
  std::uint64_t on_navigated_ = 0;
  std::uint64_t on_load_ = 0;
  std::uint64_t on_title_ = 0;
};

// ============================================================================
// SaucerBackend
// ============================================================================

class SaucerBackend : public Backend {
public:
  explicit SaucerBackend(const std::string& app_id);
  ~SaucerBackend() override;

  const char* Name() const override { return "saucer"; }
  std::string Version() const override { return WEBFRAME_SAUCER_VERSION; }

  void Attach(WindowSink& sink) override { sink_ = &sink; }

  std::unique_ptr<NativeWindow> CreateWindow(WindowId id, const WindowConfig& config) override;
  std::unique_ptr<NativeWebview> CreateWebview(NativeWindow& window, const WindowConfig& config,
                                               const std::vector<std::string>& schemes) override;

  void Pump(bool wait) override;
  void Wake() override;

  std::vector<Monitor> Monitors() override;
  std::optional<std::vector<std::string>> PickPaths(const DialogRequest& request) override;
  bool OpenExternal(const std::string& target) override;
  HotkeySource& Hotkeys() override { return *hotkeys_; }

  void Track(SaucerWindow* window) { windows_[window->Id()] = window; }
  void Untrack(WindowId id) { windows_.erase(id); }

private:
  WindowSink& sink();

  std::shared_ptr<saucer::application> app_;
  std::shared_ptr<saucer::modules::loop> loop_;
  std::unique_ptr<HotkeySource> hotkeys_;
  WindowSink* sink_ = nullptr;

  std::unordered_map<WindowId, SaucerWindow*> windows_;
  std::unordered_set<std::string> registered_schemes_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool woken_ = false;
};

// ============================================================================
// SaucerWindow implementation
// ============================================================================

SaucerWindow::SaucerWindow(SaucerBackend& backend, WindowSink& sink, WindowId id,
                           std::shared_ptr<saucer::window> window)
  : backend_(backend), sink_(sink), id_(id), window_(std::move(window)) {
  on_resize_ = window_->on<saucer::window::event::resize>([this](int w, int h) {
    sink_.OnEvent(event::Resized{id_, {static_cast<double>(w), static_cast<double>(h)}});
  });

  on_focus_ = window_->on<saucer::window::event::focus>(
    [this](bool focused) { sink_.OnEvent(event::Focused{id_, focused}); });

  on_minimize_ = window_->on<saucer::window::event::minimize>(
    [this](bool minimized) { sink_.OnEvent(event::Minimized{id_, minimized}); });

  on_maximize_ = window_->on<saucer::window::event::maximize>(
    [this](bool maximized) { sink_.OnEvent(event::Maximized{id_, maximized}); });

  on_decorated_ = window_->on<saucer::window::event::decorated>([this](saucer::window::decoration decoration) {
    const bool decorated = decoration != saucer::window::decoration::none;
    sink_.OnEvent(event::Raw{"window " + std::to_string(id_) + (decorated ? " decorated" : " undecorated")});
  });

  on_close_ = window_->on<saucer::window::event::close>([this]() {
    return sink_.OnCloseRequested(id_) ? saucer::policy::allow : saucer::policy::block;
  });

  last_position_ = GetPosition();
  backend_.Track(this);
}

SaucerWindow::~SaucerWindow() {
  backend_.Untrack(id_);

  window_->off(saucer::window::event::resize, on_resize_);
  window_->off(saucer::window::event::focus, on_focus_);
  window_->off(saucer::window::event::minimize, on_minimize_);
  window_->off(saucer::window::event::maximize, on_maximize_);
  window_->off(saucer::window::event::decorated, on_decorated_);
  window_->off(saucer::window::event::close, on_close_);

  window_->close();
}

// ============================================================================
// SaucerWebview implementation
// ============================================================================

SaucerWebview::SaucerWebview(WindowSink& sink, WindowId id, saucer::smartview view, const WindowConfig& config,
                             const std::vector<std::string>& schemes)
  : sink_(sink), id_(id), view_(std::move(view)) {
  on_message_ = view_.on<saucer::webview::event::message>([this](std::string_view message) {
    sink_.OnMessage(id_, std::string(message));
    return saucer::status::handled;
  });

  on_navigate_ = view_.on<saucer::webview::event::navigate>([this](const saucer::navigation& navigation) {
    return sink_.OnNavigating(id_, navigation.url().string()) ? saucer::policy::allow : saucer::policy::block;
  });

  on_navigated_ = view_.on<saucer::webview::event::navigated>(
    [this](const saucer::url& url) { sink_.OnEvent(event::Navigated{id_, url.string()}); });

  on_load_ = view_.on<saucer::webview::event::load>([this](const saucer::state& state) {
    sink_.OnEvent(event::PageLoad{id_, state == saucer::state::finished});
  });

  on_title_ = view_.on<saucer::webview::event::title>(
    [this](std::string_view title) { sink_.OnEvent(event::TitleChanged{id_, std::string(title)}); });

  for (const auto& scheme : schemes) {
    HandleScheme(scheme);
  }

  view_.inject(saucer::script{
    .code = bridge::InitScript(),
    .run_at = saucer::script::time::creation,
  });

  view_.set_dev_tools(false);

  if (config.transparent) {
    view_.set_background({.r = 0, .g = 0, .b = 0, .a = 0});
  }

  if (config.url) {
    Navigate(*config.url);
  } else if (config.html) {
    view_.set_html(*config.html);
  }
}

SaucerWebview::~SaucerWebview() {
  view_.off(saucer::webview::event::message, on_message_);
  view_.off(saucer::webview::event::navigate, on_navigate_);
  view_.off(saucer::webview::event::navigated, on_navigated_);
  view_.off(saucer::webview::event::load, on_load_);
  view_.off(saucer::webview::event::title, on_title_);
}

void SaucerWebview::HandleScheme(const std::string& scheme) {
  view_.handle_scheme(scheme, [this, scheme](saucer::scheme::request req, saucer::scheme::executor exec) {
    ProtocolRequest request;
    request.url = req.url().string();
    request.method = req.method();
    request.window = id_;

    for (const auto& [name, value] : req.headers()) {
      request.headers.emplace_back(name, value);
    }

    const auto content = req.content();
    if (content.size() > 0) {
      request.body.assign(content.data(), content.data() + content.size());
    }

    ProtocolResponse response;
    try {
      response = sink_.OnProtocolRequest(scheme, request);
    } catch (const std::exception& e) {
      log::Get()->error("{}:// handler failed for {}: {}", scheme, request.url, e.what());
      exec.reject(saucer::scheme::error::failed);
      return;
    }

    auto resolved = saucer::scheme::response{
      .data = saucer::stash::from(std::move(response.body)),
      .mime = response.mime_type,
    };
    resolved.status = response.status;
    for (const auto& [name, value] : response.headers) {
      resolved.headers.emplace(name, value);
    }

    exec.resolve(resolved);
  });
}

// ============================================================================
// SaucerBackend implementation
// ============================================================================

SaucerBackend::SaucerBackend(const std::string& app_id) {
  auto app_result = saucer::application::create(saucer::application::options{.id = app_id});
  if (!app_result.has_value()) {
    throw Error(ErrorCode::kEventLoopError,
                "failed to create saucer application (code " + std::to_string(app_result.error().code()) + ")");
  }

  app_ = std::move(app_result).value();
  loop_ = std::make_shared<saucer::modules::loop>(*app_);
  hotkeys_ = platform::CreateHotkeySource();

  log::Get()->debug("saucer backend created for '{}'", app_id);
}

SaucerBackend::~SaucerBackend() {
  hotkeys_.reset();
  loop_.reset();
  app_.reset();
}

WindowSink& SaucerBackend::sink() {
  if (!sink_) {
    throw Error(ErrorCode::kUnknown, "saucer backend used before being attached");
  }
  return *sink_;
}

std::unique_ptr<NativeWindow> SaucerBackend::CreateWindow(WindowId id, const WindowConfig& config) {
  auto window_result = saucer::window::create(app_.get());
  if (!window_result.has_value()) {
    throw Error(ErrorCode::kWindowCreationFailed,
                "failed to create window (code " + std::to_string(window_result.error().code()) + ")");
  }

  auto window = std::make_unique<SaucerWindow>(*this, sink(), id, window_result.value());

  window->SetTitle(config.title);
  window->SetSize(config.size);
  if (config.min_size.width > 0 && config.min_size.height > 0) {
    window->SetMinSize(config.min_size);
  }
  if (config.max_size.width > 0 && config.max_size.height > 0) {
    window->SetMaxSize(config.max_size);
  }
  if (config.position) {
    window->SetPosition(*config.position);
  }

  window->SetResizable(config.resizable);
  window->SetDecorated(config.decorations);
  window->SetAlwaysOnTop(config.always_on_top);

  if (config.transparent) {
    window->native()->set_background({.r = 0, .g = 0, .b = 0, .a = 0});
  }

  return window;
}

std::unique_ptr<NativeWebview> SaucerBackend::CreateWebview(NativeWindow& window, const WindowConfig& config,
                                                            const std::vector<std::string>& schemes) {
  auto& native = static_cast<SaucerWindow&>(window);

  // Schemes must be known before the first webview that serves them exists.
  for (const auto& scheme : schemes) {
    if (registered_schemes_.insert(scheme).second) {
      saucer::webview::register_scheme(scheme);
    }
  }

  saucer::smartview::options options{
    .window = native.native(),
  };
  if (config.user_agent) {
    options.user_agent = *config.user_agent;
  }
  if (config.data_directory) {
    options.storage_path = std::filesystem::path{*config.data_directory};
  }

  auto view_result = saucer::smartview::create(options);
  if (!view_result.has_value()) {
    throw Error(ErrorCode::kWebviewCreationFailed,
                "failed to create webview (code " + std::to_string(view_result.error().code()) + ")");
  }

  auto webview = std::make_unique<SaucerWebview>(sink(), native.Id(), std::move(view_result).value(), config, schemes);

  // Window state that depends on content being attached.
  native.SetFullscreen(config.fullscreen);
  native.SetMaximized(config.maximized);
  native.SetMinimized(config.minimized);
  native.SetVisible(config.visible);

  return webview;
}

void SaucerBackend::Pump(bool wait) {
  loop_->iteration();

  for (const auto& [id, window] : windows_) {
    window->CheckPosition();
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (wait && !woken_) {
    // Native events only surface through iteration(), so waiting is bounded.
    cv_.wait_for(lock, std::chrono::milliseconds(1), [this] { return woken_; });
  }
  woken_ = false;
}

void SaucerBackend::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    woken_ = true;
  }
  cv_.notify_one();
}

std::vector<Monitor> SaucerBackend::Monitors() {
  std::vector<Monitor> monitors;
  for (const auto& screen : app_->screens()) {
    monitors.push_back(ToMonitor(screen));
  }
  return monitors;
}

std::optional<std::vector<std::string>> SaucerBackend::PickPaths(const DialogRequest& request) {
  using type = saucer::modules::picker::type;

  saucer::modules::desktop desktop{app_.get()};

  saucer::modules::picker::options options{};
  if (request.default_path) {
    options.initial = *request.default_path;
  }
  options.filters = std::set<std::string>(request.filters.begin(), request.filters.end());

  std::vector<std::string> paths;

  switch (request.kind) {
  case DialogRequest::Kind::kOpenFile: {
    auto result = desktop.pick<type::file>(options);
    if (!result) {
      return std::nullopt;
    }
    paths.push_back(result->string());
    break;
  }
  case DialogRequest::Kind::kOpenFiles: {
    auto result = desktop.pick<type::files>(options);
    if (!result) {
      return std::nullopt;
    }
    for (const auto& path : *result) {
      paths.push_back(path.string());
    }
    break;
  }
  case DialogRequest::Kind::kOpenFolder: {
    auto result = desktop.pick<type::folder>(options);
    if (!result) {
      return std::nullopt;
    }
    paths.push_back(result->string());
    break;
  }
  case DialogRequest::Kind::kSave: {
    auto result = desktop.pick<type::save>(options);
    if (!result) {
      return std::nullopt;
    }
    paths.push_back(result->string());
    break;
  }
  }

  return paths;
}

bool SaucerBackend::OpenExternal(const std::string& target) {
  saucer::modules::desktop desktop{app_.get()};
  desktop.open(target);
  return true;
}

}  // namespace

std::unique_ptr<Backend> CreateSaucerBackend(const std::string& app_id) {
  return std::make_unique<SaucerBackend>(app_id);
}

}  // namespace webframe
