#include "platform_headless.hpp"

#include "bridge.hpp"
#include "error.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace webframe {

namespace {

Monitor PrimaryMonitor() {
  return Monitor{
    .name = "headless-0",
    .scale_factor = 1.0,
    .position = {0, 0},
    .size = {1920, 1080},
  };
}

}  // namespace

// ============================================================================
// HeadlessWindow
// ============================================================================

HeadlessWindow::HeadlessWindow(HeadlessBackend& backend, WindowId id, const WindowConfig& config)
  : backend_(backend),
    id_(id),
    title_(config.title),
    size_(config.size),
    min_size_(config.min_size),
    max_size_(config.max_size),
    position_(config.position.value_or(Position{})),
    visible_(config.visible),
    minimized_(config.minimized),
    maximized_(config.maximized),
    fullscreen_(config.fullscreen),
    resizable_(config.resizable),
    decorated_(config.decorations),
    always_on_top_(config.always_on_top) {
  backend_.windows_[id_] = this;
}

HeadlessWindow::~HeadlessWindow() {
  backend_.windows_.erase(id_);
}

void HeadlessWindow::RequestClose() {
  backend_.SimulateCloseRequest(id_);
}

std::optional<Monitor> HeadlessWindow::CurrentMonitor() const {
  return PrimaryMonitor();
}

// ============================================================================
// HeadlessWebview
// ============================================================================

HeadlessWebview::HeadlessWebview(HeadlessBackend& backend, WindowId id, const WindowConfig& config,
                                 std::vector<std::string> schemes)
  : backend_(backend), id_(id), schemes_(std::move(schemes)) {
  injected_.push_back(bridge::InitScript());

  if (config.url) {
    url_ = config.url;
    history_.push_back(*config.url);
  } else if (config.html) {
    html_ = config.html;
  }

  backend_.webviews_[id_] = this;
}

HeadlessWebview::~HeadlessWebview() {
  backend_.webviews_.erase(id_);
}

void HeadlessWebview::Navigate(const std::string& url) {
  if (!SchemeOf(url)) {
    throw Error(ErrorCode::kNavigationFailed, "'" + url + "' is not an absolute url");
  }

  backend_.SimulateNavigation(id_, url);
}

void HeadlessWebview::LoadHtml(const std::string& html) {
  html_ = html;
}

void HeadlessWebview::Evaluate(const std::string& script) {
  if (reject_scripts_) {
    throw Error(ErrorCode::kScriptError, "page has no script context");
  }

  if (break_scripts_) {
    throw std::runtime_error("script execution failed");
  }

  evaluated_.push_back(script);
}

void HeadlessWebview::SetZoom(double zoom) {
  if (!(zoom > 0)) {
    throw Error(ErrorCode::kInvalidParameter, "zoom must be positive");
  }

  zoom_ = zoom;
}

void HeadlessWebview::Back() {
  if (history_index_ > 0) {
    url_ = history_[--history_index_];
  }
}

void HeadlessWebview::Forward() {
  if (history_index_ + 1 < history_.size()) {
    url_ = history_[++history_index_];
  }
}

// ============================================================================
// HeadlessHotkeys
// ============================================================================

bool HeadlessHotkeys::Register(std::uint32_t id, const Accelerator& accelerator) {
  std::lock_guard<std::mutex> lock(mutex_);
  grabbed_.insert_or_assign(id, accelerator);
  return true;
}

void HeadlessHotkeys::Unregister(std::uint32_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  grabbed_.erase(id);
}

std::vector<std::uint32_t> HeadlessHotkeys::Poll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::uint32_t> fired;
  fired.swap(fired_);
  return fired;
}

bool HeadlessHotkeys::Press(const Accelerator& accelerator) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto it = std::find_if(grabbed_.begin(), grabbed_.end(),
                               [&accelerator](const auto& entry) { return entry.second == accelerator; });
  if (it == grabbed_.end()) {
    return false;
  }

  fired_.push_back(it->first);
  return true;
}

// ============================================================================
// HeadlessBackend
// ============================================================================

HeadlessBackend::HeadlessBackend() {
  log::Get()->debug("headless backend created");
}

HeadlessBackend::~HeadlessBackend() = default;

std::unique_ptr<NativeWindow> HeadlessBackend::CreateWindow(WindowId id, const WindowConfig& config) {
  return std::make_unique<HeadlessWindow>(*this, id, config);
}

std::unique_ptr<NativeWebview> HeadlessBackend::CreateWebview(NativeWindow& window, const WindowConfig& config,
                                                              const std::vector<std::string>& schemes) {
  return std::make_unique<HeadlessWebview>(*this, window.Id(), config, schemes);
}

void HeadlessBackend::Pump(bool wait) {
  std::deque<std::function<void(WindowSink&)>> batch;
  std::optional<std::string> failure;

  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait) {
      cv_.wait(lock, [this] { return woken_ || failure_.has_value() || !pending_.empty(); });
    }
    woken_ = false;
    batch.swap(pending_);
    failure.swap(failure_);
  }

  ++pumps_;

  if (failure) {
    throw Error(ErrorCode::kEventLoopError, *failure);
  }

  if (!sink_) {
    return;
  }

  for (auto& simulation : batch) {
    simulation(*sink_);
  }
}

void HeadlessBackend::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    woken_ = true;
  }
  cv_.notify_one();
}

std::vector<Monitor> HeadlessBackend::Monitors() {
  return {PrimaryMonitor()};
}

std::optional<std::vector<std::string>> HeadlessBackend::PickPaths(const DialogRequest& request) {
  last_dialog_ = request;
  return dialog_result_;
}

bool HeadlessBackend::OpenExternal(const std::string& target) {
  opened_.push_back(target);
  return true;
}

HeadlessWindow* HeadlessBackend::FindWindow(WindowId id) {
  const auto it = windows_.find(id);
  return it == windows_.end() ? nullptr : it->second;
}

HeadlessWebview* HeadlessBackend::FindWebview(WindowId id) {
  const auto it = webviews_.find(id);
  return it == webviews_.end() ? nullptr : it->second;
}

void HeadlessBackend::Queue(std::function<void(WindowSink&)> simulation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(simulation));
  }
  cv_.notify_one();
}

// ============================================================================
// Simulation
// ============================================================================

void HeadlessBackend::SimulateCloseRequest(WindowId id) {
  Queue([id](WindowSink& sink) { sink.OnCloseRequested(id); });
}

void HeadlessBackend::SimulateResize(WindowId id, Size size) {
  Queue([this, id, size](WindowSink& sink) {
    if (auto* window = FindWindow(id)) {
      window->SetSize(size);
    }
    sink.OnEvent(event::Resized{id, size});
  });
}

void HeadlessBackend::SimulateMove(WindowId id, Position position) {
  Queue([this, id, position](WindowSink& sink) {
    if (auto* window = FindWindow(id)) {
      window->SetPosition(position);
    }
    sink.OnEvent(event::Moved{id, position});
  });
}

void HeadlessBackend::SimulateFocus(WindowId id, bool focused) {
  Queue([this, id, focused](WindowSink& sink) {
    if (auto* window = FindWindow(id)) {
      window->focused_ = focused;
    }
    sink.OnEvent(event::Focused{id, focused});
  });
}

void HeadlessBackend::SimulateMessage(WindowId id, std::string message) {
  Queue([id, message = std::move(message)](WindowSink& sink) { sink.OnMessage(id, message); });
}

void HeadlessBackend::SimulateNavigation(WindowId id, std::string url) {
  Queue([this, id, url = std::move(url)](WindowSink& sink) {
    if (!sink.OnNavigating(id, url)) {
      return;
    }

    if (auto* webview = FindWebview(id)) {
      webview->history_.resize(webview->history_.empty() ? 0 : webview->history_index_ + 1);
      webview->history_.push_back(url);
      webview->history_index_ = webview->history_.size() - 1;
      webview->url_ = url;
      webview->html_.reset();
    }

    sink.OnEvent(event::Navigated{id, url});
    sink.OnEvent(event::PageLoad{id, true});
  });
}

void HeadlessBackend::SimulateRaw(std::string debug) {
  Queue([debug = std::move(debug)](WindowSink& sink) { sink.OnEvent(event::Raw{debug}); });
}

void HeadlessBackend::SimulateFailure(std::string reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = std::move(reason);
  }
  cv_.notify_one();
}

ProtocolResponse HeadlessBackend::SimulateProtocolRequest(const std::string& scheme, ProtocolRequest request) {
  if (!sink_) {
    throw Error(ErrorCode::kProtocolError, "backend is not attached");
  }

  return sink_->OnProtocolRequest(scheme, request);
}

std::unique_ptr<Backend> CreateHeadlessBackend() {
  return std::make_unique<HeadlessBackend>();
}

}  // namespace webframe
