#include "application.hpp"

#include "bridge.hpp"
#include "error.hpp"
#include "log.hpp"

#include <exception>
#include <utility>
#include <variant>

namespace webframe {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Application::Application(std::unique_ptr<Backend> backend, AppOptions options)
  : backend_(std::move(backend)), options_(std::move(options)) {
  if (!backend_) {
    throw Error(ErrorCode::kUnknown, "application requires a backend");
  }

  Backend* backend_ptr = backend_.get();
  channel_ = std::make_shared<EventChannel>([backend_ptr] { backend_ptr->Wake(); });
  shortcuts_ = std::make_unique<ShortcutManager>(backend_->Hotkeys());

  backend_->Attach(*this);
  log::Get()->debug("application '{}' created with {} backend", options_.id, backend_->Name());
}

Application::~Application() {
  if (const auto dropped = channel_->Close(); dropped > 0) {
    log::Get()->warn("dropped {} queued message(s) while destroying the application", dropped);
  }

  shortcuts_.reset();

  auto windows = std::move(windows_);
  windows_.clear();
  windows.clear();
  ReleaseRemoved();

  log::Get()->debug("application '{}' destroyed", options_.id);
}

bool Application::OnLoopThread() const {
  return loop_thread_.load() == std::this_thread::get_id();
}

// ============================================================================
// Windows
// ============================================================================

WindowEntry& Application::CreateWindow(const WindowConfig& config) {
  if (state_.load() == LoopState::kStopped) {
    throw Error(ErrorCode::kEventLoopError, "cannot create a window after the event loop has stopped");
  }

  auto entry = std::make_unique<WindowEntry>();
  entry->app = this;
  entry->id = next_window_id_++;
  entry->devtools_enabled = config.devtools_enabled;
  entry->window = backend_->CreateWindow(entry->id, config);
  entry->webview = backend_->CreateWebview(*entry->window, config, protocols_.Schemes());

  auto& ref = *entry;
  windows_.emplace(ref.id, std::move(entry));

  log::Get()->debug("window {} created ('{}')", ref.id, config.title);
  return ref;
}

void Application::DestroyWindow(WindowId id) {
  Remove(id);

  if (state_.load() != LoopState::kRunning) {
    ReleaseRemoved();
  }
}

WindowEntry* Application::FindWindow(WindowId id) {
  const auto it = windows_.find(id);
  return it == windows_.end() ? nullptr : it->second.get();
}

void Application::Remove(WindowId id) {
  const auto it = windows_.find(id);
  if (it == windows_.end()) {
    return;
  }

  auto entry = std::move(it->second);
  windows_.erase(it);

  // The native objects may still be on the stack of the callback that got us here.
  entry->callbacks = {};
  removed_.push_back(std::move(entry));

  log::Get()->debug("window {} removed, {} remaining", id, windows_.size());
  Deliver(event::Destroyed{id});

  if (windows_.empty() && options_.quit_on_last_window_closed && state_.load() == LoopState::kRunning) {
    log::Get()->debug("last window closed, exiting event loop");
    exit_requested_ = true;
  }
}

void Application::ReleaseRemoved() {
  // Releasing a native object can re-enter through the sink, so detach the list first.
  auto doomed = std::move(removed_);
  removed_.clear();
  doomed.clear();
}

// ============================================================================
// Loop
// ============================================================================

void Application::Run(EventHandler handler) {
  auto expected = LoopState::kCreated;
  if (!state_.compare_exchange_strong(expected, LoopState::kRunning)) {
    throw Error(ErrorCode::kEventLoopError, expected == LoopState::kRunning
                                              ? "event loop is already running"
                                              : "event loop has already been consumed");
  }

  loop_thread_.store(std::this_thread::get_id());
  handler_ = std::move(handler);
  flow_ = ControlFlow::kPoll;
  exit_requested_ = false;

  log::Get()->debug("event loop started with {} window(s)", windows_.size());

  try {
    Deliver(event::NewEvents{"init"});

    while (!exit_requested_) {
      const bool wait = flow_ == ControlFlow::kWait && channel_->Empty() && !shortcuts_->Active();

      backend_->Pump(wait);
      DrainChannel();
      PollShortcuts();
      Deliver(event::MainEventsCleared{});
      ReleaseRemoved();
    }
  } catch (const std::exception& e) {
    log::Get()->error("event loop failed: {}", e.what());
    Stop();
    throw Error(ErrorCode::kEventLoopError, std::string("event loop failed: ") + e.what());
  }

  Stop();
}

void Application::Stop() {
  state_.store(LoopState::kStopped);

  if (const auto dropped = channel_->Close(); dropped > 0) {
    log::Get()->warn("event loop stopped with {} unprocessed message(s); they were dropped", dropped);
  }

  Deliver(event::LoopDestroyed{});
  handler_ = nullptr;

  ReleaseRemoved();
  loop_thread_.store(std::thread::id{});

  log::Get()->debug("event loop stopped");
}

void Application::Deliver(const Event& event) {
  if (!handler_) {
    return;
  }

  const auto flow = handler_(event);

  if (flow == ControlFlow::kExit) {
    exit_requested_ = true;
    return;
  }

  flow_ = flow;
}

void Application::DrainChannel() {
  auto messages = channel_->Drain();

  for (auto& message : messages) {
    Dispatch(message);
  }
}

void Application::Dispatch(ProxyMessage& message) {
  std::visit(Overloaded{
               [](message::Invoke& m) { m.task.Run(); },
               [this](message::SendToWebview& m) {
                 auto* entry = FindWindow(m.window);
                 if (!entry || !entry->webview) {
                   log::Get()->warn("dropping message for window {}: window no longer exists", m.window);
                   return;
                 }

                 try {
                   entry->webview->Evaluate(bridge::ReceiveScript(m.text));
                 } catch (const Error& e) {
                   log::Get()->warn("failed to deliver message to window {}: {}", m.window, e.what());
                 } catch (const std::exception& e) {
                   log::Get()->warn("failed to deliver message to window {}: {}", m.window, e.what());
                 }
               },
               [this](message::DestroyWindow& m) { Remove(m.window); },
               [this](message::Exit&) {
                 Deliver(event::UserExit{});
                 exit_requested_ = true;
               },
               [this](event::UserEvent& e) { Deliver(e); },
               [this](event::MenuEvent& e) { Deliver(e); },
               [this](event::TrayEvent& e) { Deliver(e); },
             },
             message);
}

void Application::PollShortcuts() {
  for (const auto& fired : shortcuts_->Poll()) {
    if (shortcut_handler_) {
      shortcut_handler_(fired.id);
    }
    Deliver(fired);
  }
}

void Application::Quit() {
  if (!channel_->Send(message::Exit{})) {
    log::Get()->debug("quit ignored: event loop has already stopped");
  }
}

void Application::Invoke(std::function<void()> work) {
  if (!channel_->Send(message::Invoke{Task{std::move(work)}})) {
    throw Error(ErrorCode::kEventLoopError, "event loop is not accepting work");
  }
}

bool Application::InvokeSync(std::function<void()> work) {
  if (OnLoopThread()) {
    throw Error(ErrorCode::kEventLoopError, "synchronous invoke from the loop thread would deadlock");
  }

  auto ticket = std::make_shared<Ticket>();

  if (!channel_->Send(message::Invoke{Task{std::move(work), ticket}})) {
    throw Error(ErrorCode::kEventLoopError, "event loop is not accepting work");
  }

  return ticket->Wait() == Ticket::State::kDone;
}

void Application::PostToWebview(WindowId id, std::string text) {
  if (!channel_->Send(message::SendToWebview{id, std::move(text)})) {
    throw Error(ErrorCode::kEventLoopError, "event loop is not accepting messages");
  }
}

void Application::PostDestroy(WindowId id) {
  if (!channel_->Send(message::DestroyWindow{id})) {
    throw Error(ErrorCode::kEventLoopError, "event loop is not accepting messages");
  }
}

// ============================================================================
// WindowSink
// ============================================================================

void Application::OnEvent(Event event) {
  std::visit(Overloaded{
               [this](const event::Resized& e) {
                 if (auto* entry = FindWindow(e.window); entry && entry->callbacks.resized) {
                   entry->callbacks.resized(entry->handle(), e.size.width, e.size.height);
                 }
               },
               [this](const event::Moved& e) {
                 if (auto* entry = FindWindow(e.window); entry && entry->callbacks.moved) {
                   entry->callbacks.moved(entry->handle(), e.position.x, e.position.y);
                 }
               },
               [this](const event::Focused& e) {
                 if (auto* entry = FindWindow(e.window); entry && entry->callbacks.focus) {
                   entry->callbacks.focus(entry->handle(), e.focused);
                 }
               },
               [](const auto&) {},
             },
             event);

  Deliver(event);
}

bool Application::OnCloseRequested(WindowId id) {
  if (!FindWindow(id)) {
    return true;
  }

  Deliver(event::CloseRequested{id});

  // The pump callback may have destroyed the window.
  auto* entry = FindWindow(id);
  if (!entry) {
    return true;
  }

  if (!entry->callbacks.AllowClose(entry->handle())) {
    log::Get()->debug("close of window {} denied", id);
    return false;
  }

  Remove(id);
  return true;
}

bool Application::OnNavigating(WindowId id, const std::string& url) {
  auto* entry = FindWindow(id);
  if (!entry) {
    return true;
  }

  const bool allowed = entry->callbacks.AllowNavigation(entry->handle(), url.c_str());
  if (!allowed) {
    log::Get()->debug("navigation of window {} to {} denied", id, url);
  }
  return allowed;
}

void Application::OnMessage(WindowId id, const std::string& message) {
  auto* entry = FindWindow(id);
  if (!entry || !entry->callbacks.message) {
    return;
  }

  entry->callbacks.message(entry->handle(), message.c_str());
}

ProtocolResponse Application::OnProtocolRequest(const std::string& scheme, const ProtocolRequest& request) {
  return protocols_.Handle(scheme, request);
}

}  // namespace webframe
