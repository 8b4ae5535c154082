#pragma once

#include "callbacks.hpp"
#include "channel.hpp"
#include "events.hpp"
#include "platform.hpp"
#include "protocol.hpp"
#include "shortcuts.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct webframe_window;

namespace webframe {

class Application;

// ============================================================================
// WindowEntry
// Boxed so its address stays stable while the host holds it as a
// webframe_window*. Members are released in reverse order: callbacks, then
// the webview, then the window.
// ============================================================================

struct WindowEntry {
  Application* app = nullptr;
  WindowId id = 0;
  bool devtools_enabled = true;

  std::unique_ptr<NativeWindow> window;
  std::unique_ptr<NativeWebview> webview;
  CallbackSet callbacks;

  webframe_window* handle() { return reinterpret_cast<webframe_window*>(this); }
  static WindowEntry* From(webframe_window* handle) { return reinterpret_cast<WindowEntry*>(handle); }
};

struct AppOptions {
  std::string id = "webframe";
  bool quit_on_last_window_closed = true;
};

enum class LoopState { kCreated, kRunning, kStopped };

// ============================================================================
// Application
// Owns the backend, the window registry and the loop. All members except
// those marked "any thread" belong to the thread that runs the loop.
// ============================================================================

class Application : public WindowSink {
public:
  using EventHandler = std::function<ControlFlow(const Event&)>;
  using ShortcutHandler = std::function<void(std::uint32_t)>;

  Application(std::unique_ptr<Backend> backend, AppOptions options);
  ~Application() override;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  Backend& backend() { return *backend_; }
  const AppOptions& options() const { return options_; }

  // Opaque back-reference to the handle the host holds.
  void* host() const { return host_; }
  void set_host(void* host) { host_ = host; }

  // Any thread.
  LoopState state() const { return state_.load(); }
  bool OnLoopThread() const;

  // ==========================================================================
  // Windows
  // ==========================================================================

  // Throws Error on failure.
  WindowEntry& CreateWindow(const WindowConfig& config);

  // Removes without consulting the closing callback.
  void DestroyWindow(WindowId id);

  WindowEntry* FindWindow(WindowId id);
  std::size_t WindowCount() const { return windows_.size(); }

  // ==========================================================================
  // Loop
  // ==========================================================================

  // Runs until an exit condition is met. Throws Error(kEventLoopError) if the
  // loop was already consumed or failed.
  void Run(EventHandler handler = {});

  // Any thread.
  void Quit();

  // Any thread.
  std::shared_ptr<EventChannel> channel() const { return channel_; }

  // Any thread. Throws Error(kEventLoopError) when the work cannot be queued.
  void Invoke(std::function<void()> work);

  // Any thread but the loop thread. Returns false if the work was dropped unrun.
  bool InvokeSync(std::function<void()> work);

  // Any thread.
  void PostToWebview(WindowId id, std::string text);
  void PostDestroy(WindowId id);

  // ==========================================================================
  // Services
  // ==========================================================================

  ProtocolTable& protocols() { return protocols_; }
  ShortcutManager& shortcuts() { return *shortcuts_; }
  void SetShortcutHandler(ShortcutHandler handler) { shortcut_handler_ = std::move(handler); }

  // ==========================================================================
  // WindowSink
  // ==========================================================================

  void OnEvent(Event event) override;
  bool OnCloseRequested(WindowId id) override;
  bool OnNavigating(WindowId id, const std::string& url) override;
  void OnMessage(WindowId id, const std::string& message) override;
  ProtocolResponse OnProtocolRequest(const std::string& scheme, const ProtocolRequest& request) override;

private:
  void Deliver(const Event& event);
  void Dispatch(ProxyMessage& message);
  void DrainChannel();
  void PollShortcuts();
  void Remove(WindowId id);
  void ReleaseRemoved();
  void Stop();

  std::unique_ptr<Backend> backend_;
  AppOptions options_;
  void* host_ = nullptr;

  std::atomic<LoopState> state_{LoopState::kCreated};
  std::atomic<std::thread::id> loop_thread_{};

  std::unordered_map<WindowId, std::unique_ptr<WindowEntry>> windows_;
  std::vector<std::unique_ptr<WindowEntry>> removed_;
  WindowId next_window_id_ = 1;

  std::shared_ptr<EventChannel> channel_;
  ProtocolTable protocols_;
  std::unique_ptr<ShortcutManager> shortcuts_;

  EventHandler handler_;
  ShortcutHandler shortcut_handler_;
  ControlFlow flow_ = ControlFlow::kPoll;
  bool exit_requested_ = false;
};

}  // namespace webframe
