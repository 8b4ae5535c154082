#pragma once

#include "platform.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace webframe {

class HeadlessBackend;

// ============================================================================
// Headless window and webview
// Plain records of the last value set. Nothing is drawn.
// ============================================================================

class HeadlessWindow : public NativeWindow {
public:
  HeadlessWindow(HeadlessBackend& backend, WindowId id, const WindowConfig& config);
  ~HeadlessWindow() override;

  WindowId Id() const override { return id_; }

  std::string Title() const override { return title_; }
  void SetTitle(const std::string& title) override { title_ = title; }

  Size GetSize() const override { return size_; }
  void SetSize(Size size) override { size_ = size; }
  void SetMinSize(Size size) override { min_size_ = size; }
  void SetMaxSize(Size size) override { max_size_ = size; }

  Position GetPosition() const override { return position_; }
  void SetPosition(Position position) override { position_ = position; }

  bool Visible() const override { return visible_; }
  void SetVisible(bool visible) override { visible_ = visible; }

  bool Minimized() const override { return minimized_; }
  void SetMinimized(bool minimized) override { minimized_ = minimized; }

  bool Maximized() const override { return maximized_; }
  void SetMaximized(bool maximized) override { maximized_ = maximized; }

  bool Fullscreen() const override { return fullscreen_; }
  void SetFullscreen(bool fullscreen) override { fullscreen_ = fullscreen; }

  bool Focused() const override { return focused_; }
  void Focus() override { focused_ = true; }

  bool Resizable() const override { return resizable_; }
  void SetResizable(bool resizable) override { resizable_ = resizable; }

  bool Decorated() const override { return decorated_; }
  void SetDecorated(bool decorated) override { decorated_ = decorated; }

  bool AlwaysOnTop() const override { return always_on_top_; }
  void SetAlwaysOnTop(bool always_on_top) override { always_on_top_ = always_on_top; }

  void StartDrag() override {}

  void RequestClose() override;

  std::optional<Monitor> CurrentMonitor() const override;

  Size min_size() const { return min_size_; }
  Size max_size() const { return max_size_; }

private:
  friend class HeadlessBackend;

  HeadlessBackend& backend_;
  WindowId id_;
  std::string title_;
  Size size_;
  Size min_size_;
  Size max_size_;
  Position position_;
  bool visible_;
  bool minimized_;
  bool maximized_;
  bool fullscreen_;
  bool focused_ = false;
  bool resizable_;
  bool decorated_;
  bool always_on_top_;
};

class HeadlessWebview : public NativeWebview {
public:
  HeadlessWebview(HeadlessBackend& backend, WindowId id, const WindowConfig& config,
                  std::vector<std::string> schemes);
  ~HeadlessWebview() override;

  void Navigate(const std::string& url) override;
  void LoadHtml(const std::string& html) override;
  void Evaluate(const std::string& script) override;
  std::optional<std::string> Url() const override { return url_; }
  void SetZoom(double zoom) override;
  bool DevtoolsOpen() const override { return devtools_open_; }
  void SetDevtoolsOpen(bool open) override { devtools_open_ = open; }
  void Reload() override { ++reloads_; }
  void Back() override;
  void Forward() override;

  const std::vector<std::string>& injected() const { return injected_; }
  const std::vector<std::string>& evaluated() const { return evaluated_; }
  const std::vector<std::string>& schemes() const { return schemes_; }
  const std::optional<std::string>& html() const { return html_; }
  double zoom() const { return zoom_; }
  int reloads() const { return reloads_; }

  // Makes every following Evaluate() throw, as a page without a script context would.
  void set_reject_scripts(bool reject) { reject_scripts_ = reject; }
  // Makes every following Evaluate() throw a plain std::runtime_error, as a failing toolkit call would.
  void set_break_scripts(bool broken) { break_scripts_ = broken; }

private:
  friend class HeadlessBackend;

  HeadlessBackend& backend_;
  WindowId id_;
  std::optional<std::string> url_;
  std::optional<std::string> html_;
  std::vector<std::string> history_;
  std::size_t history_index_ = 0;
  std::vector<std::string> injected_;
  std::vector<std::string> evaluated_;
  std::vector<std::string> schemes_;
  double zoom_ = 1.0;
  bool devtools_open_ = false;
  int reloads_ = 0;
  bool reject_scripts_ = false;
  bool break_scripts_ = false;
};

// ============================================================================
// HeadlessHotkeys
// ============================================================================

class HeadlessHotkeys : public HotkeySource {
public:
  bool Supported() const override { return true; }
  bool Register(std::uint32_t id, const Accelerator& accelerator) override;
  void Unregister(std::uint32_t id) override;
  std::vector<std::uint32_t> Poll() override;

  // Any thread. Returns false if nothing is registered for `accelerator`.
  bool Press(const Accelerator& accelerator);

private:
  mutable std::mutex mutex_;
  std::map<std::uint32_t, Accelerator> grabbed_;
  std::vector<std::uint32_t> fired_;
};

// ============================================================================
// HeadlessBackend
// Simulated native events are queued from any thread and delivered to the
// sink on the next Pump(), in the order they were queued.
// ============================================================================

class HeadlessBackend : public Backend {
public:
  HeadlessBackend();
  ~HeadlessBackend() override;

  const char* Name() const override { return "headless"; }
  std::string Version() const override { return "headless"; }

  void Attach(WindowSink& sink) override { sink_ = &sink; }

  std::unique_ptr<NativeWindow> CreateWindow(WindowId id, const WindowConfig& config) override;
  std::unique_ptr<NativeWebview> CreateWebview(NativeWindow& window, const WindowConfig& config,
                                               const std::vector<std::string>& schemes) override;

  void Pump(bool wait) override;
  void Wake() override;

  std::vector<Monitor> Monitors() override;
  std::optional<std::vector<std::string>> PickPaths(const DialogRequest& request) override;
  bool OpenExternal(const std::string& target) override;
  HotkeySource& Hotkeys() override { return hotkeys_; }

  // ==========================================================================
  // Simulation
  // ==========================================================================

  void SimulateCloseRequest(WindowId id);
  void SimulateResize(WindowId id, Size size);
  void SimulateMove(WindowId id, Position position);
  void SimulateFocus(WindowId id, bool focused);
  void SimulateMessage(WindowId id, std::string message);
  void SimulateNavigation(WindowId id, std::string url);
  void SimulateRaw(std::string debug);

  // The next Pump() throws, as a toolkit whose loop died would.
  void SimulateFailure(std::string reason);

  // Runs a protocol request through the sink on the calling thread.
  ProtocolResponse SimulateProtocolRequest(const std::string& scheme, ProtocolRequest request);

  HeadlessHotkeys& hotkeys() { return hotkeys_; }

  HeadlessWindow* FindWindow(WindowId id);
  HeadlessWebview* FindWebview(WindowId id);

  void SetDialogResult(std::optional<std::vector<std::string>> result) { dialog_result_ = std::move(result); }
  const std::optional<DialogRequest>& last_dialog() const { return last_dialog_; }
  const std::vector<std::string>& opened() const { return opened_; }

  std::size_t pumps() const { return pumps_; }

private:
  friend class HeadlessWindow;
  friend class HeadlessWebview;

  void Queue(std::function<void(WindowSink&)> simulation);

  WindowSink* sink_ = nullptr;
  HeadlessHotkeys hotkeys_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void(WindowSink&)>> pending_;
  bool woken_ = false;
  std::optional<std::string> failure_;

  std::unordered_map<WindowId, HeadlessWindow*> windows_;
  std::unordered_map<WindowId, HeadlessWebview*> webviews_;

  std::optional<std::vector<std::string>> dialog_result_;
  std::optional<DialogRequest> last_dialog_;
  std::vector<std::string> opened_;
  std::size_t pumps_ = 0;
};

}  // namespace webframe
