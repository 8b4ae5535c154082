/**
 * Backend interfaces for webframe
 *
 * A backend owns the native toolkit: it creates windows and webviews, pumps
 * native events into a WindowSink, and exposes the desktop capabilities
 * (monitors, dialogs, global hotkeys). Two backends exist:
 * - saucer (native windows and webviews)
 * - headless (in-memory, drives the loop without a display)
 */

#pragma once

#include "events.hpp"
#include "protocol.hpp"
#include "shortcuts.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webframe {

// ============================================================================
// Configuration
// ============================================================================

struct WindowConfig {
  std::string title;
  std::optional<std::string> url;
  std::optional<std::string> html;
  std::optional<std::string> user_agent;
  std::optional<std::string> data_directory;

  std::optional<Position> position;
  Size size{800, 600};
  Size min_size;
  Size max_size;

  bool resizable = true;
  bool fullscreen = false;
  bool maximized = false;
  bool minimized = false;
  bool visible = true;
  bool transparent = false;
  bool decorations = true;
  bool always_on_top = false;
  bool devtools_enabled = true;
  bool autoplay_enabled = false;
};

struct DialogRequest {
  enum class Kind { kOpenFile, kOpenFiles, kOpenFolder, kSave };

  Kind kind = Kind::kOpenFile;
  std::string title;
  std::optional<std::string> default_path;
  // Glob patterns such as "*.png".
  std::vector<std::string> filters;
};

enum class Urgency { kLow, kNormal, kCritical };

struct Notification {
  std::string title;
  std::string body;
  std::string icon;
  int timeout_ms = -1;
  Urgency urgency = Urgency::kNormal;
};

// ============================================================================
// WindowSink
// Receives everything a backend observes. Implemented by Application.
// ============================================================================

class WindowSink {
public:
  virtual ~WindowSink() = default;

  // Loop thread.
  virtual void OnEvent(Event event) = 0;
  virtual bool OnCloseRequested(WindowId id) = 0;
  virtual bool OnNavigating(WindowId id, const std::string& url) = 0;
  virtual void OnMessage(WindowId id, const std::string& message) = 0;

  // Any thread.
  virtual ProtocolResponse OnProtocolRequest(const std::string& scheme, const ProtocolRequest& request) = 0;
};

// ============================================================================
// Native objects
// ============================================================================

class NativeWindow {
public:
  virtual ~NativeWindow() = default;

  virtual WindowId Id() const = 0;

  virtual std::string Title() const = 0;
  virtual void SetTitle(const std::string& title) = 0;

  virtual Size GetSize() const = 0;
  virtual void SetSize(Size size) = 0;
  virtual void SetMinSize(Size size) = 0;
  virtual void SetMaxSize(Size size) = 0;

  virtual Position GetPosition() const = 0;
  virtual void SetPosition(Position position) = 0;

  virtual bool Visible() const = 0;
  virtual void SetVisible(bool visible) = 0;

  virtual bool Minimized() const = 0;
  virtual void SetMinimized(bool minimized) = 0;

  virtual bool Maximized() const = 0;
  virtual void SetMaximized(bool maximized) = 0;

  virtual bool Fullscreen() const = 0;
  virtual void SetFullscreen(bool fullscreen) = 0;

  virtual bool Focused() const = 0;
  virtual void Focus() = 0;

  virtual bool Resizable() const = 0;
  virtual void SetResizable(bool resizable) = 0;

  virtual bool Decorated() const = 0;
  virtual void SetDecorated(bool decorated) = 0;

  virtual bool AlwaysOnTop() const = 0;
  virtual void SetAlwaysOnTop(bool always_on_top) = 0;

  virtual void StartDrag() = 0;

  // Asks the toolkit to close. The outcome arrives through WindowSink::OnCloseRequested.
  virtual void RequestClose() = 0;

  virtual std::optional<Monitor> CurrentMonitor() const = 0;
};

class NativeWebview {
public:
  virtual ~NativeWebview() = default;

  // Throws Error(kNavigationFailed).
  virtual void Navigate(const std::string& url) = 0;
  virtual void LoadHtml(const std::string& html) = 0;

  // Throws Error(kScriptError).
  virtual void Evaluate(const std::string& script) = 0;

  virtual std::optional<std::string> Url() const = 0;

  // Throws Error(kNotSupported) where zoom is unavailable.
  virtual void SetZoom(double zoom) = 0;

  virtual bool DevtoolsOpen() const = 0;
  virtual void SetDevtoolsOpen(bool open) = 0;

  virtual void Reload() = 0;
  virtual void Back() = 0;
  virtual void Forward() = 0;
};

// ============================================================================
// HotkeySource
// System-wide key grabs. Triggers are collected by Poll() on the loop thread.
// ============================================================================

class HotkeySource {
public:
  virtual ~HotkeySource() = default;

  virtual bool Supported() const = 0;
  virtual bool Register(std::uint32_t id, const Accelerator& accelerator) = 0;
  virtual void Unregister(std::uint32_t id) = 0;

  // Ids fired since the last poll, in detection order.
  virtual std::vector<std::uint32_t> Poll() = 0;
};

// ============================================================================
// Backend
// ============================================================================

class Backend {
public:
  virtual ~Backend() = default;

  virtual const char* Name() const = 0;
  virtual std::string Version() const = 0;

  virtual void Attach(WindowSink& sink) = 0;

  // Throws Error(kWindowCreationFailed).
  virtual std::unique_ptr<NativeWindow> CreateWindow(WindowId id, const WindowConfig& config) = 0;

  // Throws Error(kWebviewCreationFailed).
  virtual std::unique_ptr<NativeWebview> CreateWebview(NativeWindow& window, const WindowConfig& config,
                                                       const std::vector<std::string>& schemes) = 0;

  // Delivers pending native events to the sink. With `wait` set, blocks until
  // something arrives or Wake() is called.
  virtual void Pump(bool wait) = 0;

  // Any thread.
  virtual void Wake() = 0;

  virtual std::vector<Monitor> Monitors() = 0;

  // Nothing when the dialog was dismissed.
  virtual std::optional<std::vector<std::string>> PickPaths(const DialogRequest& request) = 0;

  virtual bool OpenExternal(const std::string& target) = 0;

  virtual HotkeySource& Hotkeys() = 0;
};

std::unique_ptr<Backend> CreateSaucerBackend(const std::string& app_id);
std::unique_ptr<Backend> CreateHeadlessBackend();

// ============================================================================
// Platform services (platform_linux.cpp, platform_win.cpp, platform_other.cpp)
// ============================================================================

namespace platform {

std::unique_ptr<HotkeySource> CreateHotkeySource();

// Throws Error(kNotificationFailed) or Error(kNotSupported).
void ShowNotification(const Notification& notification);

}  // namespace platform

}  // namespace webframe
