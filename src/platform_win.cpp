/**
 * Windows-specific platform services
 *
 * Global hotkeys are thread hotkeys read from the loop thread's message
 * queue. Notifications are tray balloons.
 */

#include "platform.hpp"

#ifdef _WIN32

#include "error.hpp"
#include "log.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <string>

namespace webframe::platform {

namespace {

std::wstring Widen(const std::string& text) {
  if (text.empty()) {
    return {};
  }
  const int size = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), static_cast<int>(text.size()), nullptr, 0);
  std::wstring wide(static_cast<std::size_t>(size), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, text.c_str(), static_cast<int>(text.size()), wide.data(), size);
  return wide;
}

// ============================================================================
// Global hotkeys (Windows)
// ============================================================================

UINT ToVirtualKey(const std::string& key) {
  static const std::map<std::string, UINT> kNamed = {
    {"Space", VK_SPACE},   {"Enter", VK_RETURN},   {"Tab", VK_TAB},        {"Escape", VK_ESCAPE},
    {"Backspace", VK_BACK}, {"Delete", VK_DELETE}, {"Insert", VK_INSERT},  {"Home", VK_HOME},
    {"End", VK_END},       {"PageUp", VK_PRIOR},   {"PageDown", VK_NEXT},  {"Up", VK_UP},
    {"Down", VK_DOWN},     {"Left", VK_LEFT},      {"Right", VK_RIGHT},    {"Plus", VK_OEM_PLUS},
    {"Minus", VK_OEM_MINUS},
  };

  if (const auto it = kNamed.find(key); it != kNamed.end()) {
    return it->second;
  }

  if (key.size() == 1) {
    // 'A'..'Z' and '0'..'9' are their own virtual key codes.
    return static_cast<UINT>(key[0]);
  }

  if (key.size() > 1 && key[0] == 'F') {
    return VK_F1 + static_cast<UINT>(std::stoi(key.substr(1)) - 1);
  }

  return 0;
}

class WinHotkeys : public HotkeySource {
public:
  ~WinHotkeys() override {
    for (const auto& entry : registered_) {
      UnregisterHotKey(nullptr, static_cast<int>(entry.first));
    }
  }

  bool Supported() const override { return true; }

  bool Register(std::uint32_t id, const Accelerator& accelerator) override {
    const UINT vk = ToVirtualKey(accelerator.key);
    if (vk == 0) {
      return false;
    }

    UINT mods = MOD_NOREPEAT;
    if (accelerator.modifiers.control) mods |= MOD_CONTROL;
    if (accelerator.modifiers.shift) mods |= MOD_SHIFT;
    if (accelerator.modifiers.alt) mods |= MOD_ALT;
    if (accelerator.modifiers.super) mods |= MOD_WIN;

    if (!RegisterHotKey(nullptr, static_cast<int>(id), mods, vk)) {
      log::Get()->warn("RegisterHotKey failed for id {} (error {})", id, GetLastError());
      return false;
    }

    registered_[id] = vk;
    return true;
  }

  void Unregister(std::uint32_t id) override {
    if (registered_.erase(id) > 0) {
      UnregisterHotKey(nullptr, static_cast<int>(id));
    }
  }

  std::vector<std::uint32_t> Poll() override {
    std::vector<std::uint32_t> fired;

    MSG msg;
    while (PeekMessageW(&msg, nullptr, WM_HOTKEY, WM_HOTKEY, PM_REMOVE)) {
      const auto id = static_cast<std::uint32_t>(msg.wParam);
      if (registered_.count(id) > 0) {
        fired.push_back(id);
      }
    }

    return fired;
  }

private:
  std::map<std::uint32_t, UINT> registered_;
};

}  // namespace

std::unique_ptr<HotkeySource> CreateHotkeySource() {
  return std::make_unique<WinHotkeys>();
}

// ============================================================================
// Notification Implementation (Windows)
// ============================================================================

namespace {

// Message-only window that owns one tray icon for the duration of a notification.
class TrayIcon {
public:
  TrayIcon() {
    owner_ = CreateWindowExW(0, L"STATIC", L"webframe-notify", 0, 0, 0, 0, 0, HWND_MESSAGE, nullptr,
                             GetModuleHandleW(nullptr), nullptr);
    if (!owner_) {
      throw Error(ErrorCode::kNotificationFailed, "could not create notification owner window");
    }
  }

  ~TrayIcon() {
    if (added_) {
      NOTIFYICONDATAW nid = {};
      nid.cbSize = sizeof(nid);
      nid.hWnd = owner_;
      nid.uID = kId;
      Shell_NotifyIconW(NIM_DELETE, &nid);
    }
    DestroyWindow(owner_);
  }

  TrayIcon(const TrayIcon&) = delete;
  TrayIcon& operator=(const TrayIcon&) = delete;

  NOTIFYICONDATAW Data() const {
    NOTIFYICONDATAW nid = {};
    nid.cbSize = sizeof(nid);
    nid.hWnd = owner_;
    nid.uID = kId;
    return nid;
  }

  void Add() {
    auto nid = Data();
    nid.uFlags = NIF_ICON;
    nid.hIcon = LoadIconW(nullptr, reinterpret_cast<LPCWSTR>(IDI_INFORMATION));
    if (!Shell_NotifyIconW(NIM_ADD, &nid)) {
      throw Error(ErrorCode::kNotificationFailed, "Shell_NotifyIconW(NIM_ADD) failed");
    }
    added_ = true;
  }

private:
  static constexpr UINT kId = 1;

  HWND owner_ = nullptr;
  bool added_ = false;
};

}  // namespace

void ShowNotification(const Notification& notification) {
  TrayIcon icon;
  icon.Add();

  auto nid = icon.Data();
  nid.uFlags = NIF_INFO;
  nid.dwInfoFlags = notification.urgency == Urgency::kCritical ? NIIF_WARNING : NIIF_INFO;
  if (notification.timeout_ms > 0) {
    nid.uTimeout = static_cast<UINT>(notification.timeout_ms);
  }

  const auto title = Widen(notification.title);
  const auto body = Widen(notification.body);

  const auto title_len = std::min(title.size(), std::size(nid.szInfoTitle) - 1);
  const auto body_len = std::min(body.size(), std::size(nid.szInfo) - 1);
  std::copy_n(title.begin(), title_len, nid.szInfoTitle);
  std::copy_n(body.begin(), body_len, nid.szInfo);

  if (!Shell_NotifyIconW(NIM_MODIFY, &nid)) {
    throw Error(ErrorCode::kNotificationFailed, "Shell_NotifyIconW(NIM_MODIFY) failed");
  }
}

}  // namespace webframe::platform

#endif
