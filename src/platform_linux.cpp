/**
 * Linux-specific platform services
 *
 * Global hotkeys are X11 key grabs on the root window. Notifications go
 * through notify-send.
 */

#include "platform.hpp"

#if defined(__linux__) && !defined(__ANDROID__)

#include "error.hpp"
#include "log.hpp"

#include <X11/Xlib.h>
#include <X11/keysym.h>

#include <spawn.h>
#include <sys/wait.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <map>
#include <string>
#include <vector>

extern char** environ;

namespace webframe::platform {

namespace {

// ============================================================================
// Global hotkeys (Linux/X11)
// ============================================================================

KeySym ToKeySym(const std::string& key) {
  static const std::map<std::string, std::string> kNamed = {
    {"Space", "space"},   {"Enter", "Return"},     {"Tab", "Tab"},       {"Escape", "Escape"},
    {"Backspace", "BackSpace"}, {"Delete", "Delete"}, {"Insert", "Insert"}, {"Home", "Home"},
    {"End", "End"},       {"PageUp", "Prior"},     {"PageDown", "Next"}, {"Up", "Up"},
    {"Down", "Down"},     {"Left", "Left"},        {"Right", "Right"},    {"Plus", "plus"},
    {"Minus", "minus"},
  };

  if (const auto it = kNamed.find(key); it != kNamed.end()) {
    return XStringToKeysym(it->second.c_str());
  }

  if (key.size() == 1) {
    const std::string lower(1, static_cast<char>(std::tolower(static_cast<unsigned char>(key[0]))));
    return XStringToKeysym(lower.c_str());
  }

  // F1..F24 share their X11 names.
  return XStringToKeysym(key.c_str());
}

unsigned int ToMask(const Modifiers& modifiers) {
  unsigned int mask = 0;
  if (modifiers.control) mask |= ControlMask;
  if (modifiers.shift) mask |= ShiftMask;
  if (modifiers.alt) mask |= Mod1Mask;
  if (modifiers.super) mask |= Mod4Mask;
  return mask;
}

class X11Hotkeys : public HotkeySource {
public:
  X11Hotkeys() : display_(XOpenDisplay(nullptr)) {
    if (!display_) {
      log::Get()->info("no X11 display, global shortcuts are unavailable");
      return;
    }
    root_ = DefaultRootWindow(display_);
  }

  ~X11Hotkeys() override {
    if (!display_) {
      return;
    }
    for (const auto& [id, grab] : grabs_) {
      Ungrab(grab);
    }
    XCloseDisplay(display_);
  }

  bool Supported() const override { return display_ != nullptr; }

  bool Register(std::uint32_t id, const Accelerator& accelerator) override {
    if (!display_) {
      return false;
    }

    const KeySym keysym = ToKeySym(accelerator.key);
    if (keysym == NoSymbol) {
      log::Get()->warn("no X11 keysym for '{}'", accelerator.key);
      return false;
    }

    const KeyCode keycode = XKeysymToKeycode(display_, keysym);
    if (keycode == 0) {
      log::Get()->warn("no keycode for '{}' on this keyboard", accelerator.key);
      return false;
    }

    const Grab grab{keycode, ToMask(accelerator.modifiers)};
    for (const unsigned int mods : Variants(grab.modifiers)) {
      XGrabKey(display_, grab.keycode, mods, root_, True, GrabModeAsync, GrabModeAsync);
    }
    XFlush(display_);

    grabs_[id] = grab;
    return true;
  }

  void Unregister(std::uint32_t id) override {
    const auto it = grabs_.find(id);
    if (it == grabs_.end()) {
      return;
    }
    if (display_) {
      Ungrab(it->second);
      XFlush(display_);
    }
    grabs_.erase(it);
  }

  std::vector<std::uint32_t> Poll() override {
    std::vector<std::uint32_t> fired;
    if (!display_) {
      return fired;
    }

    while (XPending(display_) > 0) {
      XEvent event;
      XNextEvent(display_, &event);

      if (event.type != KeyPress) {
        continue;
      }

      // NumLock and CapsLock are ignored.
      const unsigned int state = event.xkey.state & (ControlMask | ShiftMask | Mod1Mask | Mod4Mask);
      for (const auto& [id, grab] : grabs_) {
        if (grab.keycode == event.xkey.keycode && grab.modifiers == state) {
          fired.push_back(id);
          break;
        }
      }
    }

    return fired;
  }

private:
  struct Grab {
    KeyCode keycode = 0;
    unsigned int modifiers = 0;
  };

  static std::vector<unsigned int> Variants(unsigned int modifiers) {
    return {modifiers, modifiers | Mod2Mask, modifiers | LockMask, modifiers | Mod2Mask | LockMask};
  }

  void Ungrab(const Grab& grab) {
    for (const unsigned int mods : Variants(grab.modifiers)) {
      XUngrabKey(display_, grab.keycode, mods, root_);
    }
  }

  Display* display_ = nullptr;
  ::Window root_ = 0;
  std::map<std::uint32_t, Grab> grabs_;
};

const char* UrgencyName(Urgency urgency) {
  switch (urgency) {
  case Urgency::kLow:
    return "low";
  case Urgency::kCritical:
    return "critical";
  case Urgency::kNormal:
    break;
  }
  return "normal";
}

}  // namespace

std::unique_ptr<HotkeySource> CreateHotkeySource() {
  return std::make_unique<X11Hotkeys>();
}

// ============================================================================
// Notification Implementation (Linux/notify-send)
// ============================================================================

void ShowNotification(const Notification& notification) {
  std::vector<std::string> args = {"notify-send", "-u", UrgencyName(notification.urgency)};

  if (notification.timeout_ms >= 0) {
    args.push_back("-t");
    args.push_back(std::to_string(notification.timeout_ms));
  }
  if (!notification.icon.empty()) {
    args.push_back("-i");
    args.push_back(notification.icon);
  }

  args.push_back("--");
  args.push_back(notification.title);
  if (!notification.body.empty()) {
    args.push_back(notification.body);
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  const int spawned = posix_spawnp(&pid, "notify-send", nullptr, nullptr, argv.data(), environ);
  if (spawned != 0) {
    throw Error(ErrorCode::kNotificationFailed, std::string("failed to run notify-send: ") + std::strerror(spawned));
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw Error(ErrorCode::kNotificationFailed, std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw Error(ErrorCode::kNotificationFailed, "notify-send exited with an error");
  }
}

}  // namespace webframe::platform

#endif
