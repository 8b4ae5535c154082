#pragma once

#include <webframe/callbacks.h>

#include <functional>
#include <utility>

namespace webframe {

// ============================================================================
// Callback slot
// A foreign function pointer plus the opaque pointer handed back to it.
// User data is never dereferenced here.
// ============================================================================

template <typename Fn>
struct Slot {
  Fn callback = nullptr;
  void* user_data = nullptr;

  explicit operator bool() const { return callback != nullptr; }

  void Set(Fn fn, void* data) {
    callback = fn;
    user_data = fn ? data : nullptr;
  }

  template <typename... Args>
  auto operator()(Args&&... args) const {
    return std::invoke(callback, std::forward<Args>(args)..., user_data);
  }
};

// One slot per event kind. Invoked on the loop thread only.
struct CallbackSet {
  Slot<webframe_message_callback> message;
  Slot<webframe_closing_callback> closing;
  Slot<webframe_resized_callback> resized;
  Slot<webframe_moved_callback> moved;
  Slot<webframe_focus_callback> focus;
  Slot<webframe_navigation_callback> navigation;

  // Unset gating slots allow.
  bool AllowClose(webframe_window* window) const {
    return closing ? closing(window) : true;
  }

  bool AllowNavigation(webframe_window* window, const char* url) const {
    return navigation ? navigation(window, url) : true;
  }
};

}  // namespace webframe
