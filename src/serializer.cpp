#include "serializer.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <utility>

namespace webframe {

namespace {

template <typename T>
std::string Write(T&& value) {
  return glz::write_json(std::forward<T>(value)).value_or("null");
}

std::string IdOf(WindowId id) {
  return std::to_string(id);
}

struct EventWriter {
  std::string operator()(const event::NewEvents& e) const {
    return Write(glz::obj{"type", "new-events", "cause", e.cause});
  }

  std::string operator()(const event::MainEventsCleared&) const {
    return Write(glz::obj{"type", "main-events-cleared"});
  }

  std::string operator()(const event::LoopDestroyed&) const {
    return Write(glz::obj{"type", "loop-destroyed"});
  }

  std::string operator()(const event::CloseRequested& e) const {
    return Write(glz::obj{"type", "window-close-requested", "window_id", IdOf(e.window)});
  }

  std::string operator()(const event::Destroyed& e) const {
    return Write(glz::obj{"type", "window-destroyed", "window_id", IdOf(e.window)});
  }

  std::string operator()(const event::Resized& e) const {
    return Write(glz::obj{"type", "window-resized", "window_id", IdOf(e.window), "size", e.size});
  }

  std::string operator()(const event::Moved& e) const {
    return Write(glz::obj{"type", "window-moved", "window_id", IdOf(e.window), "position", e.position});
  }

  std::string operator()(const event::Focused& e) const {
    return Write(glz::obj{"type", "window-focused", "window_id", IdOf(e.window), "focused", e.focused});
  }

  std::string operator()(const event::Minimized& e) const {
    return Write(glz::obj{"type", "window-minimized", "window_id", IdOf(e.window), "minimized", e.minimized});
  }

  std::string operator()(const event::Maximized& e) const {
    return Write(glz::obj{"type", "window-maximized", "window_id", IdOf(e.window), "maximized", e.maximized});
  }

  std::string operator()(const event::Navigated& e) const {
    return Write(glz::obj{"type", "webview-navigated", "window_id", IdOf(e.window), "url", e.url});
  }

  std::string operator()(const event::PageLoad& e) const {
    return Write(glz::obj{"type", "webview-page-load", "window_id", IdOf(e.window), "state",
                          e.finished ? "finished" : "started"});
  }

  std::string operator()(const event::TitleChanged& e) const {
    return Write(glz::obj{"type", "webview-title-changed", "window_id", IdOf(e.window), "title", e.title});
  }

  std::string operator()(const event::UserExit&) const {
    return Write(glz::obj{"type", "user-exit"});
  }

  std::string operator()(const event::UserEvent& e) const {
    return Write(glz::obj{"type", "user-event", "payload", e.payload});
  }

  std::string operator()(const event::MenuEvent& e) const {
    return Write(glz::obj{"type", "menu-event", "menu_id", e.menu_id});
  }

  std::string operator()(const event::TrayEvent& e) const {
    return Write(glz::obj{"type", "tray-event", "tray_id", e.tray_id, "event_type", e.event_type});
  }

  std::string operator()(const event::GlobalShortcut& e) const {
    return Write(glz::obj{"type", "global-shortcut", "id", e.id, "accelerator", e.accelerator, "modifiers",
                          e.modifiers});
  }

  std::string operator()(const event::Raw& e) const {
    return Write(glz::obj{"type", "raw", "debug", e.debug});
  }
};

}  // namespace

std::string Serialize(const Event& event) {
  return std::visit(EventWriter{}, event);
}

std::string SerializeMonitor(const Monitor& monitor) {
  return Write(monitor);
}

std::string SerializeMonitors(const std::vector<Monitor>& monitors) {
  return Write(monitors);
}

std::string QuoteJson(std::string_view value) {
  return glz::write_json(std::string{value}).value_or("\"\"");
}

}  // namespace webframe
