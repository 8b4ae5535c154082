#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace webframe {

using WindowId = std::uint64_t;

struct Position {
  double x = 0;
  double y = 0;

  bool operator==(const Position&) const = default;
};

struct Size {
  double width = 0;
  double height = 0;

  bool operator==(const Size&) const = default;
};

struct Modifiers {
  bool shift = false;
  bool control = false;
  bool alt = false;
  bool super = false;

  bool operator==(const Modifiers&) const = default;
};

struct Monitor {
  std::string name;
  double scale_factor = 1.0;
  Position position;
  Size size;
};

enum class ControlFlow {
  kPoll,
  kWait,
  kExit,
};

// ============================================================================
// Events
// Everything the loop can observe. Each alternative maps to exactly one
// `type` discriminator on the wire.
// ============================================================================

namespace event {

struct NewEvents {
  std::string cause;
};

struct MainEventsCleared {};

struct LoopDestroyed {};

struct CloseRequested {
  WindowId window = 0;
};

struct Destroyed {
  WindowId window = 0;
};

struct Resized {
  WindowId window = 0;
  Size size;
};

struct Moved {
  WindowId window = 0;
  Position position;
};

struct Focused {
  WindowId window = 0;
  bool focused = false;
};

struct Minimized {
  WindowId window = 0;
  bool minimized = false;
};

struct Maximized {
  WindowId window = 0;
  bool maximized = false;
};

struct Navigated {
  WindowId window = 0;
  std::string url;
};

struct PageLoad {
  WindowId window = 0;
  bool finished = false;
};

struct TitleChanged {
  WindowId window = 0;
  std::string title;
};

struct UserExit {};

struct UserEvent {
  std::string payload;
};

struct MenuEvent {
  std::string menu_id;
};

struct TrayEvent {
  std::string tray_id;
  std::string event_type;
};

struct GlobalShortcut {
  std::uint32_t id = 0;
  std::string accelerator;
  Modifiers modifiers;
};

// Anything a backend reports that has no dedicated record.
struct Raw {
  std::string debug;
};

}  // namespace event

using Event = std::variant<
  event::NewEvents,
  event::MainEventsCleared,
  event::LoopDestroyed,
  event::CloseRequested,
  event::Destroyed,
  event::Resized,
  event::Moved,
  event::Focused,
  event::Minimized,
  event::Maximized,
  event::Navigated,
  event::PageLoad,
  event::TitleChanged,
  event::UserExit,
  event::UserEvent,
  event::MenuEvent,
  event::TrayEvent,
  event::GlobalShortcut,
  event::Raw>;

}  // namespace webframe
