#pragma once

#include "events.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace webframe {

class HotkeySource;

// ============================================================================
// Accelerator
// "Mod+Mod+Key". Keys are kept in canonical spelling: "A".."Z", "0".."9",
// "F1".."F24", and Space, Enter, Tab, Escape, Backspace, Delete, Insert,
// Home, End, PageUp, PageDown, Up, Down, Left, Right, Plus, Minus.
// ============================================================================

struct Accelerator {
  Modifiers modifiers;
  std::string key;

  bool operator==(const Accelerator&) const = default;
};

// Throws Error(kInvalidParameter) on malformed input.
Accelerator ParseAccelerator(std::string_view text);

std::string FormatAccelerator(const Accelerator& accelerator);

// ============================================================================
// ShortcutManager
// Per-application registry of global shortcuts on top of a HotkeySource.
// Loop thread only.
// ============================================================================

class ShortcutManager {
public:
  explicit ShortcutManager(HotkeySource& source);
  ~ShortcutManager();

  ShortcutManager(const ShortcutManager&) = delete;
  ShortcutManager& operator=(const ShortcutManager&) = delete;

  // Returns the new, non-zero id. Throws Error on failure.
  std::uint32_t Register(std::string_view accelerator);
  bool Unregister(std::uint32_t id);
  void UnregisterAll();

  bool Active() const { return !registered_.empty(); }

  std::vector<event::GlobalShortcut> Poll();

private:
  HotkeySource& source_;
  std::map<std::uint32_t, Accelerator> registered_;
  std::uint32_t next_id_ = 1;
};

}  // namespace webframe
