#include "shortcuts.hpp"

#include "error.hpp"
#include "log.hpp"
#include "platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace webframe {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

// Applies `token` as a modifier. Returns false if it is not one.
bool ApplyModifier(const std::string& token, Modifiers& modifiers) {
  if (token == "ctrl" || token == "control") {
    modifiers.control = true;
  } else if (token == "shift") {
    modifiers.shift = true;
  } else if (token == "alt" || token == "option") {
    modifiers.alt = true;
  } else if (token == "super" || token == "cmd" || token == "command" || token == "meta" || token == "win") {
    modifiers.super = true;
  } else if (token == "cmdorctrl" || token == "commandorcontrol") {
#ifdef __APPLE__
    modifiers.super = true;
#else
    modifiers.control = true;
#endif
  } else {
    return false;
  }

  return true;
}

std::optional<std::string> CanonicalKey(const std::string& token) {
  static const std::unordered_map<std::string, std::string> named = {
    {"space", "Space"},         {"enter", "Enter"},       {"return", "Enter"},    {"tab", "Tab"},
    {"escape", "Escape"},       {"esc", "Escape"},        {"backspace", "Backspace"},
    {"delete", "Delete"},       {"del", "Delete"},        {"insert", "Insert"},   {"ins", "Insert"},
    {"home", "Home"},           {"end", "End"},           {"pageup", "PageUp"},   {"pagedown", "PageDown"},
    {"up", "Up"},               {"arrowup", "Up"},        {"down", "Down"},       {"arrowdown", "Down"},
    {"left", "Left"},           {"arrowleft", "Left"},    {"right", "Right"},     {"arrowright", "Right"},
    {"plus", "Plus"},           {"minus", "Minus"},
  };

  if (token.size() == 1) {
    const auto c = static_cast<unsigned char>(token.front());
    if (std::isalpha(c)) {
      return std::string(1, static_cast<char>(std::toupper(c)));
    }
    if (std::isdigit(c)) {
      return token;
    }
    if (token == "-") {
      return "Minus";
    }
  }

  if (token.size() >= 2 && token.size() <= 3 && token.front() == 'f' &&
      std::all_of(token.begin() + 1, token.end(), [](unsigned char c) { return std::isdigit(c); })) {
    const int number = std::stoi(token.substr(1));
    if (number >= 1 && number <= 24) {
      return "F" + std::to_string(number);
    }
    return std::nullopt;
  }

  if (const auto it = named.find(token); it != named.end()) {
    return it->second;
  }

  return std::nullopt;
}

}  // namespace

// ============================================================================
// Accelerator parsing
// ============================================================================

Accelerator ParseAccelerator(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    throw Error(ErrorCode::kInvalidParameter, "accelerator is empty");
  }

  Accelerator result;
  bool has_key = false;

  std::size_t start = 0;
  while (start <= trimmed.size()) {
    const auto end = std::min(trimmed.find('+', start), trimmed.size());
    const auto token = Lower(Trim(trimmed.substr(start, end - start)));
    start = end + 1;

    if (token.empty()) {
      throw Error(ErrorCode::kInvalidParameter, "accelerator '" + std::string(trimmed) + "' has an empty segment");
    }

    if (ApplyModifier(token, result.modifiers)) {
      continue;
    }

    const auto key = CanonicalKey(token);
    if (!key) {
      throw Error(ErrorCode::kInvalidParameter, "unknown key '" + token + "' in accelerator");
    }

    if (has_key) {
      throw Error(ErrorCode::kInvalidParameter, "accelerator '" + std::string(trimmed) + "' names more than one key");
    }

    result.key = *key;
    has_key = true;
  }

  if (!has_key) {
    throw Error(ErrorCode::kInvalidParameter, "accelerator '" + std::string(trimmed) + "' has no key");
  }

  return result;
}

std::string FormatAccelerator(const Accelerator& accelerator) {
  std::string out;

  const auto append = [&out](const char* part) {
    if (!out.empty()) {
      out += '+';
    }
    out += part;
  };

  if (accelerator.modifiers.control) append("Ctrl");
  if (accelerator.modifiers.alt) append("Alt");
  if (accelerator.modifiers.shift) append("Shift");
  if (accelerator.modifiers.super) append("Super");
  append(accelerator.key.c_str());

  return out;
}

// ============================================================================
// ShortcutManager
// ============================================================================

ShortcutManager::ShortcutManager(HotkeySource& source) : source_(source) {}

ShortcutManager::~ShortcutManager() {
  UnregisterAll();
}

std::uint32_t ShortcutManager::Register(std::string_view text) {
  if (!source_.Supported()) {
    throw Error(ErrorCode::kNotSupported, "global shortcuts are not supported on this platform");
  }

  auto accelerator = ParseAccelerator(text);

  const auto duplicate = std::find_if(registered_.begin(), registered_.end(),
                                      [&accelerator](const auto& entry) { return entry.second == accelerator; });
  if (duplicate != registered_.end()) {
    throw Error(ErrorCode::kInvalidParameter,
                "shortcut " + FormatAccelerator(accelerator) + " is already registered");
  }

  const auto id = next_id_++;

  if (!source_.Register(id, accelerator)) {
    throw Error(ErrorCode::kUnknown, "the system refused shortcut " + FormatAccelerator(accelerator));
  }

  log::Get()->debug("registered shortcut {} as {}", FormatAccelerator(accelerator), id);
  registered_.emplace(id, std::move(accelerator));
  return id;
}

bool ShortcutManager::Unregister(std::uint32_t id) {
  const auto it = registered_.find(id);
  if (it == registered_.end()) {
    return false;
  }

  source_.Unregister(id);
  registered_.erase(it);
  return true;
}

void ShortcutManager::UnregisterAll() {
  for (const auto& [id, accelerator] : registered_) {
    source_.Unregister(id);
  }
  registered_.clear();
}

std::vector<event::GlobalShortcut> ShortcutManager::Poll() {
  std::vector<event::GlobalShortcut> fired;

  if (registered_.empty()) {
    return fired;
  }

  for (const auto id : source_.Poll()) {
    const auto it = registered_.find(id);
    if (it == registered_.end()) {
      continue;
    }

    fired.push_back(event::GlobalShortcut{
      .id = id,
      .accelerator = FormatAccelerator(it->second),
      .modifiers = it->second.modifiers,
    });
  }

  return fired;
}

}  // namespace webframe
