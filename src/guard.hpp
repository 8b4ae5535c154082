#pragma once

#include "error.hpp"
#include "log.hpp"

#include <webframe/types.h>

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace webframe {

// ============================================================================
// Boundary guard
// Every exported function runs its body through one of these so that no
// exception unwinds into the host runtime.
// ============================================================================

inline void Fail(const char* where, ErrorCode code, const std::string& message) {
  last_error::Set(code, message);
  log::Get()->warn("{}: {} ({})", where, message, ToString(code));
}

template <typename T, typename Fn>
T Guard(const char* where, T fallback, Fn&& fn) noexcept {
  try {
    return std::invoke(std::forward<Fn>(fn));
  } catch (const Error& e) {
    Fail(where, e.code(), e.what());
  } catch (const std::exception& e) {
    last_error::Set(ErrorCode::kUnknown, e.what());
    log::Get()->error("{}: unexpected exception: {}", where, e.what());
  } catch (...) {
    last_error::Set(ErrorCode::kUnknown, "unexpected non-standard exception");
    log::Get()->error("{}: unexpected non-standard exception", where);
  }

  return fallback;
}

template <typename Fn>
void GuardVoid(const char* where, Fn&& fn) noexcept {
  Guard(where, 0, [&fn] {
    std::invoke(fn);
    return 0;
  });
}

// Runs `fn` and folds its outcome into a webframe_result. `fn` returns nothing and reports failure by throwing.
template <typename Fn>
webframe_result GuardResult(const char* where, Fn&& fn) noexcept {
  const bool ok = Guard(where, false, [&fn] {
    std::invoke(fn);
    return true;
  });

  if (ok) {
    return {true, static_cast<std::int32_t>(ErrorCode::kSuccess), nullptr};
  }

  return {false, static_cast<std::int32_t>(last_error::Code()), last_error::Message()};
}

inline webframe_result InvalidHandle(const char* where) {
  Fail(where, ErrorCode::kInvalidHandle, "handle is null");
  return {false, static_cast<std::int32_t>(ErrorCode::kInvalidHandle), last_error::Message()};
}

}  // namespace webframe
