#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace webframe {

// ============================================================================
// Error codes
// Values are part of the ABI and mirror WEBFRAME_ERROR.
// ============================================================================

enum class ErrorCode : std::int32_t {
  kSuccess = 0,
  kInvalidHandle = 1,
  kWindowCreationFailed = 2,
  kWebviewCreationFailed = 3,
  kNavigationFailed = 4,
  kScriptError = 5,
  kProtocolError = 6,
  kInvalidParameter = 7,
  kNotSupported = 8,
  kDialogCancelled = 9,
  kNotificationFailed = 10,
  kIconLoadFailed = 11,
  kEventLoopError = 12,
  kUnknown = 255,
};

const char* ToString(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

// ============================================================================
// Last error
// One cell per thread, overwritten by every failing boundary call.
// ============================================================================

namespace last_error {

void Set(ErrorCode code, std::string message);
void Clear();

// Null when no failure was recorded on this thread.
const char* Message();
ErrorCode Code();

}  // namespace last_error

}  // namespace webframe
