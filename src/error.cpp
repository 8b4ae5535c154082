#include "error.hpp"

#include <utility>

namespace webframe {

namespace {

struct LastError {
  ErrorCode code = ErrorCode::kSuccess;
  std::string message;
  bool set = false;
};

LastError& Cell() {
  thread_local LastError cell;
  return cell;
}

}  // namespace

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "success";
    case ErrorCode::kInvalidHandle:
      return "invalid handle";
    case ErrorCode::kWindowCreationFailed:
      return "window creation failed";
    case ErrorCode::kWebviewCreationFailed:
      return "webview creation failed";
    case ErrorCode::kNavigationFailed:
      return "navigation failed";
    case ErrorCode::kScriptError:
      return "script error";
    case ErrorCode::kProtocolError:
      return "protocol error";
    case ErrorCode::kInvalidParameter:
      return "invalid parameter";
    case ErrorCode::kNotSupported:
      return "not supported";
    case ErrorCode::kDialogCancelled:
      return "dialog cancelled";
    case ErrorCode::kNotificationFailed:
      return "notification failed";
    case ErrorCode::kIconLoadFailed:
      return "icon load failed";
    case ErrorCode::kEventLoopError:
      return "event loop error";
    case ErrorCode::kUnknown:
      return "unknown error";
  }

  return "unknown error";
}

namespace last_error {

void Set(ErrorCode code, std::string message) {
  auto& cell = Cell();
  cell.code = code;
  cell.message = std::move(message);
  cell.set = true;
}

void Clear() {
  auto& cell = Cell();
  cell.code = ErrorCode::kSuccess;
  cell.message.clear();
  cell.set = false;
}

const char* Message() {
  const auto& cell = Cell();
  return cell.set ? cell.message.c_str() : nullptr;
}

ErrorCode Code() {
  return Cell().code;
}

}  // namespace last_error

}  // namespace webframe
