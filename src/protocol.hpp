#pragma once

#include "events.hpp"

#include <webframe/protocol.h>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace webframe {

struct ProtocolRequest {
  std::string url;
  std::string method = "GET";
  std::vector<std::pair<std::string, std::string>> headers;
  std::vector<std::uint8_t> body;
  WindowId window = 0;
};

struct ProtocolResponse {
  int status = 200;
  std::string mime_type = "application/octet-stream";
  std::map<std::string, std::string> headers;
  std::vector<std::uint8_t> body;
};

// `[A-Za-z][A-Za-z0-9+.-]*`
bool IsValidScheme(std::string_view scheme);

// The scheme of `url`, or nothing if `url` does not start with one.
std::optional<std::string> SchemeOf(std::string_view url);

// ============================================================================
// ProtocolTable
// Scheme handlers keyed by lower-case scheme. Webviews resolve requests on
// their own threads while the loop thread registers, so access is guarded by
// a reader/writer lock.
// ============================================================================

class ProtocolTable {
public:
  struct Handler {
    webframe_protocol_handler callback = nullptr;
    void* user_data = nullptr;
  };

  // Throws Error(kProtocolError) for malformed schemes.
  void Register(std::string scheme, Handler handler);
  bool Unregister(std::string_view scheme);

  std::vector<std::string> Schemes() const;

  // Resolves `request`. Missing handlers and declined requests produce a 404.
  ProtocolResponse Handle(std::string_view scheme, const ProtocolRequest& request) const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Handler> handlers_;
};

}  // namespace webframe
