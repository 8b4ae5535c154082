#include "protocol.hpp"

#include "error.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace webframe {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

ProtocolResponse NotFound() {
  ProtocolResponse response;
  response.status = 404;
  response.mime_type = "text/plain";
  return response;
}

}  // namespace

bool IsValidScheme(std::string_view scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
    return false;
  }

  return std::all_of(scheme.begin(), scheme.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '.' || c == '-';
  });
}

std::optional<std::string> SchemeOf(std::string_view url) {
  const auto colon = url.find(':');
  if (colon == std::string_view::npos || colon + 1 >= url.size()) {
    return std::nullopt;
  }

  const auto scheme = url.substr(0, colon);
  if (!IsValidScheme(scheme)) {
    return std::nullopt;
  }

  return Lower(scheme);
}

// ============================================================================
// ProtocolTable
// ============================================================================

void ProtocolTable::Register(std::string scheme, Handler handler) {
  if (!IsValidScheme(scheme)) {
    throw Error(ErrorCode::kProtocolError, "invalid scheme '" + scheme + "'");
  }

  if (!handler.callback) {
    throw Error(ErrorCode::kInvalidParameter, "protocol handler is null");
  }

  std::unique_lock lock(mutex_);
  handlers_.insert_or_assign(Lower(scheme), handler);
}

bool ProtocolTable::Unregister(std::string_view scheme) {
  std::unique_lock lock(mutex_);
  return handlers_.erase(Lower(scheme)) > 0;
}

std::vector<std::string> ProtocolTable::Schemes() const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> schemes;
  schemes.reserve(handlers_.size());

  for (const auto& [scheme, handler] : handlers_) {
    schemes.push_back(scheme);
  }

  std::sort(schemes.begin(), schemes.end());
  return schemes;
}

ProtocolResponse ProtocolTable::Handle(std::string_view scheme, const ProtocolRequest& request) const {
  Handler handler;
  {
    std::shared_lock lock(mutex_);
    const auto it = handlers_.find(Lower(scheme));
    if (it == handlers_.end()) {
      log::Get()->debug("no handler for scheme '{}' ({})", scheme, request.url);
      return NotFound();
    }
    handler = it->second;
  }

  std::vector<webframe_header> headers;
  headers.reserve(request.headers.size());

  for (const auto& [name, value] : request.headers) {
    headers.push_back({name.c_str(), value.c_str()});
  }

  const webframe_protocol_request raw{
    .url = request.url.c_str(),
    .method = request.method.c_str(),
    .headers = headers.data(),
    .header_count = headers.size(),
    .body = request.body.data(),
    .body_length = request.body.size(),
    .window_id = request.window,
  };

  webframe_protocol_response out{};

  if (!handler.callback(&raw, &out, handler.user_data)) {
    if (out.release) {
      out.release(out.release_user_data);
    }
    return NotFound();
  }

  ProtocolResponse response;
  response.status = out.status == 0 ? 200 : out.status;

  if (out.mime_type) {
    response.mime_type = out.mime_type;
  }

  for (std::size_t i = 0; i < out.header_count; ++i) {
    if (out.headers[i].name && out.headers[i].value) {
      response.headers.insert_or_assign(out.headers[i].name, out.headers[i].value);
    }
  }

  if (out.body && out.body_length > 0) {
    response.body.assign(out.body, out.body + out.body_length);
  }

  if (out.release) {
    out.release(out.release_user_data);
  }

  return response;
}

}  // namespace webframe
