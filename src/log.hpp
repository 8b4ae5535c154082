#pragma once

#include <spdlog/spdlog.h>

#include <functional>
#include <memory>

namespace webframe::log {

using HostCallback = std::function<void(spdlog::level::level_enum level, const char* message)>;

// The "webframe" logger. Level and file output are read once from WEBFRAME_LOG_LEVEL and WEBFRAME_LOG_FILE.
std::shared_ptr<spdlog::logger> Get();

// Forwards every formatted record to `callback`. An empty callback removes the redirect.
void SetHostCallback(HostCallback callback);

void SetLevel(spdlog::level::level_enum level);

}  // namespace webframe::log
