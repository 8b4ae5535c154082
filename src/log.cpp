#include "log.hpp"

#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webframe::log {

namespace {

constexpr const char* kLoggerName = "webframe";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// ============================================================================
// Host sink
// Hands records to a C callback supplied by the embedding runtime.
// ============================================================================

class HostSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  void SetCallback(HostCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
  }

protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) {
      return;
    }

    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);

    std::string text(formatted.data(), formatted.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }

    callback_(msg.level, text.c_str());
  }

  void flush_() override {}

private:
  HostCallback callback_;
};

struct State {
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<HostSink> host_sink;
};

State& Instance() {
  static State state = [] {
    State result;
    result.host_sink = std::make_shared<HostSink>();

    if (auto existing = spdlog::get(kLoggerName); existing != nullptr) {
      existing->sinks().push_back(result.host_sink);
      result.logger = existing;
      return result;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    sinks.push_back(result.host_sink);

    if (const char* file = std::getenv("WEBFRAME_LOG_FILE"); file != nullptr && file[0] != '\0') {
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
      } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("webframe: cannot open log file {}: {}", file, e.what());
      }
    }

    result.logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    result.logger->set_pattern(kPattern);
    result.logger->set_level(spdlog::level::warn);

    if (const char* level = std::getenv("WEBFRAME_LOG_LEVEL"); level != nullptr && level[0] != '\0') {
      const auto parsed = spdlog::level::from_str(level);
      if (parsed != spdlog::level::off || std::string_view(level) == "off") {
        result.logger->set_level(parsed);
      }
    }

    spdlog::register_logger(result.logger);
    return result;
  }();

  return state;
}

}  // namespace

std::shared_ptr<spdlog::logger> Get() {
  return Instance().logger;
}

void SetHostCallback(HostCallback callback) {
  Instance().host_sink->SetCallback(std::move(callback));
}

void SetLevel(spdlog::level::level_enum level) {
  Instance().logger->set_level(level);
}

}  // namespace webframe::log
