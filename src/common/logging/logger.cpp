#include "common/logging/logger.h"

#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace a2s::logging {

namespace {

constexpr const char* kLoggerName = "a2s";

std::mutex& logger_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger>& active_logger() {
  static std::shared_ptr<spdlog::logger> instance;
  return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace: return spdlog::level::trace;
    case LogLevel::debug: return spdlog::level::debug;
    case LogLevel::info: return spdlog::level::info;
    case LogLevel::warn: return spdlog::level::warn;
    case LogLevel::error: return spdlog::level::err;
    case LogLevel::off: return spdlog::level::off;
  }
  return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto result = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
  result->set_level(spdlog::level::warn);
  return result;
}

}  // namespace

void configure_logging(LogLevel level, bool to_console, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  if (to_console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }

  auto configured = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  configured->set_level(to_spdlog(level));
  configured->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  configured->flush_on(spdlog::level::warn);

  std::lock_guard<std::mutex> lock(logger_mutex());
  active_logger() = std::move(configured);
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& instance = active_logger();
  if (!instance) {
    instance = make_default_logger();
  }
  return instance;
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
  if (name == "trace") return LogLevel::trace;
  if (name == "debug") return LogLevel::debug;
  if (name == "info") return LogLevel::info;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "off") return LogLevel::off;
  return fallback;
}

}  // namespace a2s::logging
