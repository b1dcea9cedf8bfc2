#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace a2s::logging {

enum class LogLevel { trace, debug, info, warn, error, off };

// Replace the process-wide logger. When to_console is false and log_file is
// empty, output is discarded.
void configure_logging(LogLevel level, bool to_console, const std::string& log_file = {});

// Returns the active logger. Before configure_logging() is called this is a
// stderr logger at warn level.
std::shared_ptr<spdlog::logger> logger();

LogLevel parse_log_level(const std::string& name, LogLevel fallback);

}  // namespace a2s::logging

#define LOG_TRACE(...) ::a2s::logging::logger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::a2s::logging::logger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::a2s::logging::logger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::a2s::logging::logger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::a2s::logging::logger()->error(__VA_ARGS__)
