#include "core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace utc_time::core {
namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

}  // namespace

LogLevel parse_log_level(const std::string& value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "error") {
    return LogLevel::kError;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "debug" || lower == "trace") {
    return LogLevel::kDebug;
  }
  throw std::runtime_error("log.level must be one of error, warn, info, debug");
}

std::string_view log_level_name(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
  }
  return "info";
}

void set_log_level(const LogLevel level) noexcept { g_log_level.store(static_cast<int>(level)); }

LogLevel log_level() noexcept { return static_cast<LogLevel>(g_log_level.load()); }

bool log_enabled(const LogLevel level) noexcept { return static_cast<int>(level) <= g_log_level.load(); }

void log(const LogLevel level, const std::string_view tag, const std::string_view message) {
  if (!log_enabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << '[' << tag << "] ";
  if (level == LogLevel::kError || level == LogLevel::kWarn) {
    std::cerr << log_level_name(level) << ": ";
  }
  std::cerr << message << '\n';
}

}  // namespace utc_time::core
