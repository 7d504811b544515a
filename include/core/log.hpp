#pragma once

#include <string>
#include <string_view>

namespace utc_time::core {

enum class LogLevel { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

// Throws std::runtime_error for anything other than error, warn, info or debug.
LogLevel parse_log_level(const std::string& value);
std::string_view log_level_name(LogLevel level) noexcept;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

// Writes "[tag] message" to stderr as one line. stdout carries the STDIO
// protocol channel and is never written here.
void log(LogLevel level, std::string_view tag, std::string_view message);

inline void log_error(std::string_view tag, std::string_view message) { log(LogLevel::kError, tag, message); }
inline void log_warn(std::string_view tag, std::string_view message) { log(LogLevel::kWarn, tag, message); }
inline void log_info(std::string_view tag, std::string_view message) { log(LogLevel::kInfo, tag, message); }
inline void log_debug(std::string_view tag, std::string_view message) { log(LogLevel::kDebug, tag, message); }

}  // namespace utc_time::core
