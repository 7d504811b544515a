#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace utc_time::clock {

// One reading of CLOCK_REALTIME. Every field of a time document is derived
// from a single snapshot so no two fields can disagree.
struct TimeSnapshot {
  std::int64_t seconds{0};
  std::uint32_t nanos{0};

  [[nodiscard]] std::int64_t nanos_since_epoch() const noexcept;
  [[nodiscard]] std::int64_t microseconds() const noexcept;
  [[nodiscard]] std::int64_t milliseconds() const noexcept;
};

class FormatError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class TimezoneError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

TimeSnapshot snapshot_time();

// strftime-style formatting of `snapshot` in zone `timezone`. Throws
// FormatError for an empty pattern or an unknown or dangling conversion, and
// TimezoneError for an unknown zone.
std::string format_time(const TimeSnapshot& snapshot, const std::string& pattern, const std::string& timezone = "UTC");

// Full time document: unix block, standard renderings, calendar fields,
// offset and the fixed set of custom formats.
nlohmann::json describe_time(const TimeSnapshot& snapshot, const std::string& timezone = "UTC");

// {seconds, nanos, nanos_since_epoch}
nlohmann::json describe_unix(const TimeSnapshot& snapshot);

// Seconds east of UTC for `timezone` at `seconds`.
int utc_offset_seconds(std::int64_t seconds, const std::string& timezone);

nlohmann::json convert_time(std::int64_t timestamp, const std::string& from_timezone, const std::string& to_timezone);

// IANA zone names found under the zoneinfo tree, sorted. Always contains "UTC".
std::vector<std::string> list_timezones();
bool is_valid_timezone(const std::string& name);

}  // namespace utc_time::clock
