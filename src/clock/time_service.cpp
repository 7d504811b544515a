#include "clock/time_service.hpp"

#include <time.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace utc_time::clock {
namespace {

constexpr std::string_view kStrftimeConversions = "aAbBcCdDeFgGhHIjmMnprRsStTuUVwWxXyYzZ%+";
constexpr std::size_t kMaxFormattedSize = 64U * 1024U;

// TZ is process-global; switching it is serialized here.
std::mutex g_tz_mutex;

// TZDIR is read once, under the TZ lock.
const std::filesystem::path& zoneinfo_root() {
  static const std::filesystem::path root = []() {
    std::lock_guard<std::mutex> lock(g_tz_mutex);
    if (const char* tzdir = std::getenv("TZDIR"); tzdir != nullptr && *tzdir != '\0') {
      return std::filesystem::path(tzdir);
    }
    return std::filesystem::path("/usr/share/zoneinfo");
  }();
  return root;
}

bool is_utc_name(const std::string& name) noexcept {
  return name == "UTC" || name == "Etc/UTC" || name == "Z" || name == "Zulu";
}

bool has_tzif_magic(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  char magic[4]{};
  if (!input.read(magic, sizeof(magic))) {
    return false;
  }
  return std::memcmp(magic, "TZif", sizeof(magic)) == 0;
}

void validate_pattern(const std::string& pattern) {
  if (pattern.empty()) {
    throw FormatError("format string must not be empty");
  }

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] != '%') {
      continue;
    }

    ++i;
    if (i < pattern.size() && (pattern[i] == 'E' || pattern[i] == 'O')) {
      ++i;
    }
    if (i >= pattern.size()) {
      throw FormatError("format string ends with an incomplete conversion");
    }
    if (kStrftimeConversions.find(pattern[i]) == std::string_view::npos) {
      throw FormatError(std::string("unsupported conversion specifier %") + pattern[i]);
    }
  }
}

std::string render(const std::tm& tm, const std::string& pattern) {
  std::vector<char> buffer(std::max<std::size_t>(128U, pattern.size() * 16U));
  while (buffer.size() <= kMaxFormattedSize) {
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &tm);
    if (written > 0) {
      return std::string(buffer.data(), written);
    }
    buffer.resize(buffer.size() * 2U);
  }
  // strftime legitimately returns 0 for conversions that expand to nothing.
  return {};
}

std::string two_digits(const int value) {
  char out[8]{};
  std::snprintf(out, sizeof(out), "%02d", value);
  return out;
}

std::string offset_suffix(const int offset_seconds, const bool use_z) {
  if (offset_seconds == 0 && use_z) {
    return "Z";
  }
  const int magnitude = std::abs(offset_seconds);
  return std::string(offset_seconds < 0 ? "-" : "+") + two_digits(magnitude / 3600) + ":" +
         two_digits((magnitude % 3600) / 60);
}

std::string fraction(const std::uint32_t nanos) {
  char out[16]{};
  std::snprintf(out, sizeof(out), ".%09u", nanos);
  return out;
}

// Runs `fn` with the broken-down time of `seconds` in `timezone`. For zones
// other than UTC the call holds the TZ lock so tm_zone stays valid.
template <typename Fn>
auto with_zone(const std::int64_t seconds, const std::string& timezone, Fn&& fn) {
  const auto when = static_cast<std::time_t>(seconds);
  std::tm tm{};

  if (is_utc_name(timezone)) {
    if (gmtime_r(&when, &tm) == nullptr) {
      throw std::invalid_argument("timestamp out of range");
    }
    tm.tm_zone = "UTC";
    return fn(tm);
  }

  if (!is_valid_timezone(timezone)) {
    throw TimezoneError("Invalid timezone: " + timezone);
  }

  std::lock_guard<std::mutex> lock(g_tz_mutex);
  std::optional<std::string> previous;
  if (const char* current = std::getenv("TZ"); current != nullptr) {
    previous = current;
  }

  const std::string tz_value = ":" + timezone;
  ::setenv("TZ", tz_value.c_str(), 1);
  ::tzset();

  struct Restore {
    const std::optional<std::string>& previous;
    ~Restore() {
      if (previous.has_value()) {
        ::setenv("TZ", previous->c_str(), 1);
      } else {
        ::unsetenv("TZ");
      }
      ::tzset();
    }
  } restore{previous};

  if (localtime_r(&when, &tm) == nullptr) {
    throw std::invalid_argument("timestamp out of range");
  }
  return fn(tm);
}

std::string rfc3339(const std::tm& tm, const std::uint32_t nanos, const bool use_z) {
  return render(tm, "%Y-%m-%dT%H:%M:%S") + fraction(nanos) + offset_suffix(static_cast<int>(tm.tm_gmtoff), use_z);
}

}  // namespace

std::int64_t TimeSnapshot::nanos_since_epoch() const noexcept {
  return (seconds * 1000000000LL) + static_cast<std::int64_t>(nanos);
}

std::int64_t TimeSnapshot::microseconds() const noexcept {
  return (seconds * 1000000LL) + static_cast<std::int64_t>(nanos / 1000U);
}

std::int64_t TimeSnapshot::milliseconds() const noexcept {
  return (seconds * 1000LL) + static_cast<std::int64_t>(nanos / 1000000U);
}

TimeSnapshot snapshot_time() {
  timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    throw std::system_error(errno, std::generic_category(), "clock_gettime(CLOCK_REALTIME)");
  }
  return TimeSnapshot{.seconds = static_cast<std::int64_t>(ts.tv_sec), .nanos = static_cast<std::uint32_t>(ts.tv_nsec)};
}

std::string format_time(const TimeSnapshot& snapshot, const std::string& pattern, const std::string& timezone) {
  validate_pattern(pattern);
  return with_zone(snapshot.seconds, timezone, [&pattern](const std::tm& tm) { return render(tm, pattern); });
}

nlohmann::json describe_unix(const TimeSnapshot& snapshot) {
  return nlohmann::json{
      {"seconds", snapshot.seconds}, {"nanos", snapshot.nanos}, {"nanos_since_epoch", snapshot.nanos_since_epoch()}};
}

nlohmann::json describe_time(const TimeSnapshot& snapshot, const std::string& timezone) {
  const bool utc = is_utc_name(timezone);
  return with_zone(snapshot.seconds, timezone, [&](const std::tm& tm) {
    const int offset = static_cast<int>(tm.tm_gmtoff);
    return nlohmann::json{
        {"unix", describe_unix(snapshot)},
        {"iso8601", rfc3339(tm, snapshot.nanos, true)},
        {"rfc3339", rfc3339(tm, snapshot.nanos, false)},
        {"rfc2822", render(tm, "%a, %d %b %Y %H:%M:%S %z")},
        {"ctime", render(tm, "%c")},
        {"nanos_since_epoch", snapshot.nanos_since_epoch()},
        {"seconds", snapshot.seconds},
        {"microseconds", snapshot.microseconds()},
        {"milliseconds", snapshot.milliseconds()},
        {"year", tm.tm_year + 1900},
        {"month", tm.tm_mon + 1},
        {"day", tm.tm_mday},
        {"hour", tm.tm_hour},
        {"minute", tm.tm_min},
        {"second", tm.tm_sec},
        {"nanosecond", snapshot.nanos},
        {"timezone", utc ? std::string("UTC") : timezone},
        {"abbreviation", tm.tm_zone != nullptr ? std::string(tm.tm_zone) : std::string()},
        {"offset", offset},
        {"is_dst", tm.tm_isdst > 0},
        {"weekday", render(tm, "%A")},
        {"week_of_year", std::stoi(render(tm, "%U"))},
        {"day_of_year", tm.tm_yday + 1},
        {"custom_formats",
         {{"unix_date", render(tm, "%a %b %e %H:%M:%S %Z %Y")},
          {"syslog", render(tm, "%b %d %H:%M:%S")},
          {"apache_log", render(tm, "%d/%b/%Y:%H:%M:%S %z")},
          {"unix_timestamp", std::to_string(snapshot.seconds)}}}};
  });
}

int utc_offset_seconds(const std::int64_t seconds, const std::string& timezone) {
  return with_zone(seconds, timezone, [](const std::tm& tm) { return static_cast<int>(tm.tm_gmtoff); });
}

nlohmann::json convert_time(const std::int64_t timestamp, const std::string& from_timezone,
                            const std::string& to_timezone) {
  if (!is_utc_name(from_timezone) && !is_valid_timezone(from_timezone)) {
    throw TimezoneError("Invalid timezone: " + from_timezone);
  }

  const auto format_in = [timestamp](const std::string& zone) {
    return with_zone(timestamp, zone, [](const std::tm& tm) { return rfc3339(tm, 0, false); });
  };

  return nlohmann::json{{"original",
                         {{"timestamp", timestamp},
                          {"timezone", from_timezone},
                          {"formatted", format_in(from_timezone)},
                          {"offset", utc_offset_seconds(timestamp, from_timezone)}}},
                        {"converted",
                         {{"timestamp", timestamp},
                          {"timezone", to_timezone},
                          {"formatted", format_in(to_timezone)},
                          {"offset", utc_offset_seconds(timestamp, to_timezone)}}}};
}

std::vector<std::string> list_timezones() {
  std::vector<std::string> zones{"UTC"};
  const auto& root = zoneinfo_root();

  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, std::filesystem::directory_options::skip_permission_denied, ec);
  const std::filesystem::recursive_directory_iterator end{};
  for (; !ec && it != end; it.increment(ec)) {
    const auto& entry = *it;
    const auto relative = entry.path().lexically_relative(root).generic_string();

    if (entry.is_directory(ec)) {
      if (relative == "posix" || relative == "right") {
        it.disable_recursion_pending();
      }
      continue;
    }

    if (!entry.is_regular_file(ec) || relative.find('.') != std::string::npos || relative == "posixrules" ||
        relative == "localtime" || relative == "Factory") {
      continue;
    }
    if (std::isupper(static_cast<unsigned char>(relative.front())) == 0) {
      continue;
    }
    if (has_tzif_magic(entry.path())) {
      zones.push_back(relative);
    }
  }

  std::sort(zones.begin(), zones.end());
  zones.erase(std::unique(zones.begin(), zones.end()), zones.end());
  return zones;
}

bool is_valid_timezone(const std::string& name) {
  if (is_utc_name(name)) {
    return true;
  }
  if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos ||
      name.find('\0') != std::string::npos) {
    return false;
  }

  const auto path = zoneinfo_root() / name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  return has_tzif_magic(path);
}

}  // namespace utc_time::clock
