#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace utc_time::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

HardwareToggle parse_toggle(const std::string& key, const std::string& value) {
  const std::string lower = to_lower(value);
  if (lower == "auto" || lower.empty()) {
    return HardwareToggle::kAuto;
  }
  if (lower == "yes" || lower == "true" || lower == "on" || lower == "1") {
    return HardwareToggle::kYes;
  }
  if (lower == "no" || lower == "false" || lower == "off" || lower == "0") {
    return HardwareToggle::kNo;
  }
  throw std::runtime_error(key + " must be yes, no or auto");
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  return parsed;
}

long long parse_ranged(const std::string& key, const std::string& value, const long long min, const long long max) {
  const auto parsed = parse_integer(key, value);
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

std::vector<std::string> split_servers(const std::string& value) {
  std::vector<std::string> servers;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      servers.push_back(item);
    }
  }
  return servers;
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "http.enabled") {
    config.http.enabled = parse_bool(value);
    return;
  }

  if (key == "http.only") {
    config.http.only = parse_bool(value);
    return;
  }

  if (key == "http.bind") {
    if (value.empty()) {
      throw std::runtime_error("http.bind must not be empty");
    }
    config.http.bind_address = value;
    return;
  }

  if (key == "http.port") {
    config.http.port = static_cast<std::uint16_t>(parse_ranged(key, value, 1, 65535));
    return;
  }

  if (key == "http.threads") {
    config.http.threads = static_cast<std::uint32_t>(parse_ranged(key, value, 1, 64));
    return;
  }

  if (key == "http.request_timeout_ms") {
    config.http.request_timeout = std::chrono::milliseconds(parse_ranged(key, value, 1, 600000));
    return;
  }

  if (key == "ntp.servers") {
    config.ntp.servers = split_servers(value);
    return;
  }

  if (key == "ntp.enable_pps") {
    config.ntp.pps = parse_toggle(key, value);
    return;
  }

  if (key == "ntp.enable_gps") {
    config.ntp.gps = parse_toggle(key, value);
    return;
  }

  if (key == "ntp.pps_device") {
    config.ntp.pps_device = value;
    return;
  }

  if (key == "ntp.gps_device") {
    config.ntp.gps_device = value;
    return;
  }

  if (key == "ntp.local_stratum") {
    config.ntp.local_stratum = static_cast<std::uint8_t>(parse_ranged(key, value, 1, 16));
    return;
  }

  if (key == "sync.shm_unit") {
    config.sync.shm_unit = static_cast<int>(parse_ranged(key, value, 0, 254));
    return;
  }

  if (key == "sync.status_timeout_ms") {
    config.sync.status_timeout = std::chrono::milliseconds(parse_ranged(key, value, 1, 10000));
    return;
  }

  if (key == "sync.max_sample_age_s") {
    config.sync.max_sample_age = std::chrono::seconds(parse_ranged(key, value, 1, 86400));
    return;
  }

  if (key == "sync.query_command") {
    if (value.empty()) {
      throw std::runtime_error("sync.query_command must not be empty");
    }
    config.sync.query_command = value;
    return;
  }

  if (key == "log.level") {
    config.log_level = parse_log_level(value);
  }
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment(ServerConfig& config, const EnvLookup& lookup) {
  const auto apply = [&](const char* name, const char* key) {
    if (const char* value = lookup(name); value != nullptr) {
      apply_key_value(config, key, trim(value));
      return true;
    }
    return false;
  };

  if (!apply("ENABLE_HTTP_API", "http.enabled")) {
    apply("ENABLE_HEALTH_SERVER", "http.enabled");
  }
  if (!apply("HEALTH_PORT", "http.port")) {
    apply("PORT", "http.port");
  }
  apply("HTTP_BIND", "http.bind");
  apply("HTTP_THREADS", "http.threads");
  apply("HTTP_REQUEST_TIMEOUT_MS", "http.request_timeout_ms");

  // Presence alone selects container mode.
  if (lookup("HTTP_API_ONLY") != nullptr || lookup("CONTAINER_APP_NAME") != nullptr ||
      lookup("KUBERNETES_SERVICE_HOST") != nullptr) {
    config.http.only = true;
    config.http.enabled = true;
  }

  apply("NTP_SERVERS", "ntp.servers");
  apply("ENABLE_PPS", "ntp.enable_pps");
  apply("ENABLE_GPS", "ntp.enable_gps");
  apply("PPS_DEVICE", "ntp.pps_device");
  apply("GPS_DEVICE", "ntp.gps_device");
  apply("LOCAL_STRATUM", "ntp.local_stratum");

  apply("NTP_SHM_UNIT", "sync.shm_unit");
  apply("SYNC_STATUS_TIMEOUT_MS", "sync.status_timeout_ms");
  apply("SYNC_MAX_SAMPLE_AGE_S", "sync.max_sample_age_s");
  apply("NTP_QUERY_COMMAND", "sync.query_command");

  apply("LOG_LEVEL", "log.level");
}

void apply_environment(ServerConfig& config) {
  apply_environment(config, [](const char* name) { return std::getenv(name); });
}

std::vector<int> shm_units(const ServerConfig& config) {
  std::vector<int> units;
  if (config.ntp.pps == HardwareToggle::kYes) {
    units.push_back(config.sync.shm_unit + 1);
  }
  if (config.ntp.gps != HardwareToggle::kNo || config.ntp.pps == HardwareToggle::kAuto) {
    units.push_back(config.sync.shm_unit);
  }
  return units;
}

std::string_view hardware_toggle_name(const HardwareToggle toggle) noexcept {
  switch (toggle) {
    case HardwareToggle::kAuto:
      return "auto";
    case HardwareToggle::kYes:
      return "yes";
    case HardwareToggle::kNo:
      return "no";
  }
  return "auto";
}

}  // namespace utc_time::core
