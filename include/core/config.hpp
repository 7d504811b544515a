#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/log.hpp"

namespace utc_time::core {

enum class HardwareToggle { kAuto, kYes, kNo };

struct HttpConfig {
  bool enabled{true};
  bool only{false};
  std::string bind_address{"0.0.0.0"};
  std::uint16_t port{3000};
  std::uint32_t threads{4};
  std::chrono::milliseconds request_timeout{5000};
};

struct NtpReferenceConfig {
  std::vector<std::string> servers{"time.cloudflare.com", "time.google.com"};
  HardwareToggle pps{HardwareToggle::kAuto};
  HardwareToggle gps{HardwareToggle::kAuto};
  std::string pps_device{"/dev/pps0"};
  std::string gps_device{"/dev/ttyAMA0"};
  std::uint8_t local_stratum{10};
};

struct SyncConfig {
  int shm_unit{0};
  std::chrono::milliseconds status_timeout{2000};
  std::chrono::seconds max_sample_age{30};
  std::string query_command{"ntpq"};
};

struct ServerConfig {
  HttpConfig http{};
  NtpReferenceConfig ntp{};
  SyncConfig sync{};
  LogLevel log_level{LogLevel::kInfo};
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Reads an indented "key: value" file. Nested keys are joined with '.'.
ServerConfig load_server_config(const std::string& path);

// Overlays environment variables on top of file or default values.
void apply_environment(ServerConfig& config, const EnvLookup& lookup);
void apply_environment(ServerConfig& config);

// Shared-memory units to read, in priority order. Empty when both hardware
// references are switched off.
std::vector<int> shm_units(const ServerConfig& config);

std::string_view hardware_toggle_name(HardwareToggle toggle) noexcept;

}  // namespace utc_time::core
