#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace utc_time::sync {

enum class SyncSource { kSharedMemory, kPeerQuery, kUnavailable };

// One freshly computed view of clock synchronization. Never cached.
struct SyncStatus {
  bool available{false};
  bool synced{false};
  double offset_ms{0.0};
  std::uint8_t stratum{16};
  int precision{0};
  SyncSource source{SyncSource::kUnavailable};
  std::uint64_t sampled_at_ns{0};
  std::string detail{};
};

std::string_view sync_source_name(SyncSource source) noexcept;

SyncStatus unavailable_status(std::string detail);

// "healthy" when synced within 100 ms, "degraded" when synced otherwise,
// "unhealthy" when not synced or not available.
std::string_view sync_health(const SyncStatus& status) noexcept;

nlohmann::json to_json(const SyncStatus& status);

}  // namespace utc_time::sync
