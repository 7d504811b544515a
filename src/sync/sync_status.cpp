#include "sync/sync_status.hpp"

#include <cmath>
#include <utility>

#include "clock/time_service.hpp"

namespace utc_time::sync {

std::string_view sync_source_name(const SyncSource source) noexcept {
  switch (source) {
    case SyncSource::kSharedMemory:
      return "SharedMemory";
    case SyncSource::kPeerQuery:
      return "PeerQuery";
    case SyncSource::kUnavailable:
      return "Unavailable";
  }
  return "Unavailable";
}

SyncStatus unavailable_status(std::string detail) {
  SyncStatus status{};
  status.sampled_at_ns = static_cast<std::uint64_t>(clock::snapshot_time().nanos_since_epoch());
  status.detail = std::move(detail);
  return status;
}

std::string_view sync_health(const SyncStatus& status) noexcept {
  if (!status.available || !status.synced) {
    return "unhealthy";
  }
  return std::fabs(status.offset_ms) < 100.0 ? "healthy" : "degraded";
}

nlohmann::json to_json(const SyncStatus& status) {
  nlohmann::json out{{"available", status.available},
                     {"synced", status.synced},
                     {"offset_ms", status.offset_ms},
                     {"stratum", status.stratum},
                     {"precision", status.precision},
                     {"source", std::string(sync_source_name(status.source))},
                     {"sampled_at", status.sampled_at_ns}};
  if (!status.detail.empty()) {
    out["detail"] = status.detail;
  }
  return out;
}

}  // namespace utc_time::sync
