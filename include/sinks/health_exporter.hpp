#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "clock/time_service.hpp"
#include "sync/sync_status.hpp"

namespace utc_time::sync {
class SyncMonitor;
}

namespace utc_time::sinks {

// {status, version, service, timestamp, sync{...}}. status is "healthy" only
// when the sync source is available and synced.
nlohmann::json build_health_document(const clock::TimeSnapshot& snapshot, const sync::SyncStatus& status);

// Prometheus text exposition, one sample per line.
std::string render_metrics(const clock::TimeSnapshot& snapshot, const sync::SyncStatus& status);

// Composes a fresh time snapshot and sync status on every scrape.
class HealthExporter {
 public:
  HealthExporter(const sync::SyncMonitor* monitor, std::chrono::milliseconds status_timeout);

  [[nodiscard]] nlohmann::json health() const;
  [[nodiscard]] std::string metrics() const;

 private:
  sync::SyncStatus current_status() const;

  const sync::SyncMonitor* monitor_;
  std::chrono::milliseconds status_timeout_;
};

}  // namespace utc_time::sinks
