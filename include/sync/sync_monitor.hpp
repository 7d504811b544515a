#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "sync/ntp_shm.hpp"
#include "sync/peer_query.hpp"
#include "sync/sync_status.hpp"

namespace utc_time::sync {

struct SyncMonitorOptions {
  // Shared-memory units in priority order; empty skips the shm tier.
  std::vector<int> shm_units{0};
  int shm_read_attempts{4};
  std::chrono::seconds max_sample_age{30};
  std::size_t worker_threads{2};
};

struct PeerReport {
  bool available{false};
  PeerList peers{};
  std::string error{};
};

using ShmOpener = std::function<std::unique_ptr<ShmRegion>(int unit)>;

// Two-tier synchronization probe: shared memory first, peer query second.
// Every probe runs on a dedicated blocking pool and the caller waits at most
// `timeout`; a probe that overruns is abandoned and reported unavailable.
class SyncMonitor {
 public:
  SyncMonitor(SyncMonitorOptions options, std::shared_ptr<PeerQuery> peer_query,
              ShmOpener shm_opener = &SysVShmRegion::attach);
  ~SyncMonitor();

  SyncMonitor(const SyncMonitor&) = delete;
  SyncMonitor& operator=(const SyncMonitor&) = delete;

  SyncStatus query_status(std::chrono::milliseconds timeout) const;
  PeerReport query_peers(std::chrono::milliseconds timeout) const;

  // Runs the probe on the calling thread. Blocks for up to `budget`.
  SyncStatus probe(std::chrono::milliseconds budget) const;

 private:
  SyncMonitorOptions options_;
  std::shared_ptr<PeerQuery> peer_query_;
  ShmOpener shm_opener_;
  mutable boost::asio::thread_pool blocking_pool_;
};

}  // namespace utc_time::sync
