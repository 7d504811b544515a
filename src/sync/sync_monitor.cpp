#include "sync/sync_monitor.hpp"

#include <future>
#include <utility>

#include <boost/asio/post.hpp>

#include "clock/time_service.hpp"
#include "core/log.hpp"

namespace utc_time::sync {
namespace {

constexpr const char* kTag = "sync";

// Posts `work` to `pool` and waits for it for at most `timeout`.
template <typename Result, typename Work, typename OnTimeout>
Result run_bounded(boost::asio::thread_pool& pool, const std::chrono::milliseconds timeout, Work&& work,
                   OnTimeout&& on_timeout) {
  auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Work>(work));
  auto result = task->get_future();
  boost::asio::post(pool, [task]() { (*task)(); });

  if (result.wait_for(timeout) != std::future_status::ready) {
    return on_timeout();
  }
  return result.get();
}

}  // namespace

SyncMonitor::SyncMonitor(SyncMonitorOptions options, std::shared_ptr<PeerQuery> peer_query, ShmOpener shm_opener)
    : options_(std::move(options)),
      peer_query_(std::move(peer_query)),
      shm_opener_(std::move(shm_opener)),
      blocking_pool_(options_.worker_threads == 0 ? 1 : options_.worker_threads) {}

SyncMonitor::~SyncMonitor() { blocking_pool_.join(); }

SyncStatus SyncMonitor::query_status(const std::chrono::milliseconds timeout) const {
  return run_bounded<SyncStatus>(
      blocking_pool_, timeout, [this, timeout]() { return probe(timeout); },
      [timeout]() {
        core::log_warn(kTag, "status probe exceeded " + std::to_string(timeout.count()) + "ms");
        return unavailable_status("status probe timed out");
      });
}

PeerReport SyncMonitor::query_peers(const std::chrono::milliseconds timeout) const {
  return run_bounded<PeerReport>(
      blocking_pool_, timeout,
      [this, timeout]() {
        PeerReport report{};
        if (!peer_query_) {
          report.error = "peer query disabled";
          return report;
        }
        try {
          report.peers = peer_query_->query_peers(timeout);
          report.available = true;
        } catch (const PeerQueryError& ex) {
          report.error = ex.what();
        }
        return report;
      },
      []() { return PeerReport{.available = false, .peers = {}, .error = "peer query timed out"}; });
}

SyncStatus SyncMonitor::probe(const std::chrono::milliseconds budget) const {
  const auto deadline = std::chrono::steady_clock::now() + budget;

  for (const int unit : options_.shm_units) {
    const auto region = shm_opener_(unit);
    if (!region) {
      continue;
    }

    const auto payload = read_shm_sample(*region, options_.shm_read_attempts);
    if (!payload.has_value()) {
      core::log_debug(kTag, "shm unit " + std::to_string(unit) + " torn on every attempt; skipping");
      continue;
    }

    auto status = status_from_shm(*payload, clock::snapshot_time().seconds, options_.max_sample_age);
    if (status.has_value()) {
      return std::move(*status);
    }
    core::log_debug(kTag, "shm unit " + std::to_string(unit) + " holds no usable sample");
  }

  if (!peer_query_) {
    return unavailable_status("no synchronization source");
  }

  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    return unavailable_status("status probe budget exhausted");
  }

  try {
    return status_from_peers(peer_query_->query_peers(remaining));
  } catch (const PeerQueryError& ex) {
    core::log_debug(kTag, std::string("peer query failed: ") + ex.what());
    return unavailable_status(ex.what());
  }
}

}  // namespace utc_time::sync
