#include <sys/stat.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "sync/ntp_shm.hpp"
#include "sync/peer_query.hpp"
#include "sync/sync_monitor.hpp"
#include "sync/sync_status.hpp"

using utc_time::sync::NtpqPeerQuery;
using utc_time::sync::PeerInfo;
using utc_time::sync::PeerList;
using utc_time::sync::PeerQuery;
using utc_time::sync::PeerQueryError;
using utc_time::sync::ShmPayload;
using utc_time::sync::ShmRegion;
using utc_time::sync::SyncMonitor;
using utc_time::sync::SyncMonitorOptions;
using utc_time::sync::SyncSource;
using utc_time::sync::SysVShmRegion;
using utc_time::sync::parse_peer_table;
using utc_time::sync::read_shm_sample;
using utc_time::sync::status_from_peers;
using utc_time::sync::status_from_shm;

namespace {

constexpr int kTornMarker = -999;

const char* kPeerTable =
    "     remote           refid      st t when poll reach   delay   offset  jitter\n"
    "==============================================================================\n"
    "*192.168.1.1     .GPS.            1 u   33   64  377    0.512   -0.123   0.045\n"
    "+10.0.0.2        192.168.1.1      2 u   12   64  377    1.204    0.456   0.101\n"
    " 2001:db8:1234:5678:9abc:def0:1234:5678\n"
    "                 .INIT.          16 u    -   64    0    0.000    0.000   0.000\n";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

ShmPayload fresh_payload(const std::int64_t now) {
  ShmPayload payload{};
  payload.mode = 1;
  payload.clock_sec = now;
  payload.clock_usec = 500000;
  payload.clock_nsec = 500000000U;
  payload.receive_sec = now;
  payload.receive_usec = 0;
  payload.receive_nsec = 0;
  payload.precision = -20;
  payload.valid = 1;
  return payload;
}

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// Counter advances on every read, so no two reads ever agree.
class TornRegion final : public ShmRegion {
 public:
  int load_count() const noexcept override { return count_.fetch_add(2) + 2; }
  ShmPayload load_payload() const noexcept override {
    auto payload = fresh_payload(unix_now());
    payload.precision = kTornMarker;
    return payload;
  }

 private:
  mutable std::atomic<int> count_{0};
};

class OddCountRegion final : public ShmRegion {
 public:
  int load_count() const noexcept override { return 7; }
  ShmPayload load_payload() const noexcept override { return fresh_payload(unix_now()); }
};

class StableRegion final : public ShmRegion {
 public:
  explicit StableRegion(ShmPayload payload) : payload_(payload) {}
  int load_count() const noexcept override { return 42; }
  ShmPayload load_payload() const noexcept override { return payload_; }

 private:
  ShmPayload payload_;
};

// Torn on the first read, consistent afterwards.
class SettlingRegion final : public ShmRegion {
 public:
  int load_count() const noexcept override {
    const int call = calls_.fetch_add(1);
    return call == 0 ? 10 : 12;
  }
  ShmPayload load_payload() const noexcept override { return fresh_payload(unix_now()); }

 private:
  mutable std::atomic<int> calls_{0};
};

class FakePeerQuery final : public PeerQuery {
 public:
  explicit FakePeerQuery(PeerList peers) : peers_(std::move(peers)) {}
  PeerList query_peers(std::chrono::milliseconds /*timeout*/) override {
    ++calls;
    return peers_;
  }

  std::atomic<int> calls{0};

 private:
  PeerList peers_;
};

class FailingPeerQuery final : public PeerQuery {
 public:
  PeerList query_peers(std::chrono::milliseconds /*timeout*/) override { throw PeerQueryError("ntpq not found"); }
};

class HangingPeerQuery final : public PeerQuery {
 public:
  PeerList query_peers(std::chrono::milliseconds /*timeout*/) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    return {};
  }
};

std::unique_ptr<ShmRegion> no_segment(int /*unit*/) { return nullptr; }

std::filesystem::path write_script(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() / name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
  }
  ::chmod(path.c_str(), 0755);
  return path;
}

int test_consistent_read_returns_payload() {
  const StableRegion stable(fresh_payload(1000));
  const auto sample = read_shm_sample(stable, 4);
  if (!sample.has_value() || sample->clock_sec != 1000) {
    return fail("test_consistent_read_returns_payload", "stable region should read on first attempt");
  }

  const SettlingRegion settling;
  if (!read_shm_sample(settling, 4).has_value()) {
    return fail("test_consistent_read_returns_payload", "a single torn attempt should be retried");
  }
  return 0;
}

int test_torn_and_in_progress_reads_are_discarded() {
  const TornRegion torn;
  if (read_shm_sample(torn, 4).has_value()) {
    return fail("test_torn_and_in_progress_reads_are_discarded", "mismatched counters must never yield a sample");
  }

  const OddCountRegion odd;
  if (read_shm_sample(odd, 4).has_value()) {
    return fail("test_torn_and_in_progress_reads_are_discarded", "odd counter means a write is in progress");
  }
  return 0;
}

int test_shm_status_interpretation() {
  const auto fresh = status_from_shm(fresh_payload(1000), 1005, std::chrono::seconds(30));
  if (!fresh.has_value() || !fresh->available || !fresh->synced || fresh->source != SyncSource::kSharedMemory) {
    return fail("test_shm_status_interpretation", "fresh sample should be synced shared memory");
  }
  if (std::fabs(fresh->offset_ms - 500.0) > 1e-6 || fresh->stratum != 1 || fresh->precision != -20) {
    return fail("test_shm_status_interpretation", "offset, stratum or precision wrong");
  }

  const auto stale = status_from_shm(fresh_payload(1000), 1100, std::chrono::seconds(30));
  if (!stale.has_value() || !stale->available || stale->synced || stale->stratum != 16) {
    return fail("test_shm_status_interpretation", "stale sample should be available but not synced");
  }

  auto unsynced = fresh_payload(1000);
  unsynced.leap = utc_time::sync::kLeapNotInSync;
  const auto leap = status_from_shm(unsynced, 1000, std::chrono::seconds(30));
  if (!leap.has_value() || leap->synced) {
    return fail("test_shm_status_interpretation", "leap indicator 3 means not synchronized");
  }

  auto bad_mode = fresh_payload(1000);
  bad_mode.mode = 5;
  if (status_from_shm(bad_mode, 1000, std::chrono::seconds(30)).has_value()) {
    return fail("test_shm_status_interpretation", "unknown mode should be rejected");
  }
  if (status_from_shm(ShmPayload{}, 1000, std::chrono::seconds(30)).has_value()) {
    return fail("test_shm_status_interpretation", "never-written segment should be rejected");
  }
  return 0;
}

static_assert(!std::is_constructible_v<SysVShmRegion, const volatile utc_time::sync::NtpShmTime*>,
              "segments are mapped through attach() only");

int test_missing_segment_attach_returns_null() {
  if (SysVShmRegion::attach(254) != nullptr) {
    return fail("test_missing_segment_attach_returns_null", "unit 254 should not exist on a test host");
  }
  return 0;
}

int test_peer_table_parsing() {
  const auto peers = parse_peer_table(kPeerTable);
  if (peers.size() != 3) {
    return fail("test_peer_table_parsing", "expected three peers including the wrapped one");
  }
  if (!peers[0].selected() || peers[0].remote != "192.168.1.1" || peers[0].refid != ".GPS." || peers[0].reach != 0377) {
    return fail("test_peer_table_parsing", "system peer row parsed incorrectly");
  }
  if (peers[1].tally != '+' || std::fabs(peers[1].offset_ms - 0.456) > 1e-9 || peers[1].poll != 64) {
    return fail("test_peer_table_parsing", "candidate row parsed incorrectly");
  }
  if (peers[2].remote != "2001:db8:1234:5678:9abc:def0:1234:5678" || peers[2].stratum != 16 || peers[2].when != "-") {
    return fail("test_peer_table_parsing", "wrapped row parsed incorrectly");
  }

  const auto status = status_from_peers(peers);
  if (!status.available || !status.synced || status.stratum != 2 || std::fabs(status.offset_ms + 0.123) > 1e-9) {
    return fail("test_peer_table_parsing", "status should follow the system peer");
  }

  PeerList unselected = peers;
  unselected.erase(unselected.begin());
  const auto degraded = status_from_peers(unselected);
  if (!degraded.available || degraded.synced || degraded.source != SyncSource::kPeerQuery) {
    return fail("test_peer_table_parsing", "no system peer means available but not synced");
  }

  bool threw = false;
  try {
    (void)parse_peer_table("ntpq: read: Connection refused\n");
  } catch (const PeerQueryError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_peer_table_parsing", "output without a header should throw");
  }
  return 0;
}

int test_subprocess_query_runs_command() {
  const auto table = std::filesystem::temp_directory_path() / "utc_time_peer_table.txt";
  {
    std::ofstream out(table);
    out << kPeerTable;
  }
  const auto script = write_script("utc_time_fake_ntpq.sh", "cat '" + table.string() + "'\n");

  NtpqPeerQuery query(script.string());
  PeerList peers;
  try {
    peers = query.query_peers(std::chrono::milliseconds(2000));
  } catch (const PeerQueryError& ex) {
    std::filesystem::remove(table);
    std::filesystem::remove(script);
    return fail("test_subprocess_query_runs_command", ex.what());
  }
  std::filesystem::remove(table);
  std::filesystem::remove(script);

  if (peers.size() != 3 || !peers[0].selected()) {
    return fail("test_subprocess_query_runs_command", "script output should parse into peers");
  }

  const auto failing = write_script("utc_time_failing_ntpq.sh", "exit 2\n");
  bool threw = false;
  try {
    (void)NtpqPeerQuery(failing.string()).query_peers(std::chrono::milliseconds(2000));
  } catch (const PeerQueryError&) {
    threw = true;
  }
  std::filesystem::remove(failing);
  if (!threw) {
    return fail("test_subprocess_query_runs_command", "non-zero exit should throw");
  }
  return 0;
}

int test_subprocess_query_is_killed_at_deadline() {
  const auto script = write_script("utc_time_hanging_ntpq.sh", "exec sleep 5\n");

  const auto started = std::chrono::steady_clock::now();
  bool threw = false;
  try {
    (void)NtpqPeerQuery(script.string()).query_peers(std::chrono::milliseconds(200));
  } catch (const PeerQueryError&) {
    threw = true;
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  std::filesystem::remove(script);

  if (!threw) {
    return fail("test_subprocess_query_is_killed_at_deadline", "hung command should time out");
  }
  if (elapsed > std::chrono::seconds(2)) {
    return fail("test_subprocess_query_is_killed_at_deadline", "deadline was not enforced");
  }
  return 0;
}

int test_torn_segment_never_leaks_into_status() {
  SyncMonitorOptions options{};
  options.shm_units = {0};
  SyncMonitor monitor(options, std::make_shared<FailingPeerQuery>(),
                      [](int) -> std::unique_ptr<ShmRegion> { return std::make_unique<TornRegion>(); });

  const auto status = monitor.query_status(std::chrono::milliseconds(2000));
  if (status.precision == kTornMarker || status.source == SyncSource::kSharedMemory) {
    return fail("test_torn_segment_never_leaks_into_status", "torn payload was returned");
  }
  if (status.available || status.source != SyncSource::kUnavailable) {
    return fail("test_torn_segment_never_leaks_into_status", "failed fallback should degrade to unavailable");
  }
  return 0;
}

int test_fallback_to_peer_query() {
  PeerInfo peer{};
  peer.tally = '*';
  peer.remote = "10.1.1.1";
  peer.stratum = 3;
  peer.offset_ms = 1.5;
  auto query = std::make_shared<FakePeerQuery>(PeerList{peer});

  SyncMonitor monitor(SyncMonitorOptions{}, query, no_segment);
  const auto status = monitor.query_status(std::chrono::milliseconds(2000));
  if (!status.synced || status.source != SyncSource::kPeerQuery || status.stratum != 4) {
    return fail("test_fallback_to_peer_query", "missing segment should fall back to the peer query");
  }

  const auto report = monitor.query_peers(std::chrono::milliseconds(2000));
  if (!report.available || report.peers.size() != 1 || query->calls != 2) {
    return fail("test_fallback_to_peer_query", "peer report should come from the query");
  }
  return 0;
}

int test_units_are_tried_in_priority_order() {
  std::vector<int> attempted;
  SyncMonitorOptions options{};
  options.shm_units = {1, 0};
  auto query = std::make_shared<FakePeerQuery>(PeerList{});

  SyncMonitor monitor(options, query, [&attempted](const int unit) -> std::unique_ptr<ShmRegion> {
    attempted.push_back(unit);
    return std::make_unique<StableRegion>(fresh_payload(unix_now()));
  });

  const auto status = monitor.query_status(std::chrono::milliseconds(2000));
  if (status.source != SyncSource::kSharedMemory || !status.synced) {
    return fail("test_units_are_tried_in_priority_order", "first unit should satisfy the probe");
  }
  if (attempted.size() != 1 || attempted.front() != 1 || query->calls != 0) {
    return fail("test_units_are_tried_in_priority_order", "PPS unit should be read first and alone");
  }
  return 0;
}

int test_no_source_is_deterministically_unavailable() {
  SyncMonitor monitor(SyncMonitorOptions{}, std::make_shared<NtpqPeerQuery>("/nonexistent/utc-time-ntpq"), no_segment);

  for (int i = 0; i < 3; ++i) {
    const auto status = monitor.query_status(std::chrono::milliseconds(2000));
    if (status.available || status.synced || status.source != SyncSource::kUnavailable) {
      return fail("test_no_source_is_deterministically_unavailable", "expected available:false every time");
    }
    if (utc_time::sync::to_json(status)["source"] != "Unavailable") {
      return fail("test_no_source_is_deterministically_unavailable", "source should serialize as Unavailable");
    }
  }

  const auto report = monitor.query_peers(std::chrono::milliseconds(2000));
  if (report.available || report.error.empty()) {
    return fail("test_no_source_is_deterministically_unavailable", "peer report should carry the error");
  }
  return 0;
}

int test_hung_query_is_bounded_by_timeout() {
  SyncMonitor monitor(SyncMonitorOptions{}, std::make_shared<HangingPeerQuery>(), no_segment);

  const auto started = std::chrono::steady_clock::now();
  const auto status = monitor.query_status(std::chrono::milliseconds(100));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (status.available || status.source != SyncSource::kUnavailable) {
    return fail("test_hung_query_is_bounded_by_timeout", "timed-out probe should be unavailable");
  }
  if (elapsed > std::chrono::milliseconds(800)) {
    return fail("test_hung_query_is_bounded_by_timeout", "caller waited past the timeout");
  }
  return 0;
}

int test_health_classification() {
  auto status = utc_time::sync::unavailable_status("none");
  if (utc_time::sync::sync_health(status) != "unhealthy") {
    return fail("test_health_classification", "unavailable should be unhealthy");
  }
  status.available = true;
  status.synced = true;
  status.offset_ms = 12.0;
  if (utc_time::sync::sync_health(status) != "healthy") {
    return fail("test_health_classification", "small offset should be healthy");
  }
  status.offset_ms = -250.0;
  if (utc_time::sync::sync_health(status) != "degraded") {
    return fail("test_health_classification", "large offset should be degraded");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_consistent_read_returns_payload(); rc != 0) return rc;
  if (int rc = test_torn_and_in_progress_reads_are_discarded(); rc != 0) return rc;
  if (int rc = test_shm_status_interpretation(); rc != 0) return rc;
  if (int rc = test_missing_segment_attach_returns_null(); rc != 0) return rc;
  if (int rc = test_peer_table_parsing(); rc != 0) return rc;
  if (int rc = test_subprocess_query_runs_command(); rc != 0) return rc;
  if (int rc = test_subprocess_query_is_killed_at_deadline(); rc != 0) return rc;
  if (int rc = test_torn_segment_never_leaks_into_status(); rc != 0) return rc;
  if (int rc = test_fallback_to_peer_query(); rc != 0) return rc;
  if (int rc = test_units_are_tried_in_priority_order(); rc != 0) return rc;
  if (int rc = test_no_source_is_deterministically_unavailable(); rc != 0) return rc;
  if (int rc = test_hung_query_is_bounded_by_timeout(); rc != 0) return rc;
  if (int rc = test_health_classification(); rc != 0) return rc;

  std::cout << "[PASS] sync unit tests\n";
  return 0;
}
