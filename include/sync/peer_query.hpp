#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sync/sync_status.hpp"

namespace utc_time::sync {

// One row of the daemon's peer billboard (`ntpq -pn`).
struct PeerInfo {
  char tally{' '};
  std::string remote{};
  std::string refid{};
  int stratum{16};
  char type{'-'};
  std::string when{};
  int poll{0};
  std::uint16_t reach{0};
  double delay_ms{0.0};
  double offset_ms{0.0};
  double jitter_ms{0.0};

  // '*' system peer, 'o' PPS peer.
  [[nodiscard]] bool selected() const noexcept { return tally == '*' || tally == 'o'; }
};

using PeerList = std::vector<PeerInfo>;

class PeerQueryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Narrow capability around the external status query so tests can swap in
// a deterministic fake. Throws PeerQueryError on any failure.
class PeerQuery {
 public:
  virtual ~PeerQuery() = default;

  virtual PeerList query_peers(std::chrono::milliseconds timeout) = 0;
};

// Runs `<command> -p -n` with a hard deadline; the child is killed when the
// deadline passes.
class NtpqPeerQuery final : public PeerQuery {
 public:
  explicit NtpqPeerQuery(std::string command = "ntpq");

  PeerList query_peers(std::chrono::milliseconds timeout) override;

 private:
  std::string command_;
};

// Throws PeerQueryError when the billboard header is missing.
PeerList parse_peer_table(const std::string& text);

SyncStatus status_from_peers(const PeerList& peers);

nlohmann::json to_json(const PeerInfo& peer);

}  // namespace utc_time::sync
