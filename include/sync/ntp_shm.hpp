#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <type_traits>

#include "sync/sync_status.hpp"

namespace utc_time::sync {

// SysV key of unit 0 ("NTP0"); unit N lives at kNtpShmKeyBase + N.
constexpr int kNtpShmKeyBase = 0x4E545030;

// Segment layout of the ntpd legacy SHM reference clock driver (type 28).
// The writer (gpsd, a PPS helper, chrony's SHM refclock) owns it. Mode 1
// writers bump `count` before and after each update, so an odd count or a
// count that moved across the read means the payload is torn.
struct NtpShmTime {
  int mode;
  volatile int count;
  std::time_t clock_timestamp_sec;
  int clock_timestamp_usec;
  std::time_t receive_timestamp_sec;
  int receive_timestamp_usec;
  int leap;
  int precision;
  int nsamples;
  volatile int valid;
  unsigned clock_timestamp_nsec;
  unsigned receive_timestamp_nsec;
  int dummy[8];
};

static_assert(std::is_standard_layout_v<NtpShmTime>);

constexpr int kLeapNotInSync = 3;

// Plain copy of the payload fields, taken between two count reads.
struct ShmPayload {
  int mode{0};
  std::int64_t clock_sec{0};
  int clock_usec{0};
  unsigned clock_nsec{0};
  std::int64_t receive_sec{0};
  int receive_usec{0};
  unsigned receive_nsec{0};
  int leap{0};
  int precision{0};
  int valid{0};
};

// Read-only view of one segment. Implementations expose copies only; the
// mapping itself never leaves this module.
class ShmRegion {
 public:
  virtual ~ShmRegion() = default;

  [[nodiscard]] virtual int load_count() const noexcept = 0;
  [[nodiscard]] virtual ShmPayload load_payload() const noexcept = 0;
};

class SysVShmRegion final : public ShmRegion {
  struct Passkey {
    explicit Passkey() = default;
  };

 public:
  // Reachable through attach() only.
  SysVShmRegion(Passkey, const volatile NtpShmTime* segment) noexcept;
  ~SysVShmRegion() override;

  SysVShmRegion(const SysVShmRegion&) = delete;
  SysVShmRegion& operator=(const SysVShmRegion&) = delete;

  // nullptr when the segment does not exist, is not accessible, or is too
  // small to hold NtpShmTime.
  static std::unique_ptr<ShmRegion> attach(int unit);

  [[nodiscard]] int load_count() const noexcept override;
  [[nodiscard]] ShmPayload load_payload() const noexcept override;

 private:
  const volatile NtpShmTime* segment_;
};

// Sequence double-read: count, payload, count. Retries up to `max_attempts`
// times and returns nullopt when every attempt was torn or in progress.
std::optional<ShmPayload> read_shm_sample(const ShmRegion& region, int max_attempts);

// nullopt when the segment was never written. A sample older than
// `max_age` or flagged as unsynchronized by its leap field is reported as
// available but not synced.
std::optional<SyncStatus> status_from_shm(const ShmPayload& payload, std::int64_t now_seconds,
                                          std::chrono::seconds max_age);

}  // namespace utc_time::sync
