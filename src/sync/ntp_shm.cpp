#include "sync/ntp_shm.hpp"

#include <sys/ipc.h>
#include <sys/shm.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>

#include "clock/time_service.hpp"
#include "core/log.hpp"

namespace utc_time::sync {
namespace {

std::int64_t sample_nanos(const int usec, const unsigned nsec) noexcept {
  // Older writers leave the nanosecond field zero; trust it only when it
  // agrees with the microsecond field.
  if (nsec < 1000000000U && static_cast<int>(nsec / 1000U) == usec) {
    return static_cast<std::int64_t>(nsec);
  }
  return static_cast<std::int64_t>(usec) * 1000;
}

}  // namespace

SysVShmRegion::SysVShmRegion(Passkey /*key*/, const volatile NtpShmTime* segment) noexcept : segment_(segment) {}

SysVShmRegion::~SysVShmRegion() {
  if (segment_ != nullptr) {
    ::shmdt(const_cast<const NtpShmTime*>(segment_));
  }
}

std::unique_ptr<ShmRegion> SysVShmRegion::attach(const int unit) {
  const std::string tag = "sync";
  const key_t key = static_cast<key_t>(kNtpShmKeyBase + unit);

  const int id = ::shmget(key, sizeof(NtpShmTime), 0);
  if (id < 0) {
    core::log_debug(tag, "shm unit " + std::to_string(unit) + " unavailable: " + std::strerror(errno));
    return nullptr;
  }

  shmid_ds info{};
  if (::shmctl(id, IPC_STAT, &info) != 0) {
    core::log_debug(tag, "shm unit " + std::to_string(unit) + " stat failed: " + std::strerror(errno));
    return nullptr;
  }
  if (info.shm_segsz < sizeof(NtpShmTime)) {
    core::log_warn(tag, "shm unit " + std::to_string(unit) + " is " + std::to_string(info.shm_segsz) +
                            " bytes, expected at least " + std::to_string(sizeof(NtpShmTime)));
    return nullptr;
  }

  void* mapped = ::shmat(id, nullptr, SHM_RDONLY);
  if (mapped == reinterpret_cast<void*>(-1)) {
    core::log_debug(tag, "shm unit " + std::to_string(unit) + " attach failed: " + std::strerror(errno));
    return nullptr;
  }

  return std::make_unique<SysVShmRegion>(Passkey{}, static_cast<const volatile NtpShmTime*>(mapped));
}

int SysVShmRegion::load_count() const noexcept {
  std::atomic_thread_fence(std::memory_order_acquire);
  const int count = segment_->count;
  std::atomic_thread_fence(std::memory_order_acquire);
  return count;
}

ShmPayload SysVShmRegion::load_payload() const noexcept {
  ShmPayload payload{};
  payload.mode = segment_->mode;
  payload.clock_sec = static_cast<std::int64_t>(segment_->clock_timestamp_sec);
  payload.clock_usec = segment_->clock_timestamp_usec;
  payload.clock_nsec = segment_->clock_timestamp_nsec;
  payload.receive_sec = static_cast<std::int64_t>(segment_->receive_timestamp_sec);
  payload.receive_usec = segment_->receive_timestamp_usec;
  payload.receive_nsec = segment_->receive_timestamp_nsec;
  payload.leap = segment_->leap;
  payload.precision = segment_->precision;
  payload.valid = segment_->valid;
  return payload;
}

std::optional<ShmPayload> read_shm_sample(const ShmRegion& region, const int max_attempts) {
  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    const int before = region.load_count();
    if ((before & 1) != 0) {
      std::this_thread::yield();
      continue;
    }

    const ShmPayload payload = region.load_payload();
    const int after = region.load_count();
    if (before == after) {
      return payload;
    }
    std::this_thread::yield();
  }
  return std::nullopt;
}

std::optional<SyncStatus> status_from_shm(const ShmPayload& payload, const std::int64_t now_seconds,
                                          const std::chrono::seconds max_age) {
  if (payload.mode != 0 && payload.mode != 1) {
    return std::nullopt;
  }
  if (payload.clock_sec == 0 && payload.receive_sec == 0) {
    return std::nullopt;
  }

  const std::int64_t clock_ns = (payload.clock_sec * 1000000000LL) + sample_nanos(payload.clock_usec, payload.clock_nsec);
  const std::int64_t receive_ns =
      (payload.receive_sec * 1000000000LL) + sample_nanos(payload.receive_usec, payload.receive_nsec);
  const std::int64_t age = now_seconds - payload.receive_sec;

  SyncStatus status{};
  status.available = true;
  status.source = SyncSource::kSharedMemory;
  status.offset_ms = static_cast<double>(clock_ns - receive_ns) / 1.0e6;
  status.precision = payload.precision;
  status.synced = payload.leap != kLeapNotInSync && age >= 0 && age <= max_age.count();
  status.stratum = status.synced ? 1 : 16;
  status.sampled_at_ns = static_cast<std::uint64_t>(clock::snapshot_time().nanos_since_epoch());
  if (!status.synced) {
    status.detail = payload.leap == kLeapNotInSync ? "reference clock reports not in sync"
                                                   : "reference sample is " + std::to_string(age) + "s old";
  }
  return status;
}

}  // namespace utc_time::sync
