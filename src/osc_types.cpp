// osc_types.cpp: TimeTag <-> system_clock conversion.

#include "oscbridge/osc_types.hpp"

namespace oscbridge {

// Seconds between 1900-01-01 (NTP epoch) and 1970-01-01 (Unix epoch).
static constexpr int64_t kNtpUnixOffset = 2'208'988'800;

TimeTag TimeTag::from_time_point(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  const auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
  const auto secs = floor<seconds>(since_epoch);
  const auto nanos = static_cast<uint64_t>((since_epoch - secs).count());

  const auto ntp_secs = static_cast<uint64_t>(secs.count() + kNtpUnixOffset);
  // Round to the nearest 2^-32 s so that to_time_point() maps back exactly.
  const uint64_t frac = ((nanos << 32) + 500'000'000ULL) / 1'000'000'000ULL;
  if (frac >> 32) return TimeTag{(ntp_secs + 1) << 32};
  return TimeTag{(ntp_secs << 32) | frac};
}

std::chrono::system_clock::time_point TimeTag::to_time_point() const {
  using namespace std::chrono;
  const auto ntp_secs = static_cast<int64_t>(ntp >> 32);
  const uint64_t frac = ntp & 0xFFFF'FFFFULL;
  const auto nanos = static_cast<int64_t>((frac * 1'000'000'000ULL + (1ULL << 31)) >> 32);
  const nanoseconds since_epoch = seconds(ntp_secs - kNtpUnixOffset) + nanoseconds(nanos);
  return system_clock::time_point(duration_cast<system_clock::duration>(since_epoch));
}

}  // namespace oscbridge
