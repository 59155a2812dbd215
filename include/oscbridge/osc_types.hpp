#pragma once
// oscbridge/osc_types.hpp: Portable OSC values, messages and bundles.
//
// These mirror the OSC wire structures without any dependency on the codec
// library, so routing and JSON translation code can be written (and tested)
// against plain value types.

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace oscbridge {

struct Nil {
  bool operator==(const Nil&) const = default;
};

// 64-bit NTP time tag: upper 32 bits seconds since 1900, lower 32 bits fraction.
struct TimeTag {
  static constexpr uint64_t kImmediate = 1;

  uint64_t ntp = kImmediate;

  static TimeTag immediate() {
    return TimeTag{kImmediate};
  }
  static TimeTag from_time_point(std::chrono::system_clock::time_point tp);

  std::chrono::system_clock::time_point to_time_point() const;

  bool is_immediate() const {
    return ntp == kImmediate;
  }

  bool operator==(const TimeTag&) const = default;
};

using Blob = std::vector<uint8_t>;

using Argument =
    std::variant<Nil, bool, int32_t, int64_t, float, double, std::string, TimeTag, Blob>;
using ArgumentList = std::vector<Argument>;

struct ControlMessage {
  std::string address;
  ArgumentList arguments;

  bool operator==(const ControlMessage&) const = default;
};

struct ControlBundle {
  TimeTag timetag;
  std::vector<ControlMessage> messages;
  std::vector<ControlBundle> bundles;

  bool operator==(const ControlBundle&) const = default;
};

// std::monostate is the empty packet: sending it is a no-op, decoding an
// unrecognised datagram yields it.
using Packet = std::variant<std::monostate, ControlMessage, ControlBundle>;

}  // namespace oscbridge
