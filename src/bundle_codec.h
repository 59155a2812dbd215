#pragma once
// bundle_codec.h: OSC wire structures <-> portable ControlMessage/ControlBundle.
//
// Pure functions: no I/O, no shared state, inputs are never modified.
// Bundles nest arbitrarily; element order and time tags are preserved in both
// directions.

#include <osc/OscOutboundPacketStream.h>
#include <osc/OscReceivedElements.h>

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "oscbridge/osc_types.hpp"

namespace oscbridge {

class CodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Largest payload a single UDP datagram can carry over IPv4.
inline constexpr size_t kMaxPacketSize = 65507;

ControlMessage to_portable(const osc::ReceivedMessage& message);
ControlBundle to_portable(const osc::ReceivedBundle& bundle);

void to_wire(const ControlMessage& message, osc::OutboundPacketStream& out);
void to_wire(const ControlBundle& bundle, osc::OutboundPacketStream& out);

// Serialise a whole packet. The empty packet encodes to no bytes.
std::vector<char> encode_packet(const Packet& packet);

// Parse one datagram. Returns the empty packet when the data is neither a
// message nor a bundle; throws CodecError when it claims to be one but is
// malformed.
Packet decode_packet(const char* data, size_t size);

}  // namespace oscbridge
