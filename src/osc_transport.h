#pragma once
// osc_transport.h: Outbound/inbound OSC packet transport seen by a relay.

#include <cstddef>
#include <functional>
#include <stdexcept>

#include "oscbridge/osc_types.hpp"

namespace oscbridge {

class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class OscTransport {
 public:
  // Called from the receive thread with one raw datagram.
  using PacketHandler = std::function<void(const char* data, size_t size)>;

  virtual ~OscTransport() = default;

  // Open whatever the mode needs. Throws TransportError when a local socket
  // cannot be bound.
  virtual void start(PacketHandler on_packet) = 0;
  // Idempotent. No handler call is in flight once this returns.
  virtual void stop() = 0;

  // Encode and deliver. The empty packet is a no-op. Throws TransportError
  // (resolve / socket failure) or CodecError (encode failure).
  virtual void send(const Packet& packet) = 0;

  // True when inbound datagrams are delivered to the handler.
  virtual bool receiving() const = 0;
};

}  // namespace oscbridge
