#pragma once
// udp_transport.h: OSC over UDP with an optional shared server socket.
//
// Server-present mode (bind_addr set): one socket is bound to
// bind_addr:bind_port. A receive thread hands every datagram to the packet
// handler, and every send() writes through that same socket, so the peer
// sees replies come from the address it talks to.
//
// Client-only mode: each send() resolves the peer, opens an ephemeral socket,
// writes the datagram and closes it again. Nothing is received.

#include <sys/socket.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "component_logger.h"
#include "osc_transport.h"

namespace oscbridge {

struct UdpEndpoint {
  std::string peer_host;
  int peer_port = 0;
  std::string bind_addr;
  int bind_port = 0;  // 0 with a bind_addr picks an ephemeral port
};

class UdpTransport final : public OscTransport {
 public:
  UdpTransport(UdpEndpoint endpoint, const ComponentLogger& logger);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  void start(PacketHandler on_packet) override;
  void stop() override;
  void send(const Packet& packet) override;

  bool receiving() const override {
    return fd_ >= 0;
  }

  // Port the server socket is bound to, 0 in client-only mode.
  uint16_t local_port() const;

 private:
  UdpEndpoint endpoint_;
  ComponentLogger logger_;
  PacketHandler on_packet_;

  // Written only by start()/stop(); senders run strictly between the two.
  int fd_ = -1;
  int family_ = AF_UNSPEC;
  int wake_[2] = {-1, -1};
  std::thread rx_thread_;
  std::mutex lifecycle_mu_;

  sockaddr_storage resolve_peer(socklen_t& len) const;
  void write_datagram(const std::vector<char>& data);
  void rx_loop();
};

}  // namespace oscbridge
