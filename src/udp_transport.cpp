// udp_transport.cpp

#include "udp_transport.h"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

#include "bundle_codec.h"
#include "json_codec.h"

namespace oscbridge {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* ai) const {
    ::freeaddrinfo(ai);
  }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr lookup(const std::string& host, int port, int family, int flags) {
  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_flags = flags | AI_NUMERICSERV;

  const std::string service = std::to_string(port);
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    throw TransportError("resolve " + host + ":" + service + ": " + ::gai_strerror(rc));
  }
  return AddrInfoPtr(res);
}

// Closes a file descriptor on scope exit.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {
  }
  ~ScopedFd() {
    if (fd_ >= 0) ::close(fd_);
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

 private:
  int fd_;
};

std::string errno_text(const char* call) {
  return std::string(call) + ": " + std::strerror(errno);
}

}  // namespace

UdpTransport::UdpTransport(UdpEndpoint endpoint, const ComponentLogger& logger)
    : endpoint_(std::move(endpoint)), logger_(logger) {
}

UdpTransport::~UdpTransport() {
  stop();
}

void UdpTransport::start(PacketHandler on_packet) {
  std::lock_guard lk(lifecycle_mu_);
  if (fd_ >= 0) return;
  on_packet_ = std::move(on_packet);

  if (endpoint_.bind_addr.empty()) {
    logger_.debug("OSC client-only mode, peer %s:%d", endpoint_.peer_host.c_str(),
                  endpoint_.peer_port);
    return;
  }

  auto ai = lookup(endpoint_.bind_addr, endpoint_.bind_port, AF_UNSPEC, AI_PASSIVE);
  int fd = ::socket(ai->ai_family, SOCK_DGRAM, 0);
  if (fd < 0) throw TransportError(errno_text("socket()"));

  if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
    const std::string what = errno_text("bind()");
    ::close(fd);
    throw TransportError("OSC server " + endpoint_.bind_addr + ":" +
                         std::to_string(endpoint_.bind_port) + ": " + what);
  }

  if (::pipe(wake_) < 0) {
    const std::string what = errno_text("pipe()");
    ::close(fd);
    throw TransportError(what);
  }

  fd_ = fd;
  family_ = ai->ai_family;
  rx_thread_ = std::thread(&UdpTransport::rx_loop, this);
  logger_.debug("Started OSC server on %s:%u", endpoint_.bind_addr.c_str(), local_port());
}

void UdpTransport::stop() {
  std::lock_guard lk(lifecycle_mu_);
  if (fd_ < 0) return;

  char b = 0;
  (void)::write(wake_[1], &b, 1);
  if (rx_thread_.joinable()) rx_thread_.join();

  ::close(fd_);
  ::close(wake_[0]);
  ::close(wake_[1]);
  fd_ = -1;
  wake_[0] = wake_[1] = -1;
  family_ = AF_UNSPEC;
}

uint16_t UdpTransport::local_port() const {
  if (fd_ < 0) return 0;
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

// ── Send path ────────────────────────────────────────────────────────────────

void UdpTransport::send(const Packet& packet) {
  if (std::holds_alternative<std::monostate>(packet)) return;

  if (logger_.enabled(LogLevel::Send)) {
    if (const auto* message = std::get_if<ControlMessage>(&packet)) {
      logger_.send("-> [OSC] %s: %s", message->address.c_str(),
                   to_payload(arguments_to_json(message->arguments)).c_str());
    } else {
      logger_.send("-> [OSC] Bundle %s",
                   format_timetag(std::get<ControlBundle>(packet).timetag).c_str());
    }
  }

  const std::vector<char> data = encode_packet(packet);

  if (logger_.enabled(LogLevel::Debug)) {
    std::string printable(data.begin(), data.end());
    std::replace(printable.begin(), printable.end(), '\0', '~');
    logger_.debug("-> [OSC] Binary %s", printable.c_str());
  }

  write_datagram(data);
}

sockaddr_storage UdpTransport::resolve_peer(socklen_t& len) const {
  if (endpoint_.peer_host.empty() || endpoint_.peer_port == 0) {
    throw TransportError("no OSC host configured to send to");
  }

  // Through the server socket only its own address family is reachable.
  auto ai = lookup(endpoint_.peer_host, endpoint_.peer_port, fd_ >= 0 ? family_ : AF_UNSPEC, 0);
  const addrinfo* pick = ai.get();
  for (const addrinfo* p = ai.get(); p; p = p->ai_next) {
    if (p->ai_family == AF_INET) {
      pick = p;
      break;
    }
  }

  sockaddr_storage out{};
  std::memcpy(&out, pick->ai_addr, pick->ai_addrlen);
  len = pick->ai_addrlen;
  return out;
}

void UdpTransport::write_datagram(const std::vector<char>& data) {
  socklen_t len = 0;
  const sockaddr_storage peer = resolve_peer(len);
  const auto* addr = reinterpret_cast<const sockaddr*>(&peer);

  if (fd_ >= 0) {
    if (::sendto(fd_, data.data(), data.size(), 0, addr, len) < 0) {
      throw TransportError(errno_text("sendto()"));
    }
    return;
  }

  // Unbound source port so concurrent relays never collide.
  ScopedFd sock(::socket(peer.ss_family, SOCK_DGRAM, 0));
  if (sock.get() < 0) throw TransportError(errno_text("socket()"));
  if (::connect(sock.get(), addr, len) < 0) throw TransportError(errno_text("connect()"));
  if (::send(sock.get(), data.data(), data.size(), 0) < 0) {
    throw TransportError(errno_text("send()"));
  }
}

// ── Receive path ─────────────────────────────────────────────────────────────

void UdpTransport::rx_loop() {
  std::vector<char> buf(kMaxPacketSize);

  while (true) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    FD_SET(wake_[0], &fds);
    int maxfd = std::max(fd_, wake_[0]) + 1;

    if (::select(maxfd, &fds, nullptr, nullptr, nullptr) < 0) {
      if (errno == EINTR) continue;
      logger_.error("OSC server select(): %s", std::strerror(errno));
      break;
    }
    if (FD_ISSET(wake_[0], &fds)) break;

    if (FD_ISSET(fd_, &fds)) {
      ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0, nullptr, nullptr);
      if (n < 0) continue;
      try {
        on_packet_(buf.data(), static_cast<size_t>(n));
      } catch (const std::exception& e) {
        logger_.error("OSC packet handler: %s", e.what());
      }
    }
  }
}

}  // namespace oscbridge
