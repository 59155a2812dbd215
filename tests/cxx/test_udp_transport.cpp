// Loopback UDP tests for the OSC transport.
// A plain socket plays the OSC device on 127.0.0.1.

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "bundle_codec.h"
#include "fakes.h"
#include "udp_transport.h"

using namespace oscbridge;
using oscbridge::testing::LogCapture;

namespace {

struct Datagram {
  std::vector<char> data;
  uint16_t source_port;
};

// Bound loopback socket standing in for the OSC device.
class Peer {
 public:
  Peer() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

    timeval tv{2, 0};
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }
  ~Peer() {
    ::close(fd_);
  }

  uint16_t port() const {
    return port_;
  }

  std::optional<Datagram> recv() {
    std::vector<char> buf(kMaxPacketSize);
    sockaddr_in from{};
    socklen_t len = sizeof(from);
    ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&from), &len);
    if (n < 0) return std::nullopt;
    buf.resize(static_cast<size_t>(n));
    return Datagram{std::move(buf), ntohs(from.sin_port)};
  }

  void send_to(uint16_t port, const std::vector<char>& data) {
    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    to.sin_port = htons(port);
    ::sendto(fd_, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&to), sizeof(to));
  }

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
};

}  // namespace

class UdpTransportTest : public ::testing::Test {
 protected:
  Peer peer_;
  LogCapture capture_;
  Logger logger_{capture_.sink()};
  ComponentLogger log_{logger_, "osc/test", LogLevel::Debug};
};

// ── Server-present mode ──────────────────────────────────────────────────────

TEST_F(UdpTransportTest, RepliesLeaveFromTheBoundSocket) {
  UdpTransport transport({"127.0.0.1", peer_.port(), "127.0.0.1", 0}, log_);
  transport.start([](const char*, size_t) {});
  ASSERT_TRUE(transport.receiving());
  ASSERT_NE(transport.local_port(), 0);

  ControlMessage msg{"/ch/01/mix/fader", {0.5f}};
  transport.send(msg);

  auto got = peer_.recv();
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->source_port, transport.local_port());
  Packet decoded = decode_packet(got->data.data(), got->data.size());
  EXPECT_EQ(std::get<ControlMessage>(decoded), msg);
  transport.stop();
}

TEST_F(UdpTransportTest, DeliversInboundDatagrams) {
  std::mutex mu;
  std::condition_variable cv;
  std::vector<Packet> received;

  UdpTransport transport({"", 0, "127.0.0.1", 0}, log_);
  transport.start([&](const char* data, size_t size) {
    std::lock_guard lk{mu};
    received.push_back(decode_packet(data, size));
    cv.notify_all();
  });

  ControlBundle bundle{TimeTag::immediate(), {{"/a", {int32_t{1}}}, {"/b", {}}}, {}};
  peer_.send_to(transport.local_port(), encode_packet(bundle));

  std::unique_lock lk{mu};
  ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&] { return !received.empty(); }));
  EXPECT_EQ(std::get<ControlBundle>(received[0]), bundle);
}

TEST_F(UdpTransportTest, StopIsIdempotent) {
  UdpTransport transport({"", 0, "127.0.0.1", 0}, log_);
  transport.start([](const char*, size_t) {});
  transport.stop();
  EXPECT_FALSE(transport.receiving());
  transport.stop();
}

TEST_F(UdpTransportTest, BindConflictThrows) {
  UdpTransport transport({"", 0, "127.0.0.1", peer_.port()}, log_);
  EXPECT_THROW(transport.start([](const char*, size_t) {}), TransportError);
}

TEST_F(UdpTransportTest, SendWithoutHostThrows) {
  UdpTransport transport({"", 0, "127.0.0.1", 0}, log_);
  transport.start([](const char*, size_t) {});
  EXPECT_THROW(transport.send(ControlMessage{"/x", {}}), TransportError);
  EXPECT_NO_THROW(transport.send(std::monostate{}));
}

// ── Client-only mode ─────────────────────────────────────────────────────────

TEST_F(UdpTransportTest, ClientOnlySendsFromEphemeralSockets) {
  UdpTransport transport({"127.0.0.1", peer_.port(), "", 0}, log_);
  transport.start([](const char*, size_t) { FAIL() << "client-only mode never receives"; });
  EXPECT_FALSE(transport.receiving());
  EXPECT_EQ(transport.local_port(), 0);

  transport.send(ControlMessage{"/xremote", {}});

  auto got = peer_.recv();
  ASSERT_TRUE(got.has_value());
  Packet decoded = decode_packet(got->data.data(), got->data.size());
  EXPECT_EQ(std::get<ControlMessage>(decoded).address, "/xremote");
}

TEST_F(UdpTransportTest, LogsOutboundTraffic) {
  UdpTransport transport({"127.0.0.1", peer_.port(), "", 0}, log_);
  transport.start([](const char*, size_t) {});
  transport.send(ControlMessage{"/ch/01/mix/on", {int32_t{1}}});
  ASSERT_TRUE(peer_.recv().has_value());

  logger_.drain();
  bool logged = false;
  for (const auto& r : capture_.records) {
    if (r.level == LogLevel::Send && r.text == "-> [OSC] /ch/01/mix/on: [1]") logged = true;
  }
  EXPECT_TRUE(logged);
}

TEST_F(UdpTransportTest, SendsAndLogsNonUtf8Strings) {
  UdpTransport transport({"127.0.0.1", peer_.port(), "", 0}, log_);
  transport.start([](const char*, size_t) {});
  EXPECT_NO_THROW(transport.send(ControlMessage{"/ch/01/config/name", {std::string("M\xE4x")}}));

  auto got = peer_.recv();
  ASSERT_TRUE(got.has_value());
  Packet decoded = decode_packet(got->data.data(), got->data.size());
  EXPECT_EQ(std::get<std::string>(std::get<ControlMessage>(decoded).arguments[0]), "M\xE4x");

  logger_.drain();
  bool logged = false;
  for (const auto& r : capture_.records) {
    if (r.level == LogLevel::Send && r.text == "-> [OSC] /ch/01/config/name: [\"M\xEF\xBF\xBDx\"]") {
      logged = true;
    }
  }
  EXPECT_TRUE(logged);
}
