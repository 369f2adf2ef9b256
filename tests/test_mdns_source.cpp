#include "scanner/MulticastDnsSource.hpp"
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <tins/tins.h>
#include <unistd.h>
#include <chrono>
#include <cstring>
#include <thread>

using namespace net_survey::scanner;
using Clock = std::chrono::steady_clock;

namespace {

enum class ReplyMode { Silent, ForeignIdThenAnswer, GarbageThenAnswer };

// Loopback UDP responder answering a single PTR query.
class LoopbackResponder {
 public:
  explicit LoopbackResponder(ReplyMode mode) : mode_(mode) {
    fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    worker_ = std::thread([this] { Serve(); });
  }

  ~LoopbackResponder() {
    if (worker_.joinable()) worker_.join();
    close(fd_);
  }

  uint16_t Port() const { return port_; }

 private:
  void Serve() {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, 2000) <= 0) return;

    uint8_t buffer[1500];
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    ssize_t n = recvfrom(fd_, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&peer), &len);
    if (n <= 0 || mode_ == ReplyMode::Silent) return;

    Tins::DNS query(buffer, static_cast<uint32_t>(n));
    const std::string name = query.queries().front().dname();

    if (mode_ == ReplyMode::ForeignIdThenAnswer) {
      Send(Reply(static_cast<uint16_t>(query.id() + 1), name, "stale.local"), peer);
    } else {
      const uint8_t junk[] = {0xde, 0xad};
      sendto(fd_, junk, sizeof(junk), 0, reinterpret_cast<sockaddr*>(&peer), sizeof(peer));
    }
    Send(Reply(query.id(), name, "printer.local"), peer);
  }

  static std::vector<uint8_t> Reply(uint16_t id, const std::string& name, const std::string& target) {
    Tins::DNS dns;
    dns.id(id);
    dns.type(Tins::DNS::RESPONSE);
    dns.add_answer(Tins::DNS::resource(name, target, Tins::DNS::PTR, Tins::DNS::INTERNET, 120));
    return dns.serialize();
  }

  void Send(const std::vector<uint8_t>& bytes, const sockaddr_in& peer) {
    sendto(fd_, bytes.data(), bytes.size(), 0, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
  }

  ReplyMode mode_;
  int fd_ = -1;
  uint16_t port_ = 0;
  std::thread worker_;
};

}  // namespace

TEST(MulticastDnsSource, PollBudgetNeverZeroBeforeDeadline) {
  auto now = Clock::now();
  EXPECT_EQ(PollBudget(now + std::chrono::nanoseconds(400), now), 1);
  EXPECT_EQ(PollBudget(now + std::chrono::microseconds(1500), now), 2);
  EXPECT_EQ(PollBudget(now + std::chrono::milliseconds(700), now), 700);
  EXPECT_EQ(PollBudget(now, now), 0);
  EXPECT_EQ(PollBudget(now - std::chrono::milliseconds(5), now), 0);
}

TEST(MulticastDnsSource, SilentResponderTimesOut) {
  LoopbackResponder responder(ReplyMode::Silent);
  MulticastDnsSource source(std::chrono::milliseconds(200), std::nullopt, "127.0.0.1", responder.Port());

  auto start = Clock::now();
  EXPECT_FALSE(source.Lookup("192.168.1.30").has_value());
  auto elapsed = Clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(190));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(MulticastDnsSource, SkipsReplyWithForeignId) {
  LoopbackResponder responder(ReplyMode::ForeignIdThenAnswer);
  MulticastDnsSource source(std::chrono::milliseconds(1000), std::nullopt, "127.0.0.1", responder.Port());
  EXPECT_EQ(source.Lookup("192.168.1.30"), "printer.local");
}

TEST(MulticastDnsSource, SkipsUnparseableReply) {
  LoopbackResponder responder(ReplyMode::GarbageThenAnswer);
  MulticastDnsSource source(std::chrono::milliseconds(1000), std::nullopt, "127.0.0.1", responder.Port());
  EXPECT_EQ(source.Lookup("192.168.1.30"), "printer.local");
}

TEST(MulticastDnsSource, NonIpv4InputAndBadDestinationYieldNothing) {
  MulticastDnsSource source(std::chrono::milliseconds(50), std::nullopt, "not-an-address", 5353);
  EXPECT_FALSE(source.Lookup("fe80::1").has_value());
  EXPECT_FALSE(source.Lookup("192.168.1.30").has_value());
}
