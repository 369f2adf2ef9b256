#include "scanner/ReverseDns.hpp"
#include <gtest/gtest.h>
#include <tins/tins.h>

using namespace net_survey::scanner;

namespace {

std::vector<uint8_t> PtrResponse(uint16_t id, const std::string& target) {
  Tins::DNS dns;
  dns.id(id);
  dns.type(Tins::DNS::RESPONSE);
  dns.add_answer(Tins::DNS::resource("30.1.168.192.in-addr.arpa", target, Tins::DNS::PTR, Tins::DNS::INTERNET, 120));
  return dns.serialize();
}

}  // namespace

TEST(ReverseDns, BuildsInAddrArpaName) {
  EXPECT_EQ(ReverseName("192.168.1.30"), "30.1.168.192.in-addr.arpa");
  EXPECT_EQ(ReverseName("10.0.0.1"), "1.0.0.10.in-addr.arpa");
  EXPECT_FALSE(ReverseName("fe80::1").has_value());
}

TEST(ReverseDns, QueryCarriesOnePtrQuestion) {
  auto bytes = BuildPtrQuery("30.1.168.192.in-addr.arpa", 0x4242);
  Tins::DNS dns(bytes.data(), static_cast<uint32_t>(bytes.size()));
  EXPECT_EQ(dns.id(), 0x4242);
  EXPECT_EQ(dns.type(), Tins::DNS::QUERY);
  auto queries = dns.queries();
  ASSERT_EQ(queries.size(), 1u);
  EXPECT_EQ(queries.front().dname(), "30.1.168.192.in-addr.arpa");
  EXPECT_EQ(queries.front().query_type(), Tins::DNS::PTR);
}

TEST(ReverseDns, TakesFirstAnswerWithoutRootLabel) {
  auto bytes = PtrResponse(7, "printer.local");
  EXPECT_EQ(ParsePtrAnswer(bytes.data(), bytes.size(), 7), "printer.local");
}

TEST(ReverseDns, IgnoresForeignIdsAndEmptyAnswers) {
  auto bytes = PtrResponse(7, "printer.local");
  EXPECT_FALSE(ParsePtrAnswer(bytes.data(), bytes.size(), 8).has_value());

  Tins::DNS empty;
  empty.id(9);
  empty.type(Tins::DNS::RESPONSE);
  auto raw = empty.serialize();
  EXPECT_FALSE(ParsePtrAnswer(raw.data(), raw.size(), 9).has_value());
}

TEST(ReverseDns, MalformedBytesYieldNothing) {
  const uint8_t junk[] = {0x00, 0x07, 0x84};
  EXPECT_FALSE(ParsePtrAnswer(junk, sizeof(junk), 7).has_value());
}

TEST(ReverseDns, StripsTrailingDots) {
  EXPECT_EQ(StripRootLabel("nas.local."), "nas.local");
  EXPECT_EQ(StripRootLabel("nas.local"), "nas.local");
  EXPECT_EQ(StripRootLabel("."), "");
}

TEST(ReverseDns, OutOfRangeCompressionPointerYieldsNothing) {
  // id 7, response, one PTR answer whose rdata points past the message.
  const uint8_t reply[] = {0x00, 0x07, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
                           0x01, 'a',  0x00, 0x00, 0x0C, 0x00, 0x01, 0x00, 0x00, 0x00, 0x78,
                           0x00, 0x02, 0xC0, 0xFF};
  EXPECT_FALSE(ParsePtrAnswer(reply, sizeof(reply), 7).has_value());
}
