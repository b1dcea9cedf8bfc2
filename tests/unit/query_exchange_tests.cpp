#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "protocol/errors.h"
#include "protocol/packet/packet_header.h"
#include "protocol/reassembly/decompressor.h"
#include "protocol/request/request_codec.h"
#include "protocol/session/query_exchange.h"
#include "protocol/wire/byte_writer.h"

namespace a2s::tests {

using packet::SplitFormat;
using request::RequestType;
using session::QueryExchange;
using session::StepKind;

namespace {

// Complete rules payload as a server would send it, marker included.
std::vector<std::uint8_t> rules_payload(int count) {
  std::vector<std::uint8_t> payload{0xFF, 0xFF, 0xFF, 0xFF, 0x45};
  wire::write_u16(payload, static_cast<std::uint16_t>(count));
  for (int i = 0; i < count; ++i) {
    wire::write_cstring(payload, "rule_" + std::to_string(i));
    wire::write_cstring(payload, std::to_string(i));
  }
  return payload;
}

std::vector<std::uint8_t> challenge_datagram(std::int32_t value) {
  std::vector<std::uint8_t> datagram{0xFF, 0xFF, 0xFF, 0xFF, 0x41};
  wire::write_i32(datagram, value);
  return datagram;
}

std::vector<std::vector<std::uint8_t>> split_datagrams(const std::vector<std::uint8_t>& payload,
                                                       std::int32_t request_id, std::uint8_t total,
                                                       SplitFormat format) {
  std::vector<std::vector<std::uint8_t>> out;
  const std::size_t step = (payload.size() + total - 1) / total;
  for (std::uint8_t index = 0; index < total; ++index) {
    const std::size_t begin = std::min(payload.size(), index * step);
    const std::size_t end = std::min(payload.size(), begin + step);
    packet::SplitHeader header;
    header.request_id = request_id;
    header.total_fragments = total;
    header.fragment_index = index;
    out.push_back(packet::encode_split(
        header, format,
        std::span<const std::uint8_t>(payload.data() + begin, end - begin)));
  }
  return out;
}

}  // namespace

TEST(QueryExchangeTests, StartSendsPlaceholderChallenge) {
  QueryExchange exchange(RequestType::kPlayers, SplitFormat::kSource);
  EXPECT_EQ(exchange.start(), request::encode_player_request(-1));
  EXPECT_FALSE(exchange.complete());
}

TEST(QueryExchangeTests, ChallengeRoundTrip) {
  QueryExchange exchange(RequestType::kRules, SplitFormat::kSource);
  exchange.start();

  std::error_code ec;
  auto step = exchange.feed(challenge_datagram(0x4B1D), ec);
  ASSERT_TRUE(step.has_value()) << ec.message();
  ASSERT_EQ(step->kind, StepKind::kResend);
  EXPECT_EQ(step->request, request::encode_rules_request(0x4B1D));

  step = exchange.feed(rules_payload(2), ec);
  ASSERT_TRUE(step.has_value()) << ec.message();
  ASSERT_EQ(step->kind, StepKind::kComplete);
  ASSERT_TRUE(step->response.has_value());
  const auto& rules = std::get<payload::RuleList>(*step->response);
  ASSERT_EQ(rules.rules.size(), 2U);
  EXPECT_EQ(rules.rules[1].name, "rule_1");
  EXPECT_TRUE(exchange.complete());
}

TEST(QueryExchangeTests, InfoChallengeIsAppended) {
  QueryExchange exchange(RequestType::kInfo, SplitFormat::kSource);
  exchange.start();
  std::error_code ec;
  const auto step = exchange.feed(challenge_datagram(9), ec);
  ASSERT_TRUE(step.has_value());
  ASSERT_EQ(step->kind, StepKind::kResend);
  EXPECT_EQ(step->request, request::encode_info_request(9));
}

TEST(QueryExchangeTests, SecondChallengeFails) {
  QueryExchange exchange(RequestType::kPlayers, SplitFormat::kSource);
  exchange.start();
  std::error_code ec;
  ASSERT_TRUE(exchange.feed(challenge_datagram(1), ec).has_value());
  EXPECT_FALSE(exchange.feed(challenge_datagram(2), ec).has_value());
  EXPECT_EQ(ec, Error::kRepeatedChallenge);
}

TEST(QueryExchangeTests, SplitResponseMatchesSingleInEveryOrder) {
  const auto payload = rules_payload(40);

  QueryExchange single(RequestType::kRules, SplitFormat::kSource);
  single.start();
  std::error_code ec;
  const auto expected = single.feed(payload, ec);
  ASSERT_TRUE(expected.has_value()) << ec.message();
  ASSERT_EQ(expected->kind, StepKind::kComplete);
  const auto& expected_rules = std::get<payload::RuleList>(*expected->response);

  const auto datagrams = split_datagrams(payload, 42, 3, SplitFormat::kSource);
  std::vector<std::size_t> order{0, 1, 2};
  do {
    QueryExchange exchange(RequestType::kRules, SplitFormat::kSource);
    exchange.start();
    std::optional<session::ExchangeStep> step;
    for (std::size_t i = 0; i < order.size(); ++i) {
      step = exchange.feed(datagrams[order[i]], ec);
      ASSERT_TRUE(step.has_value()) << ec.message();
      if (i + 1 < order.size()) {
        EXPECT_EQ(step->kind, StepKind::kAwaitingFragments);
      }
    }
    ASSERT_EQ(step->kind, StepKind::kComplete);
    const auto& rules = std::get<payload::RuleList>(*step->response);
    EXPECT_EQ(rules.declared_count, expected_rules.declared_count);
    ASSERT_EQ(rules.rules.size(), expected_rules.rules.size());
    for (std::size_t i = 0; i < rules.rules.size(); ++i) {
      EXPECT_EQ(rules.rules[i].name, expected_rules.rules[i].name);
      EXPECT_EQ(rules.rules[i].value, expected_rules.rules[i].value);
    }
  } while (std::next_permutation(order.begin(), order.end()));
}

TEST(QueryExchangeTests, GoldSourceSplitResponse) {
  const auto payload = rules_payload(10);
  const auto datagrams = split_datagrams(payload, 7, 2, SplitFormat::kGoldSource);

  QueryExchange exchange(RequestType::kRules, SplitFormat::kGoldSource);
  exchange.start();
  std::error_code ec;
  auto step = exchange.feed(datagrams[1], ec);
  ASSERT_TRUE(step.has_value());
  EXPECT_EQ(step->kind, StepKind::kAwaitingFragments);
  step = exchange.feed(datagrams[0], ec);
  ASSERT_TRUE(step.has_value()) << ec.message();
  ASSERT_EQ(step->kind, StepKind::kComplete);
  EXPECT_EQ(std::get<payload::RuleList>(*step->response).rules.size(), 10U);
}

TEST(QueryExchangeTests, CompressedSplitResponse) {
  const auto payload = rules_payload(60);
  const auto compressed = reassembly::compress_bzip2(payload);
  ASSERT_TRUE(compressed.has_value());
  const auto id = static_cast<std::int32_t>(0x80000003U);
  auto datagrams = split_datagrams(*compressed, id, 2, SplitFormat::kSource);

  // Fragment 0 of a compressed response carries the size and CRC32.
  packet::SplitHeader first;
  first.request_id = id;
  first.total_fragments = 2;
  first.fragment_index = 0;
  first.decompressed_size = static_cast<std::uint32_t>(payload.size());
  first.crc32 = reassembly::crc32_of(payload);
  const std::size_t half = (compressed->size() + 1) / 2;
  datagrams[0] = packet::encode_split(first, SplitFormat::kSource,
                                      std::span<const std::uint8_t>(compressed->data(), half));

  QueryExchange exchange(RequestType::kRules, SplitFormat::kSource);
  exchange.start();
  std::error_code ec;
  ASSERT_TRUE(exchange.feed(datagrams[1], ec).has_value()) << ec.message();
  const auto step = exchange.feed(datagrams[0], ec);
  ASSERT_TRUE(step.has_value()) << ec.message();
  ASSERT_EQ(step->kind, StepKind::kComplete);
  EXPECT_EQ(std::get<payload::RuleList>(*step->response).rules.size(), 60U);
}

TEST(QueryExchangeTests, MalformedDatagramDoesNotEndExchange) {
  QueryExchange exchange(RequestType::kPlayers, SplitFormat::kSource);
  exchange.start();
  std::error_code ec;
  const std::vector<std::uint8_t> junk{0x01, 0x02};
  EXPECT_FALSE(exchange.feed(junk, ec).has_value());
  EXPECT_EQ(ec, Error::kMalformedHeader);

  ec.clear();
  const std::vector<std::uint8_t> players{0xFF, 0xFF, 0xFF, 0xFF, 0x44, 0x00};
  const auto step = exchange.feed(players, ec);
  ASSERT_TRUE(step.has_value()) << ec.message();
  EXPECT_EQ(step->kind, StepKind::kComplete);
}

TEST(QueryExchangeTests, PingNeedsNoChallenge) {
  QueryExchange exchange(RequestType::kPing, SplitFormat::kGoldSource);
  EXPECT_EQ(exchange.start(), request::encode_ping_request());
  std::error_code ec;
  const std::vector<std::uint8_t> reply{0xFF, 0xFF, 0xFF, 0xFF, 0x6A, 0x00};
  const auto step = exchange.feed(reply, ec);
  ASSERT_TRUE(step.has_value());
  ASSERT_EQ(step->kind, StepKind::kComplete);
  EXPECT_TRUE(std::holds_alternative<payload::PingResponse>(*step->response));
}

}  // namespace a2s::tests
