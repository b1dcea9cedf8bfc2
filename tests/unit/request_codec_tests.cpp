#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "protocol/errors.h"
#include "protocol/request/request_codec.h"

namespace a2s::tests {

using request::RequestType;

namespace {

std::vector<std::uint8_t> info_bytes() {
  std::vector<std::uint8_t> out{0xFF, 0xFF, 0xFF, 0xFF, 0x54};
  const std::string query = "Source Engine Query";
  out.insert(out.end(), query.begin(), query.end());
  out.push_back(0x00);
  return out;
}

}  // namespace

TEST(RequestCodecTests, EncodesInfoRequest) {
  EXPECT_EQ(request::encode_info_request(), info_bytes());

  auto expected = info_bytes();
  expected.insert(expected.end(), {0x78, 0x56, 0x34, 0x12});
  EXPECT_EQ(request::encode_info_request(0x12345678), expected);
}

TEST(RequestCodecTests, EncodesPlayerAndRulesRequests) {
  const std::vector<std::uint8_t> players{0xFF, 0xFF, 0xFF, 0xFF, 0x55, 0xFF, 0xFF, 0xFF, 0xFF};
  const std::vector<std::uint8_t> rules{0xFF, 0xFF, 0xFF, 0xFF, 0x56, 0x01, 0x00, 0x00, 0x00};
  EXPECT_EQ(request::encode_player_request(-1), players);
  EXPECT_EQ(request::encode_rules_request(1), rules);
}

TEST(RequestCodecTests, EncodesPingAndChallengeRequests) {
  EXPECT_EQ(request::encode_ping_request(), (std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x69}));
  EXPECT_EQ(request::encode_challenge_request(),
            (std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x57}));
}

TEST(RequestCodecTests, InitialRequestsCarryPlaceholder) {
  std::error_code ec;
  for (const auto type : {RequestType::kPlayers, RequestType::kRules}) {
    const auto parsed = request::parse_request(request::initial_request(type), ec);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->type, type);
    EXPECT_EQ(parsed->challenge, std::optional<std::int32_t>(-1));
  }
  const auto info = request::parse_request(request::initial_request(RequestType::kInfo), ec);
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->challenge.has_value());
  EXPECT_EQ(info->payload, request::kInfoRequestPayload);
}

TEST(RequestCodecTests, ParsesInfoRequestWithChallenge) {
  std::error_code ec;
  const auto parsed = request::parse_request(request::encode_info_request(77), ec);
  ASSERT_TRUE(parsed.has_value()) << ec.message();
  EXPECT_EQ(parsed->type, RequestType::kInfo);
  EXPECT_EQ(parsed->payload, "Source Engine Query");
  EXPECT_EQ(parsed->challenge, std::optional<std::int32_t>(77));
  EXPECT_TRUE(parsed->trailing.empty());
}

TEST(RequestCodecTests, WithChallengeReplacesPlaceholder) {
  std::error_code ec;
  const auto resent = request::with_challenge(request::encode_player_request(-1), 0x0A0B0C0D, ec);
  ASSERT_TRUE(resent.has_value()) << ec.message();
  EXPECT_EQ(*resent, request::encode_player_request(0x0A0B0C0D));
}

TEST(RequestCodecTests, WithChallengeAppendsToInfoRequest) {
  std::error_code ec;
  const auto resent = request::with_challenge(request::encode_info_request(), 5, ec);
  ASSERT_TRUE(resent.has_value());
  EXPECT_EQ(*resent, request::encode_info_request(5));

  // A second substitution replaces rather than appends.
  const auto again = request::with_challenge(*resent, 6, ec);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, request::encode_info_request(6));
}

TEST(RequestCodecTests, WithChallengeLeavesPingUnchanged) {
  std::error_code ec;
  const auto resent = request::with_challenge(request::encode_ping_request(), 5, ec);
  ASSERT_TRUE(resent.has_value());
  EXPECT_EQ(*resent, request::encode_ping_request());
}

TEST(RequestCodecTests, PlayerRequestWithoutChallengeIsTruncated) {
  const std::vector<std::uint8_t> bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x55, 0x01};
  std::error_code ec;
  EXPECT_FALSE(request::parse_request(bytes, ec).has_value());
  EXPECT_EQ(ec, Error::kTruncatedPayload);
}

TEST(RequestCodecTests, ResponsesAreNotRequests) {
  const std::vector<std::uint8_t> bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x44, 0x00};
  std::error_code ec;
  EXPECT_FALSE(request::parse_request(bytes, ec).has_value());
  EXPECT_EQ(ec, Error::kUnknownPayloadType);
}

TEST(RequestCodecTests, RequestTypeNames) {
  for (const auto type : {RequestType::kInfo, RequestType::kPlayers, RequestType::kRules,
                          RequestType::kPing, RequestType::kChallenge}) {
    EXPECT_EQ(request::request_type_from_string(request::request_type_name(type)), type);
  }
  EXPECT_TRUE(request::takes_challenge(RequestType::kRules));
  EXPECT_FALSE(request::takes_challenge(RequestType::kPing));
}

}  // namespace a2s::tests
