#include <gtest/gtest.h>

#include <cstdint>
#include <variant>
#include <vector>

#include "protocol/errors.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/payload_parser.h"

namespace a2s::tests {

TEST(PingTests, SourceReplyText) {
  const std::vector<std::uint8_t> body{0x30, 0x30, 0x30, 0x30, 0x30, 0x30, 0x30, 0x30,
                                       0x30, 0x30, 0x30, 0x30, 0x30, 0x30, 0x00};
  std::error_code ec;
  const auto ping = payload::decode_ping(body, payload::DecodeOptions{}, ec);
  ASSERT_TRUE(ping.has_value()) << ec.message();
  EXPECT_EQ(ping->text, "00000000000000");
}

TEST(PingTests, GoldSourceReplyIsEmptyString) {
  const std::vector<std::uint8_t> body{0x00};
  std::error_code ec;
  const auto ping = payload::decode_ping(body, payload::DecodeOptions{}, ec);
  ASSERT_TRUE(ping.has_value());
  EXPECT_EQ(ping->text, "");
}

TEST(PingTests, BareMarkerIsAcknowledgement) {
  const std::vector<std::uint8_t> payload{0xFF, 0xFF, 0xFF, 0xFF, 0x6A};
  std::error_code ec;
  const auto response = payload::parse_payload(payload, ec);
  ASSERT_TRUE(response.has_value()) << ec.message();
  ASSERT_TRUE(std::holds_alternative<payload::PingResponse>(*response));
  EXPECT_TRUE(std::get<payload::PingResponse>(*response).text.empty());
}

TEST(PingTests, UnterminatedTextIsTruncated) {
  const std::vector<std::uint8_t> body{0x30, 0x30};
  std::error_code ec;
  EXPECT_FALSE(payload::decode_ping(body, payload::DecodeOptions{}, ec).has_value());
  EXPECT_EQ(ec, Error::kTruncatedPayload);
}

TEST(ChallengeResponseTests, DecodesValue) {
  const std::vector<std::uint8_t> payload{0x41, 0x78, 0x56, 0x34, 0x12};
  std::error_code ec;
  const auto response = payload::parse_payload(payload, ec);
  ASSERT_TRUE(response.has_value()) << ec.message();
  ASSERT_TRUE(std::holds_alternative<payload::ChallengeResponse>(*response));
  EXPECT_EQ(std::get<payload::ChallengeResponse>(*response).challenge, 0x12345678);
}

TEST(ChallengeResponseTests, ShortValueIsTruncated) {
  const std::vector<std::uint8_t> body{0x78, 0x56};
  std::error_code ec;
  EXPECT_FALSE(payload::decode_challenge(body, ec).has_value());
  EXPECT_EQ(ec, Error::kTruncatedPayload);
}

TEST(PayloadParserTests, RequestBytesAreNotResponses) {
  const std::vector<std::uint8_t> payload{0x55, 0xFF, 0xFF, 0xFF, 0xFF};
  std::error_code ec;
  EXPECT_FALSE(payload::parse_payload(payload, ec).has_value());
  EXPECT_EQ(ec, Error::kUnknownPayloadType);
}

TEST(PayloadParserTests, UnknownTypeByte) {
  const std::vector<std::uint8_t> payload{0x00, 0x01};
  std::error_code ec;
  EXPECT_FALSE(payload::parse_payload(payload, ec).has_value());
  EXPECT_EQ(ec, Error::kUnknownPayloadType);
}

TEST(ErrorTests, CategoryNamesAndMessages) {
  const std::error_code ec = Error::kConflictingFragment;
  EXPECT_STREQ(ec.category().name(), "a2s");
  EXPECT_FALSE(ec.message().empty());
  EXPECT_STREQ(error_name(Error::kConflictingFragment), "conflicting_fragment");
  EXPECT_STREQ(error_name(Error::kMalformedHeader), "malformed_header");
}

}  // namespace a2s::tests
