#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "protocol/errors.h"
#include "protocol/payload/decoders.h"

namespace a2s::tests {

namespace {

const std::vector<std::uint8_t> kTwoPlayers{
    0x02, 0x01, 0x5B, 0x44, 0x5D, 0x2D, 0x2D, 0x2D, 0x2D, 0x3E, 0x54, 0x2E, 0x4E, 0x2E, 0x57,
    0x3C, 0x2D, 0x2D, 0x2D, 0x2D, 0x00, 0x0E, 0x00, 0x00, 0x00, 0xB4, 0x97, 0x00, 0x44, 0x02,
    0x4B, 0x69, 0x6C, 0x6C, 0x65, 0x72, 0x20, 0x21, 0x21, 0x21, 0x00, 0x05, 0x00, 0x00, 0x00,
    0x69, 0x24, 0xD9, 0x43,
};

// Declares two players but only one has connected far enough to be listed.
const std::vector<std::uint8_t> kConnectingPlayer{
    0x02, 0x01, 0x5B, 0x44, 0x5D, 0x2D, 0x2D, 0x2D, 0x2D, 0x3E, 0x54, 0x2E, 0x4E, 0x2E, 0x57,
    0x3C, 0x2D, 0x2D, 0x2D, 0x2D, 0x00, 0x0E, 0x00, 0x00, 0x00, 0xB4, 0x97, 0x00, 0x44,
};

const std::vector<std::uint8_t> kTheShipPlayers{
    0x06, 0x00, 0x53, 0x68, 0x69, 0x70, 0x6D, 0x61, 0x74, 0x65, 0x31, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x80, 0xBF, 0x01, 0x53, 0x68, 0x69, 0x70, 0x6D, 0x61, 0x74, 0x65, 0x32,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, 0xBF, 0x02, 0x53, 0x68, 0x69, 0x70, 0x6D,
    0x61, 0x74, 0x65, 0x33, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, 0xBF, 0x03, 0x53,
    0x68, 0x69, 0x70, 0x6D, 0x61, 0x74, 0x65, 0x34, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x80, 0xBF, 0x04, 0x53, 0x68, 0x69, 0x70, 0x6D, 0x61, 0x74, 0x65, 0x35, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x80, 0xBF, 0x07, 0x28, 0x31, 0x29, 0x4C, 0x61, 0x6E, 0x64, 0x4C,
    0x75, 0x62, 0x62, 0x65, 0x72, 0x00, 0x00, 0x00, 0x00, 0x00, 0xD3, 0x8E, 0x68, 0x45, 0x00,
    0x00, 0x00, 0x00, 0xC4, 0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC4, 0x09, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0xC4, 0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC4, 0x09, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0xC4, 0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC4, 0x09,
    0x00, 0x00,
};

std::optional<payload::PlayerList> decode(const std::vector<std::uint8_t>& body, std::error_code& ec) {
  return payload::decode_player_list(body, payload::DecodeOptions{}, ec);
}

}  // namespace

TEST(PlayerListTests, DecodesTwoPlayers) {
  std::error_code ec;
  const auto list = decode(kTwoPlayers, ec);
  ASSERT_TRUE(list.has_value()) << ec.message();
  EXPECT_EQ(list->declared_count, 2);
  ASSERT_EQ(list->players.size(), 2U);

  EXPECT_EQ(list->players[0].index, 1);
  EXPECT_EQ(list->players[0].name, "[D]---->T.N.W<----");
  EXPECT_EQ(list->players[0].score, 14);
  EXPECT_FLOAT_EQ(list->players[0].duration, 514.37036F);
  EXPECT_FALSE(list->players[0].the_ship.has_value());

  EXPECT_EQ(list->players[1].index, 2);
  EXPECT_EQ(list->players[1].name, "Killer !!!");
  EXPECT_EQ(list->players[1].score, 5);
  EXPECT_FLOAT_EQ(list->players[1].duration, 434.28445F);
}

TEST(PlayerListTests, ConnectingPlayerHasNoRecord) {
  std::error_code ec;
  const auto list = decode(kConnectingPlayer, ec);
  ASSERT_TRUE(list.has_value()) << ec.message();
  EXPECT_EQ(list->declared_count, 2);
  ASSERT_EQ(list->players.size(), 1U);
  EXPECT_EQ(list->players[0].name, "[D]---->T.N.W<----");
}

TEST(PlayerListTests, DecodesTheShipExtras) {
  std::error_code ec;
  const auto list = decode(kTheShipPlayers, ec);
  ASSERT_TRUE(list.has_value()) << ec.message();
  EXPECT_EQ(list->declared_count, 6);
  ASSERT_EQ(list->players.size(), 6U);
  for (const auto& player : list->players) {
    ASSERT_TRUE(player.the_ship.has_value()) << player.name;
    EXPECT_EQ(player.the_ship->deaths, 0);
    EXPECT_EQ(player.the_ship->money, 2500);
  }
  EXPECT_EQ(list->players[0].name, "Shipmate1");
  EXPECT_FLOAT_EQ(list->players[0].duration, -1.0F);
  EXPECT_EQ(list->players[5].index, 7);
  EXPECT_EQ(list->players[5].name, "(1)LandLubber");
  EXPECT_FLOAT_EQ(list->players[5].duration, 3720.9265F);
}

TEST(PlayerListTests, EmptyServer) {
  const std::vector<std::uint8_t> body{0x00};
  std::error_code ec;
  const auto list = decode(body, ec);
  ASSERT_TRUE(list.has_value());
  EXPECT_EQ(list->declared_count, 0);
  EXPECT_TRUE(list->players.empty());
}

TEST(PlayerListTests, RecordCutMidwayIsTruncated) {
  auto body = kTwoPlayers;
  body.resize(body.size() - 2);  // Inside the second duration.
  std::error_code ec;
  EXPECT_FALSE(decode(body, ec).has_value());
  EXPECT_EQ(ec, Error::kTruncatedPayload);
}

TEST(PlayerListTests, MissingCountIsTruncated) {
  std::error_code ec;
  EXPECT_FALSE(decode({}, ec).has_value());
  EXPECT_EQ(ec, Error::kTruncatedPayload);
}

}  // namespace a2s::tests
