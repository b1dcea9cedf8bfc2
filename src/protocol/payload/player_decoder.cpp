#include <utility>

#include "common/logging/logger.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/field_reader.h"

namespace a2s::payload {

namespace {

constexpr std::size_t kTheShipPlayerSize = 4 + 4;

}  // namespace

std::optional<PlayerList> decode_player_list(std::span<const std::uint8_t> body,
                                             const DecodeOptions& options, std::error_code& ec) {
  FieldReader in(body, options, ec);
  PlayerList list{};
  if (!in.u8(list.declared_count)) {
    return std::nullopt;
  }

  // The count includes connecting players, which have no record, so the
  // list may stop early, but only on a record boundary.
  list.players.reserve(list.declared_count);
  while (list.players.size() < list.declared_count && in.remaining() > 0) {
    Player player{};
    if (!in.u8(player.index) || !in.string(player.name) || !in.i32(player.score) ||
        !in.f32(player.duration)) {
      return std::nullopt;
    }
    list.players.push_back(std::move(player));
  }

  // The Ship appends deaths and money for every player after the records.
  if (!list.players.empty() && in.remaining() == list.players.size() * kTheShipPlayerSize) {
    for (auto& player : list.players) {
      TheShipPlayer ship{};
      if (!in.i32(ship.deaths) || !in.i32(ship.money)) {
        return std::nullopt;
      }
      player.the_ship = ship;
    }
  }

  if (in.remaining() != 0) {
    LOG_DEBUG("Player list ({} of {} records) has {} trailing bytes", list.players.size(),
              list.declared_count, in.remaining());
  }
  return list;
}

}  // namespace a2s::payload
