#include <utility>

#include "common/logging/logger.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/field_reader.h"

namespace a2s::payload {

namespace {

bool read_the_ship(FieldReader& in, SourceInfo& info) {
  TheShipInfo ship{};
  if (!in.u8(ship.mode_raw) || !in.u8(ship.witnesses) || !in.u8(ship.duration)) {
    return false;
  }
  ship.mode = the_ship_mode_from_byte(ship.mode_raw);
  info.the_ship = ship;
  return true;
}

// Tail fields follow the EDF byte in this exact order, each present only if
// its bit is set.
bool read_extra_data(FieldReader& in, SourceInfo& info) {
  const std::uint8_t edf = info.extra_data_flags;
  if ((edf & kEdfPort) != 0) {
    std::uint16_t port = 0;
    if (!in.u16(port)) return false;
    info.port = port;
  }
  if ((edf & kEdfSteamId) != 0) {
    std::uint64_t steam_id = 0;
    if (!in.u64(steam_id)) return false;
    info.steam_id = steam_id;
  }
  if ((edf & kEdfSpectator) != 0) {
    std::uint16_t spectator_port = 0;
    std::string spectator_name;
    if (!in.u16(spectator_port) || !in.string(spectator_name)) return false;
    info.spectator_port = spectator_port;
    info.spectator_name = std::move(spectator_name);
  }
  if ((edf & kEdfKeywords) != 0) {
    std::string keywords;
    if (!in.string(keywords)) return false;
    info.keywords = std::move(keywords);
  }
  if ((edf & kEdfGameId) != 0) {
    std::uint64_t game_id = 0;
    if (!in.u64(game_id)) return false;
    info.game_id = game_id;
  }
  return true;
}

}  // namespace

std::optional<SourceInfo> decode_source_info(std::span<const std::uint8_t> body,
                                             const DecodeOptions& options, std::error_code& ec) {
  FieldReader in(body, options, ec);
  SourceInfo info{};

  if (!in.u8(info.protocol) || !in.string(info.name) || !in.string(info.map) ||
      !in.string(info.folder) || !in.string(info.game) || !in.u16(info.app_id) ||
      !in.u8(info.players) || !in.u8(info.max_players) || !in.u8(info.bots) ||
      !in.u8(info.server_type_raw) || !in.u8(info.environment_raw) ||
      !in.flag(info.password_protected) || !in.flag(info.vac_secured)) {
    return std::nullopt;
  }
  info.server_type = server_type_from_byte(info.server_type_raw);
  info.environment = environment_from_byte(info.environment_raw);

  if (info.app_id == kTheShipAppId && !read_the_ship(in, info)) {
    return std::nullopt;
  }
  if (!in.string(info.version)) {
    return std::nullopt;
  }

  // Servers predating the EDF stop after the version string.
  if (in.remaining() == 0) {
    return info;
  }
  if (!in.u8(info.extra_data_flags) || !read_extra_data(in, info)) {
    return std::nullopt;
  }

  if (in.remaining() != 0) {
    LOG_DEBUG("Source info for app {} has {} trailing bytes", info.app_id, in.remaining());
  }
  return info;
}

}  // namespace a2s::payload
