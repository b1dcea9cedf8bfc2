#include <utility>

#include "common/logging/logger.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/field_reader.h"

namespace a2s::payload {

namespace {

bool read_mod_block(FieldReader& in, GoldSourceInfo& info) {
  HalfLifeMod mod{};
  if (!in.string(mod.link) || !in.string(mod.download_link) || !in.nul() ||
      !in.i32(mod.version) || !in.i32(mod.size) || !in.u8(mod.type_raw) || !in.u8(mod.dll_raw)) {
    return false;
  }
  mod.type = mod_type_from_byte(mod.type_raw);
  mod.dll = mod_dll_from_byte(mod.dll_raw);
  info.mod = std::move(mod);
  return true;
}

}  // namespace

std::optional<GoldSourceInfo> decode_goldsource_info(std::span<const std::uint8_t> body,
                                                     const DecodeOptions& options,
                                                     std::error_code& ec) {
  FieldReader in(body, options, ec);
  GoldSourceInfo info{};

  if (!in.string(info.address) || !in.string(info.name) || !in.string(info.map) ||
      !in.string(info.folder) || !in.string(info.game) || !in.u8(info.players) ||
      !in.u8(info.max_players) || !in.u8(info.protocol) || !in.u8(info.server_type_raw) ||
      !in.u8(info.environment_raw) || !in.flag(info.password_protected) || !in.flag(info.is_mod)) {
    return std::nullopt;
  }
  info.server_type = server_type_from_byte(info.server_type_raw);
  info.environment = environment_from_byte(info.environment_raw);

  if (info.is_mod && !read_mod_block(in, info)) {
    return std::nullopt;
  }
  if (!in.flag(info.vac_secured) || !in.u8(info.bots)) {
    return std::nullopt;
  }

  if (in.remaining() != 0) {
    LOG_DEBUG("GoldSource info from {} has {} trailing bytes", info.address, in.remaining());
  }
  return info;
}

}  // namespace a2s::payload
