#include "protocol/payload/responses.h"

namespace a2s::payload {

ServerType server_type_from_byte(std::uint8_t value) {
  switch (value) {
    case 'd':
    case 'D':
      return ServerType::kDedicated;
    case 'l':
    case 'L':
      return ServerType::kNonDedicated;
    case 'p':
    case 'P':
      return ServerType::kSourceTv;
    default:
      return ServerType::kOther;
  }
}

Environment environment_from_byte(std::uint8_t value) {
  switch (value) {
    case 'l':
    case 'L':
      return Environment::kLinux;
    case 'w':
    case 'W':
      return Environment::kWindows;
    case 'm':
    case 'M':
    case 'o':
    case 'O':
      return Environment::kMac;
    default:
      return Environment::kOther;
  }
}

TheShipMode the_ship_mode_from_byte(std::uint8_t value) {
  switch (value) {
    case 0: return TheShipMode::kHunt;
    case 1: return TheShipMode::kElimination;
    case 2: return TheShipMode::kDuel;
    case 3: return TheShipMode::kDeathmatch;
    case 4: return TheShipMode::kVipTeam;
    case 5: return TheShipMode::kTeamElimination;
    default: return TheShipMode::kOther;
  }
}

ModType mod_type_from_byte(std::uint8_t value) {
  switch (value) {
    case 0: return ModType::kSingleAndMultiplayer;
    case 1: return ModType::kMultiplayerOnly;
    default: return ModType::kOther;
  }
}

ModDll mod_dll_from_byte(std::uint8_t value) {
  switch (value) {
    case 0: return ModDll::kHalfLife;
    case 1: return ModDll::kCustom;
    default: return ModDll::kOther;
  }
}

const char* server_type_name(ServerType type) {
  switch (type) {
    case ServerType::kDedicated: return "dedicated";
    case ServerType::kNonDedicated: return "non_dedicated";
    case ServerType::kSourceTv: return "source_tv";
    case ServerType::kOther: return "other";
  }
  return "other";
}

const char* environment_name(Environment env) {
  switch (env) {
    case Environment::kLinux: return "linux";
    case Environment::kWindows: return "windows";
    case Environment::kMac: return "mac";
    case Environment::kOther: return "other";
  }
  return "other";
}

const char* the_ship_mode_name(TheShipMode mode) {
  switch (mode) {
    case TheShipMode::kHunt: return "hunt";
    case TheShipMode::kElimination: return "elimination";
    case TheShipMode::kDuel: return "duel";
    case TheShipMode::kDeathmatch: return "deathmatch";
    case TheShipMode::kVipTeam: return "vip_team";
    case TheShipMode::kTeamElimination: return "team_elimination";
    case TheShipMode::kOther: return "other";
  }
  return "other";
}

const char* mod_type_name(ModType type) {
  switch (type) {
    case ModType::kSingleAndMultiplayer: return "single_and_multiplayer";
    case ModType::kMultiplayerOnly: return "multiplayer_only";
    case ModType::kOther: return "other";
  }
  return "other";
}

const char* mod_dll_name(ModDll dll) {
  switch (dll) {
    case ModDll::kHalfLife: return "half_life";
    case ModDll::kCustom: return "custom";
    case ModDll::kOther: return "other";
  }
  return "other";
}

}  // namespace a2s::payload
