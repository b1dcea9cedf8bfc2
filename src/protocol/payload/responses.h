#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace a2s::payload {

// Hosting type. Source sends lowercase codes, GoldSource uppercase.
enum class ServerType : std::uint8_t { kDedicated, kNonDedicated, kSourceTv, kOther };

enum class Environment : std::uint8_t { kLinux, kWindows, kMac, kOther };

enum class TheShipMode : std::uint8_t {
  kHunt,
  kElimination,
  kDuel,
  kDeathmatch,
  kVipTeam,
  kTeamElimination,
  kOther,
};

enum class ModType : std::uint8_t { kSingleAndMultiplayer, kMultiplayerOnly, kOther };

enum class ModDll : std::uint8_t { kHalfLife, kCustom, kOther };

ServerType server_type_from_byte(std::uint8_t value);
Environment environment_from_byte(std::uint8_t value);
TheShipMode the_ship_mode_from_byte(std::uint8_t value);
ModType mod_type_from_byte(std::uint8_t value);
ModDll mod_dll_from_byte(std::uint8_t value);

const char* server_type_name(ServerType type);
const char* environment_name(Environment env);
const char* the_ship_mode_name(TheShipMode mode);
const char* mod_type_name(ModType type);
const char* mod_dll_name(ModDll dll);

// Extra Data Flag bits of the Source info response, in wire order.
inline constexpr std::uint8_t kEdfPort = 0x80;
inline constexpr std::uint8_t kEdfSteamId = 0x10;
inline constexpr std::uint8_t kEdfSpectator = 0x40;
inline constexpr std::uint8_t kEdfKeywords = 0x20;
inline constexpr std::uint8_t kEdfGameId = 0x01;

inline constexpr std::uint16_t kTheShipAppId = 2400;

struct TheShipInfo {
  TheShipMode mode{TheShipMode::kOther};
  std::uint8_t mode_raw{0};
  std::uint8_t witnesses{0};
  std::uint8_t duration{0};
};

struct SourceInfo {
  std::uint8_t protocol{0};
  std::string name;
  std::string map;
  std::string folder;
  std::string game;
  std::uint16_t app_id{0};
  std::uint8_t players{0};
  std::uint8_t max_players{0};
  std::uint8_t bots{0};
  ServerType server_type{ServerType::kOther};
  std::uint8_t server_type_raw{0};
  Environment environment{Environment::kOther};
  std::uint8_t environment_raw{0};
  bool password_protected{false};
  bool vac_secured{false};
  std::optional<TheShipInfo> the_ship;
  std::string version;
  std::uint8_t extra_data_flags{0};
  // Each tail field is present only if its EDF bit was set.
  std::optional<std::uint16_t> port;
  std::optional<std::uint64_t> steam_id;
  std::optional<std::uint16_t> spectator_port;
  std::optional<std::string> spectator_name;
  std::optional<std::string> keywords;
  std::optional<std::uint64_t> game_id;
};

struct HalfLifeMod {
  std::string link;
  std::string download_link;
  std::int32_t version{0};
  std::int32_t size{0};
  ModType type{ModType::kOther};
  std::uint8_t type_raw{0};
  ModDll dll{ModDll::kOther};
  std::uint8_t dll_raw{0};
};

struct GoldSourceInfo {
  std::string address;
  std::string name;
  std::string map;
  std::string folder;
  std::string game;
  std::uint8_t players{0};
  std::uint8_t max_players{0};
  std::uint8_t protocol{0};
  ServerType server_type{ServerType::kOther};
  std::uint8_t server_type_raw{0};
  Environment environment{Environment::kOther};
  std::uint8_t environment_raw{0};
  bool password_protected{false};
  bool is_mod{false};
  std::optional<HalfLifeMod> mod;  // Present only when is_mod.
  bool vac_secured{false};
  std::uint8_t bots{0};
};

struct TheShipPlayer {
  std::int32_t deaths{0};
  std::int32_t money{0};
};

struct Player {
  std::uint8_t index{0};
  std::string name;
  std::int32_t score{0};
  float duration{0.0F};  // Seconds connected.
  std::optional<TheShipPlayer> the_ship;
};

struct PlayerList {
  // Includes connecting players, who have no record in `players`.
  std::uint8_t declared_count{0};
  std::vector<Player> players;
};

struct Rule {
  std::string name;
  std::string value;
};

struct RuleList {
  std::uint16_t declared_count{0};
  std::vector<Rule> rules;
  // Unparsed tail of a truncated list (DecodeOptions::allow_truncated_rules).
  std::string remaining;
};

struct PingResponse {
  // "00000000000000" from Source, empty from GoldSource.
  std::string text;
};

struct ChallengeResponse {
  std::int32_t challenge{0};
};

using Response =
    std::variant<SourceInfo, GoldSourceInfo, PlayerList, RuleList, PingResponse, ChallengeResponse>;

}  // namespace a2s::payload
