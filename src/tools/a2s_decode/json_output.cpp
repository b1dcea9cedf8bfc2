#include "tools/a2s_decode/json_output.h"


#include <nlohmann/json.hpp>

#include "protocol/errors.h"
#include "protocol/payload/payload_header.h"
#include "protocol/payload/payload_parser.h"

using json = nlohmann::json;

namespace a2s::payload {

namespace {

template <typename T>
json optional_field(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

// ============================================================================
// Info responses
// ============================================================================

void to_json(json& j, const TheShipInfo& info) {
  j = json{
    {"mode", the_ship_mode_name(info.mode)},
    {"mode_raw", info.mode_raw},
    {"witnesses", info.witnesses},
    {"duration", info.duration}
  };
}

void to_json(json& j, const SourceInfo& info) {
  j = json{
    {"protocol", info.protocol},
    {"name", info.name},
    {"map", info.map},
    {"folder", info.folder},
    {"game", info.game},
    {"app_id", info.app_id},
    {"players", info.players},
    {"max_players", info.max_players},
    {"bots", info.bots},
    {"server_type", server_type_name(info.server_type)},
    {"environment", environment_name(info.environment)},
    {"password_protected", info.password_protected},
    {"vac_secured", info.vac_secured},
    {"version", info.version},
    {"extra_data_flags", info.extra_data_flags},
    {"port", optional_field(info.port)},
    {"steam_id", optional_field(info.steam_id)},
    {"spectator_port", optional_field(info.spectator_port)},
    {"spectator_name", optional_field(info.spectator_name)},
    {"keywords", optional_field(info.keywords)},
    {"game_id", optional_field(info.game_id)}
  };
  if (info.the_ship) {
    j["the_ship"] = *info.the_ship;
  }
}

void to_json(json& j, const HalfLifeMod& mod) {
  j = json{
    {"link", mod.link},
    {"download_link", mod.download_link},
    {"version", mod.version},
    {"size", mod.size},
    {"type", mod_type_name(mod.type)},
    {"dll", mod_dll_name(mod.dll)}
  };
}

void to_json(json& j, const GoldSourceInfo& info) {
  j = json{
    {"address", info.address},
    {"name", info.name},
    {"map", info.map},
    {"folder", info.folder},
    {"game", info.game},
    {"players", info.players},
    {"max_players", info.max_players},
    {"protocol", info.protocol},
    {"server_type", server_type_name(info.server_type)},
    {"environment", environment_name(info.environment)},
    {"password_protected", info.password_protected},
    {"is_mod", info.is_mod},
    {"mod", info.mod ? json(*info.mod) : json(nullptr)},
    {"vac_secured", info.vac_secured},
    {"bots", info.bots}
  };
}

// ============================================================================
// Players, rules, ping, challenge
// ============================================================================

void to_json(json& j, const Player& player) {
  j = json{
    {"index", player.index},
    {"name", player.name},
    {"score", player.score},
    {"duration", player.duration}
  };
  if (player.the_ship) {
    j["deaths"] = player.the_ship->deaths;
    j["money"] = player.the_ship->money;
  }
}

void to_json(json& j, const PlayerList& list) {
  j = json{{"declared_count", list.declared_count}, {"players", list.players}};
}

void to_json(json& j, const Rule& rule) {
  j = json{{"name", rule.name}, {"value", rule.value}};
}

void to_json(json& j, const RuleList& list) {
  j = json{{"declared_count", list.declared_count}, {"rules", list.rules}};
  if (!list.remaining.empty()) {
    j["remaining"] = list.remaining;
  }
}

void to_json(json& j, const PingResponse& ping) {
  j = json{{"text", ping.text}};
}

void to_json(json& j, const ChallengeResponse& challenge) {
  j = json{{"challenge", challenge.challenge}};
}

json response_to_json(const Response& response) {
  json body;
  std::visit([&body](const auto& typed) { body = typed; }, response);
  return json{{"type", payload_type_name(response_type(response))}, {"response", body}};
}

}  // namespace a2s::payload

namespace a2s::request {

void to_json(json& j, const Request& request) {
  j = json{
    {"request", request_type_name(request.type)},
    {"challenge", request.challenge ? json(*request.challenge) : json(nullptr)}
  };
  if (request.type == RequestType::kInfo) {
    j["payload"] = request.payload;
  }
  if (!request.trailing.empty()) {
    j["trailing_bytes"] = request.trailing.size();
  }
}

}  // namespace a2s::request

namespace a2s::reassembly {

void to_json(json& j, const ReassemblyStats& stats) {
  j = json{
    {"fragments_accepted", stats.fragments_accepted},
    {"duplicate_fragments", stats.duplicate_fragments},
    {"payloads_completed", stats.payloads_completed},
    {"payloads_failed", stats.payloads_failed}
  };
}

}  // namespace a2s::reassembly

namespace a2s::tools {

json error_to_json(const std::string& input, const std::error_code& ec) {
  json j{{"input", input}, {"message", ec.message()}};
  if (ec.category() == error_category()) {
    j["error"] = error_name(static_cast<Error>(ec.value()));
  } else {
    j["error"] = ec.category().name();
  }
  return j;
}

std::string dump_line(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace a2s::tools
