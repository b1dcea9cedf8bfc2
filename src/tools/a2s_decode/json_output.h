#pragma once

#include <string>
#include <system_error>

#include <nlohmann/json_fwd.hpp>

#include "protocol/payload/responses.h"
#include "protocol/reassembly/split_reassembly.h"
#include "protocol/request/request_codec.h"

namespace a2s::payload {

void to_json(nlohmann::json& j, const TheShipInfo& info);
void to_json(nlohmann::json& j, const SourceInfo& info);
void to_json(nlohmann::json& j, const HalfLifeMod& mod);
void to_json(nlohmann::json& j, const GoldSourceInfo& info);
void to_json(nlohmann::json& j, const Player& player);
void to_json(nlohmann::json& j, const PlayerList& list);
void to_json(nlohmann::json& j, const Rule& rule);
void to_json(nlohmann::json& j, const RuleList& list);
void to_json(nlohmann::json& j, const PingResponse& ping);
void to_json(nlohmann::json& j, const ChallengeResponse& challenge);

// {"type": "<payload type>", "response": {...}}
nlohmann::json response_to_json(const Response& response);

}  // namespace a2s::payload

namespace a2s::request {

void to_json(nlohmann::json& j, const Request& request);

}  // namespace a2s::request

namespace a2s::reassembly {

void to_json(nlohmann::json& j, const ReassemblyStats& stats);

}  // namespace a2s::reassembly

namespace a2s::tools {

nlohmann::json error_to_json(const std::string& input, const std::error_code& ec);

// Single-line serialisation. Invalid UTF-8 (possible with --raw-text) is
// replaced rather than rejected.
std::string dump_line(const nlohmann::json& j);

}  // namespace a2s::tools
