#include "protocol/payload/payload_parser.h"

#include <type_traits>
#include <utility>

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/payload/decoders.h"

namespace a2s::payload {

namespace {

template <typename T>
std::optional<Response> wrap(std::optional<T> decoded) {
  if (!decoded) {
    return std::nullopt;
  }
  return Response{std::move(*decoded)};
}

}  // namespace

std::optional<Response> parse_payload(std::span<const std::uint8_t> payload,
                                      const DecodeOptions& options, std::error_code& ec) {
  const auto header = parse_payload_header(payload, ec);
  if (!header) {
    return std::nullopt;
  }

  std::optional<Response> result;
  switch (header->type) {
    case PayloadType::kSourceInfo:
      result = wrap(decode_source_info(header->body, options, ec));
      break;
    case PayloadType::kGoldSourceInfo:
      result = wrap(decode_goldsource_info(header->body, options, ec));
      break;
    case PayloadType::kPlayers:
      result = wrap(decode_player_list(header->body, options, ec));
      break;
    case PayloadType::kRules:
      result = wrap(decode_rule_list(header->body, options, ec));
      break;
    case PayloadType::kPing:
      result = wrap(decode_ping(header->body, options, ec));
      break;
    case PayloadType::kChallenge:
      result = wrap(decode_challenge(header->body, ec));
      break;
    case PayloadType::kInfoRequest:
    case PayloadType::kPlayerRequest:
    case PayloadType::kRulesRequest:
    case PayloadType::kPingRequest:
    case PayloadType::kChallengeRequest:
      LOG_WARN("Payload is a {}, not a response", payload_type_name(header->type));
      ec = make_error_code(Error::kUnknownPayloadType);
      return std::nullopt;
  }

  if (!result) {
    LOG_DEBUG("Failed to decode {} payload ({} bytes): {}", payload_type_name(header->type),
              header->body.size(), ec.message());
  }
  return result;
}

PayloadType response_type(const Response& response) {
  return std::visit(
      [](const auto& value) -> PayloadType {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, SourceInfo>) {
          return PayloadType::kSourceInfo;
        } else if constexpr (std::is_same_v<T, GoldSourceInfo>) {
          return PayloadType::kGoldSourceInfo;
        } else if constexpr (std::is_same_v<T, PlayerList>) {
          return PayloadType::kPlayers;
        } else if constexpr (std::is_same_v<T, RuleList>) {
          return PayloadType::kRules;
        } else if constexpr (std::is_same_v<T, PingResponse>) {
          return PayloadType::kPing;
        } else {
          return PayloadType::kChallenge;
        }
      },
      response);
}

}  // namespace a2s::payload
