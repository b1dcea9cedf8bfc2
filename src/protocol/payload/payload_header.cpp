#include "protocol/payload/payload_header.h"

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/packet/packet_header.h"
#include "protocol/wire/byte_reader.h"

namespace a2s::payload {

namespace {

std::span<const std::uint8_t> strip_single_marker(std::span<const std::uint8_t> payload) {
  if (payload.size() >= packet::kMarkerSize &&
      static_cast<std::int32_t>(wire::load_u32(payload, 0)) == packet::kSinglePacketMarker) {
    return payload.subspan(packet::kMarkerSize);
  }
  return payload;
}

std::optional<PayloadType> type_from_byte(std::uint8_t value) {
  switch (value) {
    case 0x54: return PayloadType::kInfoRequest;
    case 0x49: return PayloadType::kSourceInfo;
    case 0x6D: return PayloadType::kGoldSourceInfo;
    case 0x55: return PayloadType::kPlayerRequest;
    case 0x44: return PayloadType::kPlayers;
    case 0x56: return PayloadType::kRulesRequest;
    case 0x45: return PayloadType::kRules;
    case 0x69: return PayloadType::kPingRequest;
    case 0x6A: return PayloadType::kPing;
    case 0x57: return PayloadType::kChallengeRequest;
    case 0x41: return PayloadType::kChallenge;
    default: return std::nullopt;
  }
}

}  // namespace

std::optional<PayloadHeader> parse_payload_header(std::span<const std::uint8_t> payload,
                                                  std::error_code& ec) {
  const auto stripped = strip_single_marker(payload);
  if (stripped.empty()) {
    ec = make_error_code(Error::kTruncatedPayload);
    return std::nullopt;
  }

  const std::uint8_t type_byte = stripped[0];
  const auto type = type_from_byte(type_byte);
  if (!type) {
    LOG_WARN("Unknown payload type byte 0x{:02X} ({} bytes)", type_byte, stripped.size());
    ec = make_error_code(Error::kUnknownPayloadType);
    return std::nullopt;
  }

  PayloadHeader header{};
  header.type_byte = type_byte;
  header.type = *type;
  switch (*type) {
    case PayloadType::kSourceInfo:
      header.engine = EngineHint::kSource;
      break;
    case PayloadType::kGoldSourceInfo:
      header.engine = EngineHint::kGoldSource;
      break;
    default:
      header.engine = EngineHint::kAny;
      break;
  }
  header.body = stripped.subspan(1);
  return header;
}

std::optional<std::uint8_t> peek_type_byte(std::span<const std::uint8_t> payload) {
  const auto stripped = strip_single_marker(payload);
  if (stripped.empty()) {
    return std::nullopt;
  }
  return stripped[0];
}

bool is_request(PayloadType type) {
  switch (type) {
    case PayloadType::kInfoRequest:
    case PayloadType::kPlayerRequest:
    case PayloadType::kRulesRequest:
    case PayloadType::kPingRequest:
    case PayloadType::kChallengeRequest:
      return true;
    default:
      return false;
  }
}

const char* payload_type_name(PayloadType type) {
  switch (type) {
    case PayloadType::kInfoRequest: return "info_request";
    case PayloadType::kSourceInfo: return "source_info";
    case PayloadType::kGoldSourceInfo: return "goldsource_info";
    case PayloadType::kPlayerRequest: return "player_request";
    case PayloadType::kPlayers: return "players";
    case PayloadType::kRulesRequest: return "rules_request";
    case PayloadType::kRules: return "rules";
    case PayloadType::kPingRequest: return "ping_request";
    case PayloadType::kPing: return "ping";
    case PayloadType::kChallengeRequest: return "challenge_request";
    case PayloadType::kChallenge: return "challenge";
  }
  return "unknown";
}

}  // namespace a2s::payload
