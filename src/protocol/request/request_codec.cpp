#include "protocol/request/request_codec.h"

#include "common/logging/logger.h"
#include "protocol/challenge/challenge_tracker.h"
#include "protocol/errors.h"
#include "protocol/packet/packet_header.h"
#include "protocol/payload/payload_header.h"
#include "protocol/wire/byte_reader.h"
#include "protocol/wire/byte_writer.h"

namespace a2s::request {

namespace {

std::uint8_t type_byte(RequestType type) {
  switch (type) {
    case RequestType::kInfo:
      return static_cast<std::uint8_t>(payload::PayloadType::kInfoRequest);
    case RequestType::kPlayers:
      return static_cast<std::uint8_t>(payload::PayloadType::kPlayerRequest);
    case RequestType::kRules:
      return static_cast<std::uint8_t>(payload::PayloadType::kRulesRequest);
    case RequestType::kPing:
      return static_cast<std::uint8_t>(payload::PayloadType::kPingRequest);
    case RequestType::kChallenge:
      return static_cast<std::uint8_t>(payload::PayloadType::kChallengeRequest);
  }
  return 0;
}

std::optional<RequestType> from_payload_type(payload::PayloadType type) {
  switch (type) {
    case payload::PayloadType::kInfoRequest:
      return RequestType::kInfo;
    case payload::PayloadType::kPlayerRequest:
      return RequestType::kPlayers;
    case payload::PayloadType::kRulesRequest:
      return RequestType::kRules;
    case payload::PayloadType::kPingRequest:
      return RequestType::kPing;
    case payload::PayloadType::kChallengeRequest:
      return RequestType::kChallenge;
    default:
      return std::nullopt;
  }
}

}  // namespace

std::vector<std::uint8_t> encode_request(const Request& request) {
  std::vector<std::uint8_t> out;
  wire::write_i32(out, packet::kSinglePacketMarker);
  wire::write_u8(out, type_byte(request.type));
  switch (request.type) {
    case RequestType::kInfo:
      wire::write_cstring(out, request.payload);
      if (request.challenge) {
        wire::write_i32(out, *request.challenge);
      }
      break;
    case RequestType::kPlayers:
    case RequestType::kRules:
      wire::write_i32(out, request.challenge.value_or(challenge::kPlaceholderChallenge));
      break;
    case RequestType::kPing:
    case RequestType::kChallenge:
      break;
  }
  wire::write_bytes(out, request.trailing);
  return out;
}

std::vector<std::uint8_t> encode_info_request(std::optional<std::int32_t> challenge) {
  Request request;
  request.type = RequestType::kInfo;
  request.payload = kInfoRequestPayload;
  request.challenge = challenge;
  return encode_request(request);
}

std::vector<std::uint8_t> encode_player_request(std::int32_t challenge) {
  return encode_request(Request{RequestType::kPlayers, challenge, {}, {}});
}

std::vector<std::uint8_t> encode_rules_request(std::int32_t challenge) {
  return encode_request(Request{RequestType::kRules, challenge, {}, {}});
}

std::vector<std::uint8_t> encode_ping_request() {
  return encode_request(Request{RequestType::kPing, std::nullopt, {}, {}});
}

std::vector<std::uint8_t> encode_challenge_request() {
  return encode_request(Request{RequestType::kChallenge, std::nullopt, {}, {}});
}

std::vector<std::uint8_t> initial_request(RequestType type) {
  switch (type) {
    case RequestType::kInfo:
      return encode_info_request();
    case RequestType::kPlayers:
      return encode_player_request(challenge::kPlaceholderChallenge);
    case RequestType::kRules:
      return encode_rules_request(challenge::kPlaceholderChallenge);
    case RequestType::kPing:
      return encode_ping_request();
    case RequestType::kChallenge:
      return encode_challenge_request();
  }
  return {};
}

std::optional<Request> parse_request(std::span<const std::uint8_t> payload, std::error_code& ec) {
  const auto header = payload::parse_payload_header(payload, ec);
  if (!header) {
    return std::nullopt;
  }
  const auto type = from_payload_type(header->type);
  if (!type) {
    LOG_DEBUG("Payload type 0x{:02X} is not a request", header->type_byte);
    ec = make_error_code(Error::kUnknownPayloadType);
    return std::nullopt;
  }

  Request request;
  request.type = *type;
  wire::ByteReader reader(header->body);
  switch (request.type) {
    case RequestType::kInfo: {
      std::span<const std::uint8_t> text;
      if (!reader.read_cstring(text)) {
        ec = make_error_code(Error::kTruncatedPayload);
        return std::nullopt;
      }
      request.payload.assign(text.begin(), text.end());
      std::int32_t value = 0;
      if (reader.read_i32(value)) {
        request.challenge = value;
      }
      break;
    }
    case RequestType::kPlayers:
    case RequestType::kRules: {
      std::int32_t value = 0;
      if (!reader.read_i32(value)) {
        ec = make_error_code(Error::kTruncatedPayload);
        return std::nullopt;
      }
      request.challenge = value;
      break;
    }
    case RequestType::kPing:
    case RequestType::kChallenge:
      break;
  }
  const auto rest = reader.rest();
  request.trailing.assign(rest.begin(), rest.end());
  return request;
}

std::optional<std::vector<std::uint8_t>> with_challenge(std::span<const std::uint8_t> request,
                                                        std::int32_t challenge,
                                                        std::error_code& ec) {
  auto parsed = parse_request(request, ec);
  if (!parsed) {
    return std::nullopt;
  }
  if (!takes_challenge(parsed->type)) {
    LOG_DEBUG("{} request has no challenge slot; resending unchanged",
              request_type_name(parsed->type));
    return encode_request(*parsed);
  }
  parsed->challenge = challenge;
  return encode_request(*parsed);
}

bool takes_challenge(RequestType type) {
  return type == RequestType::kInfo || type == RequestType::kPlayers ||
         type == RequestType::kRules;
}

const char* request_type_name(RequestType type) {
  switch (type) {
    case RequestType::kInfo:
      return "info";
    case RequestType::kPlayers:
      return "players";
    case RequestType::kRules:
      return "rules";
    case RequestType::kPing:
      return "ping";
    case RequestType::kChallenge:
      return "challenge";
  }
  return "unknown";
}

std::optional<RequestType> request_type_from_string(const std::string& name) {
  if (name == "info") return RequestType::kInfo;
  if (name == "players") return RequestType::kPlayers;
  if (name == "rules") return RequestType::kRules;
  if (name == "ping") return RequestType::kPing;
  if (name == "challenge") return RequestType::kChallenge;
  return std::nullopt;
}

}  // namespace a2s::request
