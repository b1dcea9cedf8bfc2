#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>

namespace a2s::payload {

// Leading type byte of a complete payload.
enum class PayloadType : std::uint8_t {
  kInfoRequest = 0x54,       // 'T'
  kSourceInfo = 0x49,        // 'I'
  kGoldSourceInfo = 0x6D,    // 'm'
  kPlayerRequest = 0x55,     // 'U'
  kPlayers = 0x44,           // 'D'
  kRulesRequest = 0x56,      // 'V'
  kRules = 0x45,             // 'E'
  kPingRequest = 0x69,       // 'i'
  kPing = 0x6A,              // 'j'
  kChallengeRequest = 0x57,  // 'W'
  kChallenge = 0x41,         // 'A'
};

// Which field layout family a payload belongs to. Only the info responses
// differ per engine; everything else is shared.
enum class EngineHint : std::uint8_t { kAny, kSource, kGoldSource };

struct PayloadHeader {
  std::uint8_t type_byte{0};
  PayloadType type{PayloadType::kPing};
  EngineHint engine{EngineHint::kAny};
  // Bytes following the type byte.
  // IMPORTANT: The payload buffer must outlive this view.
  std::span<const std::uint8_t> body;
};

// Reads the type byte of a single-packet payload or an assembled split
// payload. A leading single-packet marker (assembled split payloads carry
// one) is skipped. Unknown bytes fail with Error::kUnknownPayloadType, an
// empty payload with Error::kTruncatedPayload.
std::optional<PayloadHeader> parse_payload_header(std::span<const std::uint8_t> payload,
                                                  std::error_code& ec);

// Returns the raw type byte without validating it, e.g. to report the value
// behind an Error::kUnknownPayloadType.
std::optional<std::uint8_t> peek_type_byte(std::span<const std::uint8_t> payload);

[[nodiscard]] bool is_request(PayloadType type);
const char* payload_type_name(PayloadType type);

}  // namespace a2s::payload
