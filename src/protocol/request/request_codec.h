#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace a2s::request {

inline constexpr const char* kInfoRequestPayload = "Source Engine Query";

enum class RequestType : std::uint8_t {
  kInfo = 1,       // 'T'
  kPlayers = 2,    // 'U'
  kRules = 3,      // 'V'
  kPing = 4,       // 'i'
  kChallenge = 5,  // 'W'
};

struct Request {
  RequestType type{RequestType::kInfo};
  // Always present for player and rules requests; optional for info.
  std::optional<std::int32_t> challenge;
  // Info requests only: the query string ("Source Engine Query").
  std::string payload;
  std::vector<std::uint8_t> trailing;
};

// Each encoder returns a complete datagram, single-packet marker included.
std::vector<std::uint8_t> encode_info_request(std::optional<std::int32_t> challenge = std::nullopt);
std::vector<std::uint8_t> encode_player_request(std::int32_t challenge);
std::vector<std::uint8_t> encode_rules_request(std::int32_t challenge);
std::vector<std::uint8_t> encode_ping_request();
std::vector<std::uint8_t> encode_challenge_request();

std::vector<std::uint8_t> encode_request(const Request& request);

// First request of a query, carrying the -1 placeholder where a challenge goes.
std::vector<std::uint8_t> initial_request(RequestType type);

// Parses a request datagram or payload. Response type bytes fail with
// Error::kUnknownPayloadType; a missing challenge or query string
// terminator with Error::kTruncatedPayload.
std::optional<Request> parse_request(std::span<const std::uint8_t> payload, std::error_code& ec);

// Re-encodes a request with the challenge replaced (player/rules) or
// appended in place of any previous one (info).
std::optional<std::vector<std::uint8_t>> with_challenge(std::span<const std::uint8_t> request,
                                                        std::int32_t challenge,
                                                        std::error_code& ec);

// Ping and challenge requests have no challenge slot.
[[nodiscard]] bool takes_challenge(RequestType type);

const char* request_type_name(RequestType type);
std::optional<RequestType> request_type_from_string(const std::string& name);

}  // namespace a2s::request
