#pragma once

#include <optional>
#include <span>
#include <system_error>

#include "protocol/payload/decode_options.h"
#include "protocol/payload/responses.h"

namespace a2s::payload {

// One decoder per (response kind, engine dialect). Each takes the bytes that
// follow the type byte and fails with Error::kTruncatedPayload or
// Error::kInvalidEncoding.

std::optional<SourceInfo> decode_source_info(std::span<const std::uint8_t> body,
                                             const DecodeOptions& options, std::error_code& ec);

std::optional<GoldSourceInfo> decode_goldsource_info(std::span<const std::uint8_t> body,
                                                     const DecodeOptions& options,
                                                     std::error_code& ec);

std::optional<PlayerList> decode_player_list(std::span<const std::uint8_t> body,
                                             const DecodeOptions& options, std::error_code& ec);

std::optional<RuleList> decode_rule_list(std::span<const std::uint8_t> body,
                                         const DecodeOptions& options, std::error_code& ec);

std::optional<PingResponse> decode_ping(std::span<const std::uint8_t> body,
                                        const DecodeOptions& options, std::error_code& ec);

std::optional<ChallengeResponse> decode_challenge(std::span<const std::uint8_t> body,
                                                  std::error_code& ec);

}  // namespace a2s::payload
