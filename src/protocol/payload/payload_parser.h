#pragma once

#include <optional>
#include <span>
#include <system_error>

#include "protocol/payload/decode_options.h"
#include "protocol/payload/payload_header.h"
#include "protocol/payload/responses.h"

namespace a2s::payload {

// Decodes a complete response payload (single-packet payload or assembled
// split payload) into its typed record. The type byte selects the decoder;
// request type bytes are not responses and fail like unknown bytes.
std::optional<Response> parse_payload(std::span<const std::uint8_t> payload,
                                      const DecodeOptions& options, std::error_code& ec);

inline std::optional<Response> parse_payload(std::span<const std::uint8_t> payload,
                                             std::error_code& ec) {
  return parse_payload(payload, DecodeOptions{}, ec);
}

PayloadType response_type(const Response& response);

}  // namespace a2s::payload
