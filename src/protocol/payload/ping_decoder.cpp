#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/field_reader.h"
#include "protocol/wire/byte_reader.h"

namespace a2s::payload {

std::optional<PingResponse> decode_ping(std::span<const std::uint8_t> body,
                                        const DecodeOptions& options, std::error_code& ec) {
  PingResponse response{};
  if (body.empty()) {
    return response;
  }

  FieldReader in(body, options, ec);
  if (!in.string(response.text)) {
    return std::nullopt;
  }
  if (in.remaining() != 0) {
    LOG_DEBUG("Ping reply has {} trailing bytes", in.remaining());
  }
  return response;
}

std::optional<ChallengeResponse> decode_challenge(std::span<const std::uint8_t> body,
                                                  std::error_code& ec) {
  wire::ByteReader reader(body);
  ChallengeResponse response{};
  if (!reader.read_i32(response.challenge)) {
    ec = make_error_code(Error::kTruncatedPayload);
    return std::nullopt;
  }
  return response;
}

}  // namespace a2s::payload
