#include "protocol/errors.h"

namespace a2s {

namespace {

class A2sErrorCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "a2s"; }

  std::string message(int value) const override {
    switch (static_cast<Error>(value)) {
      case Error::kMalformedHeader:
        return "malformed packet header";
      case Error::kRepeatedChallenge:
        return "server issued a second challenge for the same query";
      case Error::kConflictingFragment:
        return "fragment conflicts with previously received data";
      case Error::kDecompressionFailed:
        return "bzip2 decompression failed";
      case Error::kIntegrityCheckFailed:
        return "decompressed payload failed length or CRC32 check";
      case Error::kUnknownPayloadType:
        return "unknown payload type byte";
      case Error::kTruncatedPayload:
        return "payload ended before all mandatory fields were read";
      case Error::kInvalidEncoding:
        return "string field is not valid UTF-8";
    }
    return "unknown a2s error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static const A2sErrorCategory category;
  return category;
}

std::error_code make_error_code(Error e) noexcept {
  return {static_cast<int>(e), error_category()};
}

const char* error_name(Error e) noexcept {
  switch (e) {
    case Error::kMalformedHeader: return "malformed_header";
    case Error::kRepeatedChallenge: return "repeated_challenge";
    case Error::kConflictingFragment: return "conflicting_fragment";
    case Error::kDecompressionFailed: return "decompression_failed";
    case Error::kIntegrityCheckFailed: return "integrity_check_failed";
    case Error::kUnknownPayloadType: return "unknown_payload_type";
    case Error::kTruncatedPayload: return "truncated_payload";
    case Error::kInvalidEncoding: return "invalid_encoding";
  }
  return "unknown";
}

}  // namespace a2s
