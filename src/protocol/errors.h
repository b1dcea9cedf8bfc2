#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace a2s {

// Failure kinds reported by the packet engine. Every kind aborts only the
// response (or reassembly buffer) being processed.
enum class Error {
  kMalformedHeader = 1,
  kRepeatedChallenge,
  kConflictingFragment,
  kDecompressionFailed,
  kIntegrityCheckFailed,
  kUnknownPayloadType,
  kTruncatedPayload,
  kInvalidEncoding,
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(Error e) noexcept;

// Short stable identifier ("malformed_header", ...) for logs and JSON output.
const char* error_name(Error e) noexcept;

}  // namespace a2s

namespace std {
template <>
struct is_error_code_enum<a2s::Error> : true_type {};
}  // namespace std
