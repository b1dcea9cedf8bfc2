#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <system_error>

#include "protocol/payload/decode_options.h"
#include "protocol/wire/byte_reader.h"

namespace a2s::payload {

// Wraps a ByteReader for the typed decoders: every failed read records the
// matching a2s::Error in the bound error_code, so a decoder can chain reads
// and bail out on the first false.
class FieldReader {
 public:
  FieldReader(std::span<const std::uint8_t> body, const DecodeOptions& options, std::error_code& ec)
      : reader_(body), options_(options), ec_(ec) {}

  bool u8(std::uint8_t& out);
  bool flag(bool& out);
  bool u16(std::uint16_t& out);
  bool i32(std::int32_t& out);
  bool u64(std::uint64_t& out);
  bool f32(float& out);
  bool string(std::string& out);
  // Consumes one byte that must be NUL.
  bool nul();

  [[nodiscard]] std::size_t remaining() const { return reader_.remaining(); }
  [[nodiscard]] std::size_t offset() const { return reader_.offset(); }
  [[nodiscard]] std::span<const std::uint8_t> rest() const { return reader_.rest(); }

 private:
  bool truncated();

  wire::ByteReader reader_;
  const DecodeOptions& options_;
  std::error_code& ec_;
};

[[nodiscard]] bool is_valid_utf8(std::span<const std::uint8_t> bytes);

}  // namespace a2s::payload
