#include "protocol/payload/field_reader.h"

#include "protocol/errors.h"

namespace a2s::payload {

bool is_valid_utf8(std::span<const std::uint8_t> bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const std::uint8_t lead = bytes[i];
    std::size_t continuation = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      continuation = 1;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      continuation = 2;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      continuation = 3;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (bytes.size() - i <= continuation) {
      return false;
    }
    for (std::size_t k = 1; k <= continuation; ++k) {
      const std::uint8_t next = bytes[i + k];
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((continuation == 1 && code_point < 0x80) || (continuation == 2 && code_point < 0x800) ||
        (continuation == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

bool FieldReader::truncated() {
  ec_ = make_error_code(Error::kTruncatedPayload);
  return false;
}

bool FieldReader::u8(std::uint8_t& out) { return reader_.read_u8(out) || truncated(); }

bool FieldReader::flag(bool& out) {
  std::uint8_t raw = 0;
  if (!u8(raw)) {
    return false;
  }
  out = raw != 0;
  return true;
}

bool FieldReader::u16(std::uint16_t& out) { return reader_.read_u16(out) || truncated(); }

bool FieldReader::i32(std::int32_t& out) { return reader_.read_i32(out) || truncated(); }

bool FieldReader::u64(std::uint64_t& out) { return reader_.read_u64(out) || truncated(); }

bool FieldReader::f32(float& out) { return reader_.read_f32(out) || truncated(); }

bool FieldReader::string(std::string& out) {
  std::span<const std::uint8_t> raw;
  if (!reader_.read_cstring(raw)) {
    return truncated();
  }
  if (options_.text_policy == TextPolicy::kStrictUtf8 && !is_valid_utf8(raw)) {
    ec_ = make_error_code(Error::kInvalidEncoding);
    return false;
  }
  out.assign(raw.begin(), raw.end());
  return true;
}

bool FieldReader::nul() {
  std::uint8_t value = 0;
  if (!u8(value)) {
    return false;
  }
  if (value != 0) {
    ec_ = make_error_code(Error::kInvalidEncoding);
    return false;
  }
  return true;
}

}  // namespace a2s::payload
