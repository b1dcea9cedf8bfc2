#include "protocol/wire/byte_writer.h"

#include <cstring>

namespace a2s::wire {

void write_u8(std::vector<std::uint8_t>& out, std::uint8_t value) { out.push_back(value); }

void write_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void write_i32(std::vector<std::uint8_t>& out, std::int32_t value) {
  write_u32(out, static_cast<std::uint32_t>(value));
}

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void write_f32(std::vector<std::uint8_t>& out, float value) {
  std::uint32_t raw = 0;
  std::memcpy(&raw, &value, sizeof(raw));
  write_u32(out, raw);
}

void write_cstring(std::vector<std::uint8_t>& out, std::string_view value) {
  out.insert(out.end(), value.begin(), value.end());
  out.push_back(0x00);
}

void write_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace a2s::wire
