#include "protocol/wire/byte_reader.h"

#include <algorithm>
#include <cstring>

namespace a2s::wire {

std::uint16_t load_u16(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

std::uint32_t load_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint32_t>(data[offset]) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

bool ByteReader::read_u8(std::uint8_t& out) {
  if (remaining() < 1) {
    return false;
  }
  out = data_[offset_];
  offset_ += 1;
  return true;
}

bool ByteReader::read_u16(std::uint16_t& out) {
  if (remaining() < 2) {
    return false;
  }
  out = load_u16(data_, offset_);
  offset_ += 2;
  return true;
}

bool ByteReader::read_u32(std::uint32_t& out) {
  if (remaining() < 4) {
    return false;
  }
  out = load_u32(data_, offset_);
  offset_ += 4;
  return true;
}

bool ByteReader::read_i32(std::int32_t& out) {
  std::uint32_t raw = 0;
  if (!read_u32(raw)) {
    return false;
  }
  out = static_cast<std::int32_t>(raw);
  return true;
}

bool ByteReader::read_u64(std::uint64_t& out) {
  if (remaining() < 8) {
    return false;
  }
  std::uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8) | data_[offset_ + static_cast<std::size_t>(i)];
  }
  out = value;
  offset_ += 8;
  return true;
}

bool ByteReader::read_f32(float& out) {
  std::uint32_t raw = 0;
  if (!read_u32(raw)) {
    return false;
  }
  static_assert(sizeof(float) == sizeof(std::uint32_t));
  std::memcpy(&out, &raw, sizeof(out));
  return true;
}

bool ByteReader::read_cstring(std::span<const std::uint8_t>& out) {
  const auto tail = rest();
  const auto nul = std::find(tail.begin(), tail.end(), std::uint8_t{0});
  if (nul == tail.end()) {
    return false;
  }
  const auto length = static_cast<std::size_t>(nul - tail.begin());
  out = tail.first(length);
  offset_ += length + 1;
  return true;
}

bool ByteReader::skip(std::size_t count) {
  if (remaining() < count) {
    return false;
  }
  offset_ += count;
  return true;
}

}  // namespace a2s::wire
