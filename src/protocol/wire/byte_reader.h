#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace a2s::wire {

// Bounds-checked little-endian cursor over a borrowed buffer. Every read
// returns false and leaves the cursor untouched when the buffer is too short.
// IMPORTANT: The underlying buffer must outlive the reader.
class ByteReader {
 public:
  explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

  bool read_u8(std::uint8_t& out);
  bool read_u16(std::uint16_t& out);
  bool read_i32(std::int32_t& out);
  bool read_u32(std::uint32_t& out);
  bool read_u64(std::uint64_t& out);
  bool read_f32(float& out);

  // Reads bytes up to a NUL terminator and consumes the terminator. The
  // returned view excludes the NUL. Fails when no terminator remains.
  bool read_cstring(std::span<const std::uint8_t>& out);

  bool skip(std::size_t count);

  [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }
  [[nodiscard]] bool empty() const { return remaining() == 0; }
  [[nodiscard]] std::size_t offset() const { return offset_; }
  [[nodiscard]] std::span<const std::uint8_t> rest() const { return data_.subspan(offset_); }

 private:
  std::span<const std::uint8_t> data_;
  std::size_t offset_{0};
};

// Reads a little-endian value at a fixed offset. Caller checks bounds.
std::uint16_t load_u16(std::span<const std::uint8_t> data, std::size_t offset);
std::uint32_t load_u32(std::span<const std::uint8_t> data, std::size_t offset);

}  // namespace a2s::wire
