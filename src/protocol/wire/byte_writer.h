#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace a2s::wire {

// Little-endian append helpers. The protocol is x86 byte order throughout.
void write_u8(std::vector<std::uint8_t>& out, std::uint8_t value);
void write_u16(std::vector<std::uint8_t>& out, std::uint16_t value);
void write_i32(std::vector<std::uint8_t>& out, std::int32_t value);
void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value);
void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value);
void write_f32(std::vector<std::uint8_t>& out, float value);
// Appends the characters followed by a NUL terminator.
void write_cstring(std::vector<std::uint8_t>& out, std::string_view value);
void write_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes);

}  // namespace a2s::wire
