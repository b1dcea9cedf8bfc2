#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace a2s::packet {

inline constexpr std::int32_t kSinglePacketMarker = -1;  // FF FF FF FF
inline constexpr std::int32_t kSplitPacketMarker = -2;   // FE FF FF FF

// Layout of the split header that follows the split marker. The caller picks
// it from the engine it is talking to; the bytes are not self-describing.
enum class SplitFormat : std::uint8_t {
  // id:i32 total:u8 index:u8 size:u16 [decompressed:u32 crc32:u32]
  kSource = 1,
  // Source without the size field (AppIDs 215, 17550, 17700, and 240 at protocol 7).
  kSourceNoSize = 2,
  // id:i32 packed:u8 (high nibble index, low nibble total).
  kGoldSource = 3,
};

enum class PacketKind : std::uint8_t { kSingle = 1, kSplit = 2 };

struct SplitHeader {
  std::int32_t request_id{0};
  std::uint8_t total_fragments{0};
  std::uint8_t fragment_index{0};
  // Source only: set when the most significant bit of request_id is set.
  bool compressed{false};
  // Source only: maximum fragment size announced by the server.
  std::optional<std::uint16_t> split_size;
  // Compressed Source responses carry these in fragment 0 only.
  std::optional<std::uint32_t> decompressed_size;
  std::optional<std::uint32_t> crc32;
};

struct ClassifiedPacket {
  PacketKind kind{PacketKind::kSingle};
  SplitHeader split;  // Meaningful only for kSplit.
  // View into the classified datagram with all headers removed.
  // IMPORTANT: The datagram must outlive this view.
  std::span<const std::uint8_t> payload;
};

inline constexpr std::size_t kMarkerSize = 4;
inline constexpr std::size_t kSourceSplitHeaderSize = kMarkerSize + 4 + 1 + 1 + 2;  // 12 bytes
inline constexpr std::size_t kSourceNoSizeSplitHeaderSize = kMarkerSize + 4 + 1 + 1;  // 10 bytes
inline constexpr std::size_t kGoldSourceSplitHeaderSize = kMarkerSize + 4 + 1;  // 9 bytes
inline constexpr std::size_t kCompressionInfoSize = 4 + 4;
inline constexpr std::uint8_t kGoldSourceMaxFragments = 15;

// Inspects the marker of a received datagram and strips every header.
// Fails with Error::kMalformedHeader when the marker is unknown or the
// header is short or inconsistent (total == 0, index >= total).
std::optional<ClassifiedPacket> classify(std::span<const std::uint8_t> datagram,
                                         SplitFormat format, std::error_code& ec);

// Picks the Source split layout for a server from its info response.
SplitFormat split_format_for(std::uint16_t app_id, std::uint8_t protocol);

const char* split_format_name(SplitFormat format);
std::optional<SplitFormat> split_format_from_string(const std::string& name);

// Builders for datagrams in the server's direction. Used to frame requests
// and by tests and tools that replay captured traffic.
std::vector<std::uint8_t> encode_single(std::span<const std::uint8_t> payload);
std::vector<std::uint8_t> encode_split(const SplitHeader& header, SplitFormat format,
                                       std::span<const std::uint8_t> payload);

}  // namespace a2s::packet
