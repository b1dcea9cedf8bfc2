#include "protocol/packet/packet_header.h"

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/wire/byte_reader.h"
#include "protocol/wire/byte_writer.h"

namespace a2s::packet {

namespace {

constexpr std::uint32_t kCompressedIdBit = 0x80000000U;

bool fail(std::error_code& ec, const char* reason, std::size_t size) {
  LOG_DEBUG("Rejecting datagram of {} bytes: {}", size, reason);
  ec = make_error_code(Error::kMalformedHeader);
  return false;
}

bool parse_source_split(wire::ByteReader& reader, bool has_size, SplitHeader& header,
                        std::error_code& ec, std::size_t datagram_size) {
  if (!reader.read_i32(header.request_id) || !reader.read_u8(header.total_fragments) ||
      !reader.read_u8(header.fragment_index)) {
    return fail(ec, "short Source split header", datagram_size);
  }
  if (has_size) {
    std::uint16_t size = 0;
    if (!reader.read_u16(size)) {
      return fail(ec, "Source split header missing size field", datagram_size);
    }
    header.split_size = size;
  }

  header.compressed = (static_cast<std::uint32_t>(header.request_id) & kCompressedIdBit) != 0;
  if (header.compressed && header.fragment_index == 0) {
    std::uint32_t decompressed = 0;
    std::uint32_t crc = 0;
    if (!reader.read_u32(decompressed) || !reader.read_u32(crc)) {
      return fail(ec, "compressed split header missing size/checksum", datagram_size);
    }
    header.decompressed_size = decompressed;
    header.crc32 = crc;
  }
  return true;
}

bool parse_goldsource_split(wire::ByteReader& reader, SplitHeader& header, std::error_code& ec,
                            std::size_t datagram_size) {
  std::uint8_t packed = 0;
  if (!reader.read_i32(header.request_id) || !reader.read_u8(packed)) {
    return fail(ec, "short GoldSource split header", datagram_size);
  }
  header.fragment_index = static_cast<std::uint8_t>(packed >> 4);
  header.total_fragments = static_cast<std::uint8_t>(packed & 0x0F);
  return true;
}

}  // namespace

std::optional<ClassifiedPacket> classify(std::span<const std::uint8_t> datagram,
                                         SplitFormat format, std::error_code& ec) {
  wire::ByteReader reader(datagram);
  std::int32_t marker = 0;
  if (!reader.read_i32(marker)) {
    fail(ec, "shorter than packet marker", datagram.size());
    return std::nullopt;
  }

  ClassifiedPacket packet{};
  if (marker == kSinglePacketMarker) {
    packet.kind = PacketKind::kSingle;
    packet.payload = reader.rest();
    return packet;
  }
  if (marker != kSplitPacketMarker) {
    fail(ec, "unknown packet marker", datagram.size());
    return std::nullopt;
  }

  packet.kind = PacketKind::kSplit;
  bool parsed = false;
  switch (format) {
    case SplitFormat::kSource:
      parsed = parse_source_split(reader, true, packet.split, ec, datagram.size());
      break;
    case SplitFormat::kSourceNoSize:
      parsed = parse_source_split(reader, false, packet.split, ec, datagram.size());
      break;
    case SplitFormat::kGoldSource:
      parsed = parse_goldsource_split(reader, packet.split, ec, datagram.size());
      break;
  }
  if (!parsed) {
    if (!ec) {
      fail(ec, "unsupported split format", datagram.size());
    }
    return std::nullopt;
  }

  if (packet.split.total_fragments == 0) {
    fail(ec, "split header declares zero fragments", datagram.size());
    return std::nullopt;
  }
  if (packet.split.fragment_index >= packet.split.total_fragments) {
    fail(ec, "fragment index outside declared total", datagram.size());
    return std::nullopt;
  }

  packet.payload = reader.rest();
  return packet;
}

SplitFormat split_format_for(std::uint16_t app_id, std::uint8_t protocol) {
  if (app_id == 215 || app_id == 17550 || app_id == 17700 || (app_id == 240 && protocol == 7)) {
    return SplitFormat::kSourceNoSize;
  }
  return SplitFormat::kSource;
}

const char* split_format_name(SplitFormat format) {
  switch (format) {
    case SplitFormat::kSource: return "source";
    case SplitFormat::kSourceNoSize: return "source-nosize";
    case SplitFormat::kGoldSource: return "goldsource";
  }
  return "unknown";
}

std::optional<SplitFormat> split_format_from_string(const std::string& name) {
  if (name == "source") return SplitFormat::kSource;
  if (name == "source-nosize") return SplitFormat::kSourceNoSize;
  if (name == "goldsource") return SplitFormat::kGoldSource;
  return std::nullopt;
}

std::vector<std::uint8_t> encode_single(std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> out;
  out.reserve(kMarkerSize + payload.size());
  wire::write_i32(out, kSinglePacketMarker);
  wire::write_bytes(out, payload);
  return out;
}

std::vector<std::uint8_t> encode_split(const SplitHeader& header, SplitFormat format,
                                       std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> out;
  out.reserve(kSourceSplitHeaderSize + kCompressionInfoSize + payload.size());
  wire::write_i32(out, kSplitPacketMarker);
  wire::write_i32(out, header.request_id);

  if (format == SplitFormat::kGoldSource) {
    wire::write_u8(out, static_cast<std::uint8_t>(((header.fragment_index & 0x0F) << 4) |
                                                  (header.total_fragments & 0x0F)));
  } else {
    wire::write_u8(out, header.total_fragments);
    wire::write_u8(out, header.fragment_index);
    if (format == SplitFormat::kSource) {
      wire::write_u16(out, header.split_size.value_or(1248));
    }
    const bool compressed = (static_cast<std::uint32_t>(header.request_id) & kCompressedIdBit) != 0;
    if (compressed && header.fragment_index == 0) {
      wire::write_u32(out, header.decompressed_size.value_or(0));
      wire::write_u32(out, header.crc32.value_or(0));
    }
  }

  wire::write_bytes(out, payload);
  return out;
}

}  // namespace a2s::packet
