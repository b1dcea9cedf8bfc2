#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace a2s::reassembly {

// Decompresses a bzip2 stream and verifies it against the size and CRC32
// declared in the split header.
//   Error::kDecompressionFailed  - not a valid bzip2 stream.
//   Error::kIntegrityCheckFailed - output length or CRC32 differs from the
//                                  declaration, or the declaration exceeds
//                                  max_size.
std::optional<std::vector<std::uint8_t>> decompress_verified(std::span<const std::uint8_t> compressed,
                                                             std::uint32_t declared_size,
                                                             std::uint32_t declared_crc32,
                                                             std::size_t max_size,
                                                             std::error_code& ec);

// CRC32 (IEEE 802.3, as used by zlib) of the given bytes.
std::uint32_t crc32_of(std::span<const std::uint8_t> data);

// Compresses with bzip2 block size 9. Returns nullopt if libbz2 fails.
// Used to build compressed responses for replay and testing.
std::optional<std::vector<std::uint8_t>> compress_bzip2(std::span<const std::uint8_t> data);

}  // namespace a2s::reassembly
