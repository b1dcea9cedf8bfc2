#include "protocol/reassembly/decompressor.h"

#include <algorithm>
#include <limits>

#include <bzlib.h>
#include <zlib.h>

#include "common/logging/logger.h"
#include "protocol/errors.h"

namespace a2s::reassembly {

std::uint32_t crc32_of(std::span<const std::uint8_t> data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // zlib takes uInt lengths; feed large buffers in chunks.
  std::size_t offset = 0;
  while (offset < data.size()) {
    const std::size_t chunk =
        std::min<std::size_t>(data.size() - offset, std::numeric_limits<uInt>::max());
    crc = crc32(crc, data.data() + offset, static_cast<uInt>(chunk));
    offset += chunk;
  }
  return static_cast<std::uint32_t>(crc);
}

std::optional<std::vector<std::uint8_t>> decompress_verified(std::span<const std::uint8_t> compressed,
                                                             std::uint32_t declared_size,
                                                             std::uint32_t declared_crc32,
                                                             std::size_t max_size,
                                                             std::error_code& ec) {
  if (declared_size > max_size) {
    LOG_WARN("Declared decompressed size {} exceeds limit {}", declared_size, max_size);
    ec = make_error_code(Error::kIntegrityCheckFailed);
    return std::nullopt;
  }
  if (compressed.size() > std::numeric_limits<unsigned int>::max()) {
    ec = make_error_code(Error::kDecompressionFailed);
    return std::nullopt;
  }

  // One spare byte so output longer than declared is detected as such.
  std::vector<std::uint8_t> output(static_cast<std::size_t>(declared_size) + 1);
  auto output_len = static_cast<unsigned int>(output.size());
  // libbz2 takes non-const pointers but does not modify the source.
  const int rc = BZ2_bzBuffToBuffDecompress(
      reinterpret_cast<char*>(output.data()), &output_len,
      const_cast<char*>(reinterpret_cast<const char*>(compressed.data())),
      static_cast<unsigned int>(compressed.size()), 0, 0);

  if (rc == BZ_OUTBUFF_FULL) {
    LOG_WARN("Decompressed payload exceeds declared size {}", declared_size);
    ec = make_error_code(Error::kIntegrityCheckFailed);
    return std::nullopt;
  }
  if (rc != BZ_OK) {
    LOG_WARN("bzip2 decompression of {} bytes failed with code {}", compressed.size(), rc);
    ec = make_error_code(Error::kDecompressionFailed);
    return std::nullopt;
  }

  output.resize(output_len);
  if (output_len != declared_size) {
    LOG_WARN("Decompressed {} bytes, header declared {}", output_len, declared_size);
    ec = make_error_code(Error::kIntegrityCheckFailed);
    return std::nullopt;
  }
  const std::uint32_t actual_crc = crc32_of(output);
  if (actual_crc != declared_crc32) {
    LOG_WARN("CRC32 mismatch: computed {:08X}, header declared {:08X}", actual_crc, declared_crc32);
    ec = make_error_code(Error::kIntegrityCheckFailed);
    return std::nullopt;
  }
  return output;
}

std::optional<std::vector<std::uint8_t>> compress_bzip2(std::span<const std::uint8_t> data) {
  if (data.size() > std::numeric_limits<unsigned int>::max() / 2) {
    return std::nullopt;
  }
  // Worst case documented by libbz2: 1% larger plus 600 bytes.
  auto output_len = static_cast<unsigned int>(data.size() + data.size() / 100 + 601);
  std::vector<std::uint8_t> output(output_len);
  const int rc = BZ2_bzBuffToBuffCompress(
      reinterpret_cast<char*>(output.data()), &output_len,
      const_cast<char*>(reinterpret_cast<const char*>(data.data())),
      static_cast<unsigned int>(data.size()), 9, 0, 0);
  if (rc != BZ_OK) {
    LOG_ERROR("bzip2 compression failed with code {}", rc);
    return std::nullopt;
  }
  output.resize(output_len);
  return output;
}

}  // namespace a2s::reassembly
