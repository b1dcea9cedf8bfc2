#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "protocol/packet/packet_header.h"

namespace a2s::reassembly {

struct ReassemblyConfig {
  // Split headers declaring more fragments than this are rejected.
  std::size_t max_fragments{255};
  // Upper bound for the declared size of a compressed response.
  std::size_t max_decompressed_size{1 << 20};
};

enum class ReassemblyStatus : std::uint8_t { kIncomplete = 1, kComplete = 2, kFailed = 3 };

struct ReassemblyResult {
  ReassemblyStatus status{ReassemblyStatus::kIncomplete};
  // Assembled (and decompressed) payload; set only for kComplete.
  std::vector<std::uint8_t> payload;
  // Set only for kFailed.
  std::error_code error;
};

struct ReassemblyStats {
  std::uint64_t fragments_accepted{0};
  std::uint64_t duplicate_fragments{0};
  std::uint64_t payloads_completed{0};
  std::uint64_t payloads_failed{0};
};

// Collects split fragments per request id until every index is present.
// Completion and failure both remove the buffer for that id; abandoning an
// incomplete response is up to the caller (discard/clear).
class SplitReassembler {
 public:
  explicit SplitReassembler(ReassemblyConfig config = {});

  ReassemblyResult accept(const packet::SplitHeader& header, std::span<const std::uint8_t> fragment);

  // Drops a partially received response. Returns false if none was buffered.
  bool discard(std::int32_t request_id);
  void clear() { buffers_.clear(); }

  [[nodiscard]] std::size_t pending_count() const { return buffers_.size(); }

  [[nodiscard]] bool has_pending(std::int32_t request_id) const {
    return buffers_.find(request_id) != buffers_.end();
  }

  // Number of distinct fragments held for a request id.
  [[nodiscard]] std::size_t received_count(std::int32_t request_id) const;

  [[nodiscard]] const ReassemblyStats& stats() const { return stats_; }
  [[nodiscard]] const ReassemblyConfig& config() const { return config_; }

 private:
  struct Buffer {
    std::uint8_t total{0};
    bool compressed{false};
    std::optional<std::uint32_t> decompressed_size;
    std::optional<std::uint32_t> crc32;
    std::map<std::uint8_t, std::vector<std::uint8_t>> fragments;
  };

  ReassemblyResult fail(std::int32_t request_id, std::error_code ec);
  ReassemblyResult assemble(std::int32_t request_id, Buffer& buffer);

  ReassemblyConfig config_;
  std::map<std::int32_t, Buffer> buffers_;
  ReassemblyStats stats_;
};

const char* reassembly_status_name(ReassemblyStatus status);

}  // namespace a2s::reassembly
