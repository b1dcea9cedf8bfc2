#include "protocol/reassembly/split_reassembly.h"

#include <algorithm>
#include <utility>

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/reassembly/decompressor.h"

namespace a2s::reassembly {

namespace {

bool same_bytes(const std::vector<std::uint8_t>& stored, std::span<const std::uint8_t> incoming) {
  return stored.size() == incoming.size() &&
         std::equal(stored.begin(), stored.end(), incoming.begin());
}

// Compression metadata may only be learned once per id.
bool merge_metadata(std::optional<std::uint32_t>& stored, const std::optional<std::uint32_t>& incoming) {
  if (!incoming) {
    return true;
  }
  if (stored && *stored != *incoming) {
    return false;
  }
  stored = incoming;
  return true;
}

}  // namespace

SplitReassembler::SplitReassembler(ReassemblyConfig config) : config_(config) {}

ReassemblyResult SplitReassembler::accept(const packet::SplitHeader& header,
                                          std::span<const std::uint8_t> fragment) {
  if (header.total_fragments == 0 || header.fragment_index >= header.total_fragments ||
      header.total_fragments > config_.max_fragments) {
    LOG_DEBUG("Rejecting fragment {}/{} of request {}", header.fragment_index,
              header.total_fragments, header.request_id);
    ++stats_.payloads_failed;
    ReassemblyResult result;
    result.status = ReassemblyStatus::kFailed;
    result.error = make_error_code(Error::kMalformedHeader);
    return result;
  }

  auto [it, inserted] = buffers_.try_emplace(header.request_id);
  Buffer& buffer = it->second;
  if (inserted) {
    buffer.total = header.total_fragments;
    buffer.compressed = header.compressed;
  } else if (buffer.total != header.total_fragments) {
    LOG_WARN("Request {} fragment declares {} fragments, earlier ones declared {}",
             header.request_id, header.total_fragments, buffer.total);
    return fail(header.request_id, make_error_code(Error::kConflictingFragment));
  } else if (buffer.compressed != header.compressed) {
    LOG_WARN("Request {} mixes compressed and uncompressed fragments", header.request_id);
    return fail(header.request_id, make_error_code(Error::kConflictingFragment));
  }

  if (!merge_metadata(buffer.decompressed_size, header.decompressed_size) ||
      !merge_metadata(buffer.crc32, header.crc32)) {
    LOG_WARN("Request {} repeats compression metadata with different values", header.request_id);
    return fail(header.request_id, make_error_code(Error::kConflictingFragment));
  }

  const auto existing = buffer.fragments.find(header.fragment_index);
  if (existing != buffer.fragments.end()) {
    if (!same_bytes(existing->second, fragment)) {
      LOG_WARN("Request {} fragment {} received twice with different contents",
               header.request_id, header.fragment_index);
      return fail(header.request_id, make_error_code(Error::kConflictingFragment));
    }
    ++stats_.duplicate_fragments;
    LOG_TRACE("Duplicate fragment {} of request {}", header.fragment_index, header.request_id);
    return ReassemblyResult{};
  }

  buffer.fragments.emplace(header.fragment_index,
                           std::vector<std::uint8_t>(fragment.begin(), fragment.end()));
  ++stats_.fragments_accepted;
  LOG_TRACE("Request {}: fragment {} stored ({}/{})", header.request_id, header.fragment_index,
            buffer.fragments.size(), buffer.total);

  if (buffer.fragments.size() < buffer.total) {
    return ReassemblyResult{};
  }
  return assemble(header.request_id, buffer);
}

ReassemblyResult SplitReassembler::assemble(std::int32_t request_id, Buffer& buffer) {
  std::size_t total_size = 0;
  for (const auto& [index, bytes] : buffer.fragments) {
    total_size += bytes.size();
  }
  std::vector<std::uint8_t> joined;
  joined.reserve(total_size);
  // std::map iterates in index order regardless of arrival order.
  for (const auto& [index, bytes] : buffer.fragments) {
    joined.insert(joined.end(), bytes.begin(), bytes.end());
  }

  if (buffer.compressed) {
    if (!buffer.decompressed_size || !buffer.crc32) {
      LOG_WARN("Compressed request {} completed without size and checksum", request_id);
      return fail(request_id, make_error_code(Error::kIntegrityCheckFailed));
    }
    std::error_code ec;
    auto output = decompress_verified(joined, *buffer.decompressed_size, *buffer.crc32,
                                      config_.max_decompressed_size, ec);
    if (!output) {
      return fail(request_id, ec);
    }
    joined = std::move(*output);
  }

  LOG_DEBUG("Request {} reassembled from {} fragments into {} bytes", request_id,
            buffer.fragments.size(), joined.size());
  buffers_.erase(request_id);
  ++stats_.payloads_completed;

  ReassemblyResult result;
  result.status = ReassemblyStatus::kComplete;
  result.payload = std::move(joined);
  return result;
}

ReassemblyResult SplitReassembler::fail(std::int32_t request_id, std::error_code ec) {
  buffers_.erase(request_id);
  ++stats_.payloads_failed;
  ReassemblyResult result;
  result.status = ReassemblyStatus::kFailed;
  result.error = ec;
  return result;
}

bool SplitReassembler::discard(std::int32_t request_id) {
  return buffers_.erase(request_id) > 0;
}

std::size_t SplitReassembler::received_count(std::int32_t request_id) const {
  const auto it = buffers_.find(request_id);
  return it == buffers_.end() ? 0 : it->second.fragments.size();
}

const char* reassembly_status_name(ReassemblyStatus status) {
  switch (status) {
    case ReassemblyStatus::kIncomplete:
      return "incomplete";
    case ReassemblyStatus::kComplete:
      return "complete";
    case ReassemblyStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

}  // namespace a2s::reassembly
