#pragma once

#include <cstdint>

namespace a2s::payload {

enum class TextPolicy : std::uint8_t {
  // Reject string fields that are not valid UTF-8 (Error::kInvalidEncoding).
  kStrictUtf8 = 1,
  // Keep string bytes as received.
  kRaw = 2,
};

struct DecodeOptions {
  TextPolicy text_policy{TextPolicy::kStrictUtf8};
  // Old servers cut long rule lists to a single packet. When set, a rule
  // list ending mid-pair decodes with the partial tail kept in
  // RuleList::remaining instead of failing.
  bool allow_truncated_rules{false};
};

}  // namespace a2s::payload
