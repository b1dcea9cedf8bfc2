#include <utility>

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/field_reader.h"

namespace a2s::payload {

std::optional<RuleList> decode_rule_list(std::span<const std::uint8_t> body,
                                         const DecodeOptions& options, std::error_code& ec) {
  FieldReader in(body, options, ec);
  RuleList list{};
  if (!in.u16(list.declared_count)) {
    return std::nullopt;
  }

  list.rules.reserve(list.declared_count);
  for (std::uint16_t i = 0; i < list.declared_count; ++i) {
    const auto pair_start = in.rest();
    Rule rule{};
    if (in.string(rule.name) && in.string(rule.value)) {
      list.rules.push_back(std::move(rule));
      continue;
    }
    if (!options.allow_truncated_rules || ec != Error::kTruncatedPayload) {
      return std::nullopt;
    }
    LOG_DEBUG("Rule list truncated after {} of {} rules", list.rules.size(), list.declared_count);
    list.remaining.assign(pair_start.begin(), pair_start.end());
    ec.clear();
    return list;
  }

  if (in.remaining() != 0) {
    LOG_DEBUG("Rule list has {} trailing bytes", in.remaining());
  }
  return list;
}

}  // namespace a2s::payload
