#include "protocol/session/query_exchange.h"

#include <utility>

#include "common/logging/logger.h"
#include "protocol/payload/payload_parser.h"

namespace a2s::session {

QueryExchange::QueryExchange(request::RequestType type, packet::SplitFormat format,
                             ExchangeOptions options)
    : type_(type),
      format_(format),
      decode_options_(options.decode),
      reassembler_(options.reassembly) {}

std::vector<std::uint8_t> QueryExchange::start() {
  tracker_.begin();
  reassembler_.clear();
  complete_ = false;
  request_ = request::initial_request(type_);
  LOG_DEBUG("Starting {} query ({} split layout)", request::request_type_name(type_),
            packet::split_format_name(format_));
  return request_;
}

std::optional<ExchangeStep> QueryExchange::feed(std::span<const std::uint8_t> datagram,
                                                std::error_code& ec) {
  if (request_.empty()) {
    request_ = request::initial_request(type_);
  }

  const auto packet = packet::classify(datagram, format_, ec);
  if (!packet) {
    return std::nullopt;
  }
  if (packet->kind == packet::PacketKind::kSingle) {
    return handle_payload(packet->payload, ec);
  }

  auto result = reassembler_.accept(packet->split, packet->payload);
  switch (result.status) {
    case reassembly::ReassemblyStatus::kIncomplete:
      return ExchangeStep{};
    case reassembly::ReassemblyStatus::kFailed:
      ec = result.error;
      return std::nullopt;
    case reassembly::ReassemblyStatus::kComplete:
      break;
  }
  return handle_payload(result.payload, ec);
}

std::optional<ExchangeStep> QueryExchange::handle_payload(std::span<const std::uint8_t> payload,
                                                          std::error_code& ec) {
  const auto outcome = tracker_.observe(payload, ec);
  if (!outcome) {
    return std::nullopt;
  }

  ExchangeStep step;
  switch (*outcome) {
    case challenge::ChallengeOutcome::kIgnored:
      return step;
    case challenge::ChallengeOutcome::kResend: {
      auto resend = request::with_challenge(request_, tracker_.challenge(), ec);
      if (!resend) {
        return std::nullopt;
      }
      request_ = std::move(*resend);
      step.kind = StepKind::kResend;
      step.request = request_;
      return step;
    }
    case challenge::ChallengeOutcome::kHandshakeComplete:
      break;
  }

  auto response = payload::parse_payload(payload, decode_options_, ec);
  if (!response) {
    return std::nullopt;
  }
  complete_ = true;
  step.kind = StepKind::kComplete;
  step.response = std::move(*response);
  return step;
}

}  // namespace a2s::session
