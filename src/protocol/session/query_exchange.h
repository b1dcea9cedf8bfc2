#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "protocol/challenge/challenge_tracker.h"
#include "protocol/packet/packet_header.h"
#include "protocol/payload/decode_options.h"
#include "protocol/payload/responses.h"
#include "protocol/reassembly/split_reassembly.h"
#include "protocol/request/request_codec.h"

namespace a2s::session {

struct ExchangeOptions {
  payload::DecodeOptions decode;
  reassembly::ReassemblyConfig reassembly;
};

enum class StepKind : std::uint8_t {
  kAwaitingFragments = 1,  // More datagrams are needed.
  kResend = 2,             // Send ExchangeStep::request to the server.
  kComplete = 3,           // ExchangeStep::response holds the decoded reply.
};

struct ExchangeStep {
  StepKind kind{StepKind::kAwaitingFragments};
  std::vector<std::uint8_t> request;
  std::optional<payload::Response> response;
};

// Drives one logical query (request, optional challenge round trip, split
// reassembly, decoding) without doing any I/O. The caller sends the bytes
// returned by start() and by kResend steps and feeds every datagram received
// from the server. Dropping the object abandons the query.
//
// Thread Safety: not thread-safe.
class QueryExchange {
 public:
  QueryExchange(request::RequestType type, packet::SplitFormat format,
                ExchangeOptions options = {});

  // Returns the first request, with the -1 placeholder challenge.
  std::vector<std::uint8_t> start();

  // Processes one received datagram. Errors abort only the current datagram
  // or reassembly buffer; the exchange may continue with further datagrams.
  std::optional<ExchangeStep> feed(std::span<const std::uint8_t> datagram, std::error_code& ec);

  // Source servers of some AppIDs omit the split size field; the layout can
  // change once an info response revealed the AppID.
  void set_split_format(packet::SplitFormat format) { format_ = format; }

  [[nodiscard]] request::RequestType request_type() const { return type_; }
  [[nodiscard]] packet::SplitFormat split_format() const { return format_; }
  [[nodiscard]] const std::vector<std::uint8_t>& last_request() const { return request_; }
  [[nodiscard]] bool complete() const { return complete_; }
  [[nodiscard]] const challenge::ChallengeTracker& tracker() const { return tracker_; }
  [[nodiscard]] const reassembly::SplitReassembler& reassembler() const { return reassembler_; }

 private:
  std::optional<ExchangeStep> handle_payload(std::span<const std::uint8_t> payload,
                                             std::error_code& ec);

  request::RequestType type_;
  packet::SplitFormat format_;
  payload::DecodeOptions decode_options_;
  challenge::ChallengeTracker tracker_;
  reassembly::SplitReassembler reassembler_;
  std::vector<std::uint8_t> request_;
  bool complete_{false};
};

}  // namespace a2s::session
