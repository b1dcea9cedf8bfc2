#include "protocol/challenge/challenge_tracker.h"

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/payload/decoders.h"
#include "protocol/payload/payload_header.h"

namespace a2s::challenge {

ChallengeState ChallengeTracker::begin() {
  state_ = ChallengeState::kAwaitingChallenge;
  challenge_ = kPlaceholderChallenge;
  return state_;
}

std::optional<ChallengeOutcome> ChallengeTracker::observe(std::span<const std::uint8_t> payload,
                                                          std::error_code& ec) {
  if (state_ == ChallengeState::kIdle) {
    begin();
  }

  const auto type_byte = payload::peek_type_byte(payload);
  if (!type_byte || *type_byte != static_cast<std::uint8_t>(payload::PayloadType::kChallenge)) {
    state_ = ChallengeState::kComplete;
    return ChallengeOutcome::kHandshakeComplete;
  }

  std::error_code header_ec;
  const auto header = payload::parse_payload_header(payload, header_ec);
  if (!header) {
    ec = header_ec;
    return std::nullopt;
  }
  const auto reply = payload::decode_challenge(header->body, ec);
  if (!reply) {
    return std::nullopt;
  }

  switch (state_) {
    case ChallengeState::kAwaitingChallenge:
      challenge_ = reply->challenge;
      state_ = ChallengeState::kResending;
      LOG_DEBUG("Server issued challenge {}", challenge_);
      return ChallengeOutcome::kResend;
    case ChallengeState::kResending:
    case ChallengeState::kComplete:
      // A late copy of the challenge already answered is UDP duplication.
      if (challenge_ != kPlaceholderChallenge && reply->challenge == challenge_) {
        LOG_DEBUG("Ignoring duplicate challenge {}", challenge_);
        return ChallengeOutcome::kIgnored;
      }
      break;
    case ChallengeState::kIdle:
      break;
  }

  LOG_WARN("Server challenged again ({} after {}) in state {}", reply->challenge, challenge_,
           challenge_state_name(state_));
  ec = make_error_code(Error::kRepeatedChallenge);
  return std::nullopt;
}

const char* challenge_state_name(ChallengeState state) {
  switch (state) {
    case ChallengeState::kIdle: return "idle";
    case ChallengeState::kAwaitingChallenge: return "awaiting_challenge";
    case ChallengeState::kResending: return "resending";
    case ChallengeState::kComplete: return "complete";
  }
  return "unknown";
}

}  // namespace a2s::challenge
