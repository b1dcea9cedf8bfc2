#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>

namespace a2s::challenge {

inline constexpr std::int32_t kPlaceholderChallenge = -1;

enum class ChallengeState : std::uint8_t {
  kIdle,               // begin() not called yet.
  kAwaitingChallenge,  // Request sent with the -1 placeholder.
  kResending,          // Server issued a challenge; request resent with it.
  kComplete,           // A non-challenge response arrived.
};

enum class ChallengeOutcome : std::uint8_t {
  // Resend the original request with challenge() substituted for -1.
  kResend,
  // Duplicate delivery of the challenge already being answered.
  kIgnored,
  // Not a challenge; hand the payload to the payload parser unchanged.
  kHandshakeComplete,
};

// Two-step challenge handshake for one logical query. At most one challenge
// is honoured: a second, different challenge is Error::kRepeatedChallenge
// rather than another resend.
//
// Thread Safety: not thread-safe; one tracker per in-flight query.
class ChallengeTracker {
 public:
  ChallengeState begin();

  // Inspects a complete payload (single-packet payload or assembled split
  // payload). Fails with Error::kRepeatedChallenge or, for a challenge reply
  // too short to hold its value, Error::kTruncatedPayload.
  std::optional<ChallengeOutcome> observe(std::span<const std::uint8_t> payload,
                                          std::error_code& ec);

  [[nodiscard]] ChallengeState state() const { return state_; }

  // Value to place in the outgoing request: the placeholder until a
  // challenge was received.
  [[nodiscard]] std::int32_t challenge() const { return challenge_; }

 private:
  ChallengeState state_{ChallengeState::kIdle};
  std::int32_t challenge_{kPlaceholderChallenge};
};

const char* challenge_state_name(ChallengeState state);

}  // namespace a2s::challenge
