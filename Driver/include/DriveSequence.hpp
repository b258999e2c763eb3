#pragma once

#include <CommonDefinitions.hpp>
#include <DriveSettings.hpp>
#include <FrameCodec.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Decides from a polled reply whether the wait is over.
using ReplyPredicate = std::function<bool(std::span<const std::uint8_t> reply)>;

struct StatusWait {
  Frame query;
  ReplyPredicate accept;
  PollPolicy policy;
  // Human-readable target for logs and timeout messages.
  std::string expectation;
};

// One request of a drive choreography, optionally followed by polling.
// Steps never interpret the request's reply beyond the echo check.
struct SequenceStep {
  std::string label;
  Frame request;
  std::optional<StatusWait> wait;
};

using DriveSequence = std::vector<SequenceStep>;

[[nodiscard]] ReplyPredicate powerPhaseReached(dryve::EPowerPhase phase);
[[nodiscard]] ReplyPredicate homingCompleted();
[[nodiscard]] ReplyPredicate targetPositionReached();
[[nodiscard]] ReplyPredicate modeDisplayed(dryve::EOperationMode mode);

// Control word 0x0006, wait for ReadyToSwitchOn.
[[nodiscard]] DriveSequence makeShutdownSequence(const PollPolicy& policy);
// Control word 0x0007, wait for SwitchedOn.
[[nodiscard]] DriveSequence makeSwitchOnSequence(const PollPolicy& policy);
// Control word 0x000F, wait for OperationEnabled.
[[nodiscard]] DriveSequence makeEnableOperationSequence(const PollPolicy& policy);
[[nodiscard]] DriveSequence makeInitSequence(const PollPolicy& policy);

// Writes 0x6060 and polls 0x6061 until it reports the same mode.
[[nodiscard]] DriveSequence makeSetModeSequence(dryve::EOperationMode mode,
                                                const PollPolicy& policy);
[[nodiscard]] DriveSequence makeFeedrateSequence(std::uint16_t feedrate);
[[nodiscard]] DriveSequence makeMotionProfileSequence(std::int64_t velocity,
                                                      std::int64_t acceleration);

// Method, feed constant, search/zero speeds, acceleration, rising edge on the
// control word, then waits for homing attained (0x1627). Mode selection and
// the closing enable-operation are left to the caller.
[[nodiscard]] DriveSequence makeHomingSequence(dryve::EHomingMethod method,
                                               std::uint16_t feedrate,
                                               std::int64_t findVelocity,
                                               std::int64_t zeroVelocity,
                                               std::int64_t acceleration,
                                               const PollPolicy& policy);

// Profile, target, rising edge, then waits for target reached (0x0627).
[[nodiscard]] DriveSequence makeMoveSequence(std::int64_t velocity,
                                             std::int64_t acceleration,
                                             std::int32_t targetPosition,
                                             const PollPolicy& policy);
// Target and rising edge only, for moves that reuse an already written profile.
[[nodiscard]] DriveSequence makeTargetSequence(std::int32_t targetPosition,
                                               const PollPolicy& policy);
