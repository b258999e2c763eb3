#include <DriveSequence.hpp>

#include <DryveD1ObjectMap.hpp>
#include <HomingMethod.hpp>
#include <StatusWord.hpp>
#include <magic_enum/magic_enum.hpp>

#include <format>
#include <iterator>
#include <utility>

namespace {
void append(DriveSequence& target, DriveSequence steps) {
  target.insert(target.end(), std::make_move_iterator(steps.begin()),
                std::make_move_iterator(steps.end()));
}

SequenceStep writeStep(std::string label, const ObjectAddress& object,
                       const std::int64_t value) {
  return SequenceStep{std::move(label), writeFrame(object, value), std::nullopt};
}

SequenceStep controlStep(const ControlCommand command,
                         std::optional<StatusWait> wait = std::nullopt) {
  return SequenceStep{
      std::format("controlword 0x{:04X}", static_cast<std::uint16_t>(command)),
      controlWordFrame(command), std::move(wait)};
}

StatusWait statusWait(ReplyPredicate accept, const PollPolicy& policy,
                      std::string expectation) {
  return StatusWait{statusQueryFrame(), std::move(accept), policy,
                    std::move(expectation)};
}

// Rising edge on bit 4 of the control word starts the prepared motion.
void appendTrigger(DriveSequence& steps, StatusWait wait) {
  steps.push_back(controlStep(ControlCommand::StartMotion));
  steps.push_back(controlStep(ControlCommand::EnableOperation, std::move(wait)));
}
}  // namespace

ReplyPredicate powerPhaseReached(const dryve::EPowerPhase phase) {
  return [phase](const std::span<const std::uint8_t> reply) {
    return isInPowerPhase(statusFromReply(reply), phase);
  };
}

ReplyPredicate homingCompleted() {
  return [](const std::span<const std::uint8_t> reply) {
    return isHomingComplete(statusFromReply(reply));
  };
}

ReplyPredicate targetPositionReached() {
  return [](const std::span<const std::uint8_t> reply) {
    return isTargetReached(statusFromReply(reply));
  };
}

ReplyPredicate modeDisplayed(const dryve::EOperationMode mode) {
  return [mode](const std::span<const std::uint8_t> reply) {
    return decodeRegister(reply, dryveD1ObjectMap().modesOfOperationDisplay.width) ==
           static_cast<std::int64_t>(mode);
  };
}

DriveSequence makeShutdownSequence(const PollPolicy& policy) {
  DriveSequence steps;
  steps.push_back(controlStep(
      ControlCommand::Shutdown,
      statusWait(powerPhaseReached(dryve::EPowerPhase::ReadyToSwitchOn), policy,
                 "ReadyToSwitchOn")));
  return steps;
}

DriveSequence makeSwitchOnSequence(const PollPolicy& policy) {
  DriveSequence steps;
  steps.push_back(controlStep(
      ControlCommand::SwitchOn,
      statusWait(powerPhaseReached(dryve::EPowerPhase::SwitchedOn), policy,
                 "SwitchedOn")));
  return steps;
}

DriveSequence makeEnableOperationSequence(const PollPolicy& policy) {
  DriveSequence steps;
  steps.push_back(controlStep(
      ControlCommand::EnableOperation,
      statusWait(powerPhaseReached(dryve::EPowerPhase::OperationEnabled), policy,
                 "OperationEnabled")));
  return steps;
}

DriveSequence makeInitSequence(const PollPolicy& policy) {
  DriveSequence steps = makeShutdownSequence(policy);
  append(steps, makeSwitchOnSequence(policy));
  append(steps, makeEnableOperationSequence(policy));
  return steps;
}

DriveSequence makeSetModeSequence(const dryve::EOperationMode mode,
                                  const PollPolicy& policy) {
  const auto& objects = dryveD1ObjectMap();
  DriveSequence steps;
  steps.push_back(SequenceStep{
      std::format("mode {}", magic_enum::enum_name(mode)),
      writeFrame(objects.modesOfOperation, static_cast<std::int64_t>(mode)),
      StatusWait{readFrame(objects.modesOfOperationDisplay), modeDisplayed(mode),
                 policy,
                 std::format("mode display {}", static_cast<int>(mode))}});
  return steps;
}

DriveSequence makeFeedrateSequence(const std::uint16_t feedrate) {
  const auto& objects = dryveD1ObjectMap();
  DriveSequence steps;
  steps.push_back(writeStep("feed constant", objects.feedConstantFeed, feedrate));
  steps.push_back(writeStep("feed constant apply", objects.feedConstantApply, 1));
  return steps;
}

DriveSequence makeMotionProfileSequence(const std::int64_t velocity,
                                        const std::int64_t acceleration) {
  const auto& objects = dryveD1ObjectMap();
  DriveSequence steps;
  steps.push_back(writeStep("profile velocity", objects.profileVelocity, velocity));
  steps.push_back(
      writeStep("profile acceleration", objects.profileAcceleration, acceleration));
  return steps;
}

DriveSequence makeHomingSequence(const dryve::EHomingMethod method,
                                 const std::uint16_t feedrate,
                                 const std::int64_t findVelocity,
                                 const std::int64_t zeroVelocity,
                                 const std::int64_t acceleration,
                                 const PollPolicy& policy) {
  const auto& objects = dryveD1ObjectMap();
  DriveSequence steps;
  steps.push_back(writeStep(
      std::format("homing method {}", magic_enum::enum_name(method)),
      objects.homingMethod, homingMethodCode(method)));
  append(steps, makeFeedrateSequence(feedrate));
  steps.push_back(
      writeStep("homing search speed", objects.homingSpeedSearch, findVelocity));
  steps.push_back(
      writeStep("homing zero speed", objects.homingSpeedZero, zeroVelocity));
  steps.push_back(
      writeStep("homing acceleration", objects.homingAcceleration, acceleration));
  appendTrigger(steps, statusWait(homingCompleted(), policy, "homing attained"));
  return steps;
}

DriveSequence makeMoveSequence(const std::int64_t velocity,
                               const std::int64_t acceleration,
                               const std::int32_t targetPosition,
                               const PollPolicy& policy) {
  DriveSequence steps = makeMotionProfileSequence(velocity, acceleration);
  append(steps, makeTargetSequence(targetPosition, policy));
  return steps;
}

DriveSequence makeTargetSequence(const std::int32_t targetPosition,
                                 const PollPolicy& policy) {
  DriveSequence steps;
  steps.push_back(writeStep(std::format("target position {}", targetPosition),
                            dryveD1ObjectMap().targetPosition, targetPosition));
  appendTrigger(steps, statusWait(targetPositionReached(), policy, "target reached"));
  return steps;
}
