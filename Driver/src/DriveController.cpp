#include <DriveController.hpp>

#include <DriveErrors.hpp>
#include <HomingMethod.hpp>
#include <Logger.hpp>
#include <StatusWord.hpp>
#include <TimingMetrics.hpp>
#include <DryveD1ObjectMap.hpp>
#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace {
// Shortest valid reply is a Modbus exception (unit id, function, code).
constexpr std::size_t kMinReplyLength = 3;
constexpr std::size_t kMaxReplyLength = kMaxFrameSize - kMbapHeaderSize;

std::string describeLastReply(const Frame& reply, const StatusWait& wait) {
  if (wait.query == statusQueryFrame() && reply.size() >= kPayloadOffset + 2) {
    return statusFromReply(reply).describe();
  }
  return describeFrame(reply);
}
}  // namespace

DriveController::DriveController(std::unique_ptr<IByteStream> stream,
                                 DriveSettings settings, IClock& clock)
    : _stream(std::move(stream)), _settings(std::move(settings)), _clock(clock) {
  if (!_stream) {
    throw std::invalid_argument("DriveController requires a byte stream");
  }
  SPDLOG_INFO("DriveController attached to {}", _stream->describe());
}

DriveController::~DriveController() {
  if (_stream) {
    _stream->closeNoThrow();
  }
}

Frame DriveController::sendCommand(const std::span<const std::uint8_t> frame) {
  return exchange(frame);
}

Frame DriveController::exchange(const std::span<const std::uint8_t> frame) {
  std::lock_guard<std::mutex> lock(_exchangeMutex);
  return exchangeLocked(frame);
}

Frame DriveController::exchangeLocked(const std::span<const std::uint8_t> frame) {
  DRYVE_TIMED_SCOPE("DriveController::exchange");
  if (!_stream->isOpen()) {
    throw ConnectionError(
        std::format("Connection to {} is closed", _stream->describe()));
  }

  SPDLOG_DEBUG("-> {}", describeFrame(frame));
  if (const auto sent = _stream->send(frame); !sent) {
    throwTransportFailure("send", sent.error());
  }

  auto header = _stream->receive(kMbapHeaderSize);
  if (!header) {
    throwTransportFailure("receive header", header.error());
  }
  const std::size_t remaining = (*header)[kMbapHeaderSize - 1];
  // Read the announced bytes even when out of range so the next exchange
  // starts on a frame boundary.
  auto body = _stream->receive(remaining);
  if (!body) {
    throwTransportFailure("receive body", body.error());
  }

  Frame reply = std::move(*header);
  reply.insert(reply.end(), body->begin(), body->end());
  if (remaining < kMinReplyLength || remaining > kMaxReplyLength) {
    throw MalformedReplyError(std::format(
        "Reply announces {} bytes after the header (expected {}..{}): {}",
        remaining, kMinReplyLength, kMaxReplyLength, toHex(reply)));
  }
  SPDLOG_DEBUG("<- {}", describeFrame(reply));
  return reply;
}

void DriveController::throwTransportFailure(const std::string_view what,
                                            const TransportError& error) {
  const auto message =
      std::format("{} on {} failed ({}): {} (errno={})", what,
                  _stream->describe(), magic_enum::enum_name(error.kind),
                  error.message, error.errno_value);
  SPDLOG_ERROR("{}", message);
  // After a timeout the reply may still arrive and would desynchronize every
  // following exchange.
  if (error.kind == TransportErrorKind::Closed ||
      error.kind == TransportErrorKind::Timeout) {
    _stream->closeNoThrow();
  }
  throw ConnectionError(message);
}

void DriveController::throwIfCancelled(const std::string_view label,
                                       const OperationContext& context) const {
  if (context.stop.stop_requested()) {
    SPDLOG_INFO("Cancelled before '{}'", label);
    throw OperationCancelled(std::format("Operation cancelled before '{}'", label));
  }
}

void DriveController::runSequence(const DriveSequence& steps,
                                  const OperationContext& context) {
  for (const auto& step : steps) {
    runStep(step, context);
  }
}

void DriveController::runStep(const SequenceStep& step,
                              const OperationContext& context) {
  throwIfCancelled(step.label, context);
  SPDLOG_DEBUG("Step '{}'", step.label);
  const auto reply = exchange(step.request);
  expectEcho(step.request, reply);
  if (step.wait) {
    awaitStatus(step.label, *step.wait, context);
  }
}

void DriveController::awaitStatus(const std::string& label, const StatusWait& wait,
                                  const OperationContext& context) {
  DRYVE_TIMED_SCOPE("DriveController::awaitStatus");
  const auto start = _clock.now();
  const auto deadline = start + wait.policy.timeout;
  std::uint32_t attempt = 0;

  while (true) {
    throwIfCancelled(label, context);
    ++attempt;
    const auto reply = exchange(wait.query);
    expectEcho(wait.query, reply);
    if (wait.accept(reply)) {
      SPDLOG_DEBUG("'{}' reached {} after {} poll(s)", label, wait.expectation,
                   attempt);
      return;
    }

    const auto now = _clock.now();
    const auto last = describeLastReply(reply, wait);
    SPDLOG_DEBUG("'{}' waiting for {} (attempt {}, last {})", label,
                 wait.expectation, attempt, last);
    if (context.onPoll) {
      context.onPoll(PollProgress{label, wait.expectation, attempt, now - start,
                                  reply});
    }

    const bool attemptsSpent =
        wait.policy.maxAttempts != 0 && attempt >= wait.policy.maxAttempts;
    if (attemptsSpent || now >= deadline) {
      const auto message = std::format(
          "'{}' did not reach {} within {} ms ({} poll(s), last {})", label,
          wait.expectation, wait.policy.timeout.count(), attempt, last);
      SPDLOG_ERROR("{}", message);
      throw OperationTimedOut(message);
    }

    if (!_clock.sleepUntil(std::min(now + wait.policy.interval, deadline),
                           context.stop)) {
      throwIfCancelled(label, context);
    }
  }
}

void DriveController::sendUnchecked(const Frame& frame) {
  const auto reply = exchange(frame);
  expectEcho(frame, reply);
}

void DriveController::setShutdown(const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Shutdown");
  runSequence(makeShutdownSequence(_settings.polling.power), context);
}

void DriveController::setSwitchOn(const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Switch on");
  runSequence(makeSwitchOnSequence(_settings.polling.power), context);
}

void DriveController::setEnableOperation(const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Enable operation");
  runSequence(makeEnableOperationSequence(_settings.polling.power), context);
}

void DriveController::init(const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Initializing drive on {}", _stream->describe());
  runSequence(makeInitSequence(_settings.polling.power), context);
  SPDLOG_INFO("Drive operation enabled");
}

void DriveController::setFeedrate(const std::uint16_t feedrate) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Feed constant {}", feedrate);
  runSequence(makeFeedrateSequence(feedrate), {});
}

void DriveController::setMode(const dryve::EOperationMode mode,
                              const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  setModeLocked(mode, context);
}

void DriveController::setModeLocked(const dryve::EOperationMode mode,
                                    const OperationContext& context) {
  SPDLOG_INFO("Mode of operation {}", magic_enum::enum_name(mode));
  runSequence(makeSetModeSequence(mode, _settings.polling.mode), context);
}

void DriveController::setHoming(const std::string_view method,
                                const std::uint16_t findVelocity,
                                const std::uint16_t zeroVelocity,
                                const std::uint16_t acceleration,
                                const OperationContext& context) {
  setHoming(resolveHomingMethod(method), findVelocity, zeroVelocity,
            acceleration, context);
}

void DriveController::setHoming(const dryve::EHomingMethod method,
                                const std::uint16_t findVelocity,
                                const std::uint16_t zeroVelocity,
                                const std::uint16_t acceleration,
                                const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  const bool limitSwitch = method == dryve::EHomingMethod::LSN ||
                           method == dryve::EHomingMethod::LSP;
  if (!limitSwitch && _warnedHomingMethods.insert(method).second) {
    SPDLOG_WARN("Homing method {} has not been verified on hardware; "
                "watch the first run",
                magic_enum::enum_name(method));
  }
  SPDLOG_INFO("Homing with {} (search {}, zero {}, acceleration {})",
              magic_enum::enum_name(method), findVelocity, zeroVelocity,
              acceleration);

  setModeLocked(dryve::EOperationMode::Homing, context);
  runSequence(makeHomingSequence(method, _settings.homingFeedrate, findVelocity,
                                 zeroVelocity, acceleration,
                                 _settings.polling.homing),
              context);
  sendUnchecked(enableOperationFrame());
  SPDLOG_INFO("Homing finished");
}

dryve::MotionStatus DriveController::move(const std::uint32_t velocity,
                                          const std::uint32_t acceleration,
                                          const std::int32_t targetPosition,
                                          const OperationContext& context) {
  std::lock_guard<std::mutex> lock(_operationMutex);
  return moveLocked(velocity, acceleration, targetPosition, context);
}

dryve::MotionStatus DriveController::moveLocked(const std::uint32_t velocity,
                                                const std::uint32_t acceleration,
                                                const std::int32_t targetPosition,
                                                const OperationContext& context) {
  SPDLOG_INFO("Move to {} (velocity {}, acceleration {})", targetPosition,
              velocity, acceleration);
  setModeLocked(dryve::EOperationMode::ProfilePosition, context);
  runSequence(makeMoveSequence(velocity, acceleration, targetPosition,
                               _settings.polling.move),
              context);
  const auto status = readMotionStatus();
  sendUnchecked(enableOperationFrame());
  SPDLOG_INFO("Reached position {} (velocity {})", status.position,
              status.velocity);
  return status;
}

std::vector<dryve::MotionStatus> DriveController::staggeredMove(
    const std::uint32_t velocity, const std::uint32_t acceleration,
    const std::int32_t startPosition, const int iterations,
    const std::int32_t stepWidth, const std::chrono::milliseconds waitTime,
    const bool goBack, const OperationContext& context) {
  if (iterations < 0) {
    throw std::invalid_argument(
        std::format("staggeredMove iterations must be >= 0 (got {})", iterations));
  }

  std::lock_guard<std::mutex> lock(_operationMutex);
  SPDLOG_INFO("Staggered move from {} in {} step(s) of {}", startPosition,
              iterations, stepWidth);
  setModeLocked(dryve::EOperationMode::ProfilePosition, context);
  runSequence(makeMotionProfileSequence(velocity, acceleration), context);

  std::vector<dryve::MotionStatus> statuses;
  statuses.reserve(static_cast<std::size_t>(iterations) + 2);
  statuses.push_back(moveLocked(velocity, acceleration, startPosition, context));
  for (int i = 0; i < iterations; ++i) {
    const auto target = static_cast<std::int64_t>(startPosition) +
                        static_cast<std::int64_t>(stepWidth) * (i + 1);
    if (target < INT32_MIN || target > INT32_MAX) {
      throw std::invalid_argument(std::format(
          "staggeredMove step {} target {} is out of range", i + 1, target));
    }
    statuses.push_back(moveLocked(velocity, acceleration,
                                  static_cast<std::int32_t>(target), context));
    if (!_clock.sleepUntil(_clock.now() + waitTime, context.stop)) {
      throwIfCancelled("staggered move dwell", context);
    }
  }
  if (goBack) {
    statuses.push_back(moveLocked(velocity, acceleration, startPosition, context));
  }
  return statuses;
}

dryve::MotionStatus DriveController::getStatus() { return readMotionStatus(); }

dryve::MotionStatus DriveController::readMotionStatus() {
  const auto& objects = dryveD1ObjectMap();
  const auto positionQuery = readFrame(objects.positionActualValue);
  const auto positionReply = exchange(positionQuery);
  expectEcho(positionQuery, positionReply);
  const auto velocityQuery = readFrame(objects.velocityActualValue);
  const auto velocityReply = exchange(velocityQuery);
  expectEcho(velocityQuery, velocityReply);

  return dryve::MotionStatus{
      static_cast<std::int32_t>(
          decodeRegister(positionReply, objects.positionActualValue.width)),
      static_cast<std::int32_t>(
          decodeRegister(velocityReply, objects.velocityActualValue.width))};
}

void DriveController::close() {
  std::lock_guard<std::mutex> lock(_exchangeMutex);
  if (_stream->isOpen()) {
    _stream->closeNoThrow();
    SPDLOG_INFO("DriveController closed");
  }
  dryve::TimingMetricsRegistry::instance().reportAndReset();
}

bool DriveController::isOpen() const {
  std::lock_guard<std::mutex> lock(_exchangeMutex);
  return _stream->isOpen();
}
