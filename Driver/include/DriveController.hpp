#pragma once

#include <CommonDefinitions.hpp>
#include <DriveSequence.hpp>
#include <DriveSettings.hpp>
#include <FrameCodec.hpp>
#include <IByteStream.hpp>
#include <IClock.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

struct PollProgress {
  std::string label;
  std::string expectation;
  std::uint32_t attempt{0};
  IClock::duration elapsed{};
  Frame lastReply;
};

using ProgressCallback = std::function<void(const PollProgress&)>;

// Stop requests are honoured between exchanges only, so a request/response
// pair is never torn apart.
struct OperationContext {
  std::stop_token stop{};
  ProgressCallback onPoll{};
};

// Client for one igus dryve D1. All operations block until the drive reports
// the expected state, the poll budget is spent, or the caller cancels.
// Concurrent callers are serialized.
class DriveController {
 public:
  DriveController(std::unique_ptr<IByteStream> stream, DriveSettings settings,
                  IClock& clock);
  ~DriveController();

  DriveController(const DriveController&) = delete;
  DriveController& operator=(const DriveController&) = delete;

  // Connects over TCP as configured. Throws ConnectionError.
  [[nodiscard]] static std::unique_ptr<DriveController> open(
      const DriveSettings& settings);

  // Writes `frame` and returns the raw reply (MBAP header included).
  [[nodiscard]] Frame sendCommand(std::span<const std::uint8_t> frame);

  void setShutdown(const OperationContext& context = {});
  void setSwitchOn(const OperationContext& context = {});
  void setEnableOperation(const OperationContext& context = {});
  // Shutdown, switch on, enable operation.
  void init(const OperationContext& context = {});

  void setFeedrate(std::uint16_t feedrate);
  void setMode(dryve::EOperationMode mode, const OperationContext& context = {});

  void setHoming(std::string_view method, std::uint16_t findVelocity,
                 std::uint16_t zeroVelocity, std::uint16_t acceleration,
                 const OperationContext& context = {});
  void setHoming(dryve::EHomingMethod method, std::uint16_t findVelocity,
                 std::uint16_t zeroVelocity, std::uint16_t acceleration,
                 const OperationContext& context = {});

  dryve::MotionStatus move(std::uint32_t velocity, std::uint32_t acceleration,
                           std::int32_t targetPosition,
                           const OperationContext& context = {});
  // Moves to `startPosition`, then `iterations` times by `stepWidth`, waiting
  // `waitTime` after each step, and back to the start when `goBack` is set.
  std::vector<dryve::MotionStatus> staggeredMove(
      std::uint32_t velocity, std::uint32_t acceleration,
      std::int32_t startPosition, int iterations, std::int32_t stepWidth,
      std::chrono::milliseconds waitTime, bool goBack,
      const OperationContext& context = {});

  [[nodiscard]] dryve::MotionStatus getStatus();

  void close();
  [[nodiscard]] bool isOpen() const;
  [[nodiscard]] const DriveSettings& settings() const { return _settings; }

 private:
  Frame exchange(std::span<const std::uint8_t> frame);
  Frame exchangeLocked(std::span<const std::uint8_t> frame);
  [[noreturn]] void throwTransportFailure(std::string_view what,
                                          const TransportError& error);

  void runSequence(const DriveSequence& steps, const OperationContext& context);
  void runStep(const SequenceStep& step, const OperationContext& context);
  void awaitStatus(const std::string& label, const StatusWait& wait,
                   const OperationContext& context);
  void sendUnchecked(const Frame& frame);
  void throwIfCancelled(std::string_view label,
                        const OperationContext& context) const;

  void setModeLocked(dryve::EOperationMode mode, const OperationContext& context);
  dryve::MotionStatus moveLocked(std::uint32_t velocity, std::uint32_t acceleration,
                                 std::int32_t targetPosition,
                                 const OperationContext& context);
  dryve::MotionStatus readMotionStatus();

  std::unique_ptr<IByteStream> _stream;
  DriveSettings _settings;
  IClock& _clock;
  std::set<dryve::EHomingMethod> _warnedHomingMethods;

  // Held for one request/response pair.
  mutable std::mutex _exchangeMutex;
  // Held for a whole multi-step operation.
  std::mutex _operationMutex;
};
