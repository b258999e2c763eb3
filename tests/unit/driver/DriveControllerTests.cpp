#include <gtest/gtest.h>

#include <DriveController.hpp>
#include <DriveErrors.hpp>
#include <DryveD1ObjectMap.hpp>
#include <StatusWord.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

#include "driver/fakes/CapturingLogSink.hpp"
#include "driver/fakes/FakeClock.hpp"
#include "driver/fakes/FakeDrive.hpp"

using namespace std::chrono_literals;

namespace {

DriveSettings testSettings() {
  DriveSettings settings;
  settings.host = "fake";
  return settings;
}

struct Harness {
  explicit Harness(DriveSettings settings = testSettings()) {
    auto stream = std::make_unique<FakeDrive>();
    fake = stream.get();
    controller =
        std::make_unique<DriveController>(std::move(stream), std::move(settings), clock);
  }

  DeviceSimulator& device() { return fake->device(); }
  std::size_t statusQueries() { return device().countRequests(statusQueryFrame()); }

  FakeClock clock;
  FakeDrive* fake{nullptr};
  std::unique_ptr<DriveController> controller;
};

std::vector<std::uint16_t> controlWordsSent(const DeviceSimulator& device) {
  const auto controlWord = dryveD1ObjectMap().controlWord;
  std::vector<std::uint16_t> out;
  for (const auto& request : device.requests()) {
    const auto header = parseHeader(request);
    if (header.mode == AccessMode::Write && header.objectIndex == controlWord.index) {
      out.push_back(static_cast<std::uint16_t>(
          decodeLittleEndian(header.payload, false)));
    }
  }
  return out;
}

Frame statusReply(const std::uint16_t status) {
  Frame reply = statusQueryFrame();
  reply.push_back(static_cast<std::uint8_t>(status & 0xFF));
  reply.push_back(static_cast<std::uint8_t>(status >> 8));
  reply[5] = static_cast<std::uint8_t>(reply.size() - kMbapHeaderSize);
  return reply;
}

}  // namespace

TEST(DriveControllerTests, ShutdownPollsUntilReadyToSwitchOn) {
  Harness h;
  h.device().setAutoStatus(false);
  h.device().queueStatus({0x0620, 0x0621});

  h.controller->setShutdown();

  const auto requests = h.device().requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0], shutdownFrame());
  EXPECT_EQ(h.statusQueries(), 2u);
  EXPECT_EQ(h.clock.sleepCount(), 1u);
  EXPECT_EQ(h.clock.now(), IClock::time_point{1s});
}

TEST(DriveControllerTests, InitWalksPowerStatesInOrder) {
  Harness h;

  h.controller->init();

  EXPECT_EQ(controlWordsSent(h.device()),
            (std::vector<std::uint16_t>{0x0006, 0x0007, 0x000F}));
  EXPECT_EQ(h.statusQueries(), 3u);
  EXPECT_EQ(h.clock.sleepCount(), 0u);
}

TEST(DriveControllerTests, MoveReturnsReachedPositionAndVelocity) {
  Harness h;
  h.controller->init();
  h.device().setMotionPolls(2);
  h.device().clearRequests();

  const auto status = h.controller->move(1000, 500, 200000);

  EXPECT_EQ(status, (dryve::MotionStatus{200000, 0}));
  EXPECT_EQ(h.statusQueries(), 3u);
  const auto& objects = dryveD1ObjectMap();
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.targetPosition, 200000)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.modesOfOperation, 1)), 1u);
  EXPECT_EQ(controlWordsSent(h.device()),
            (std::vector<std::uint16_t>{0x001F, 0x000F, 0x000F}));
  EXPECT_EQ(h.device().requests().back(), enableOperationFrame());
}

TEST(DriveControllerTests, StatusWaitTimesOutAtDeadline) {
  auto settings = testSettings();
  settings.polling.power = PollPolicy{1s, 2s, 0};
  Harness h(settings);
  h.device().setAutoStatus(false);
  h.device().setStatus(0x0250);

  EXPECT_THROW(h.controller->setShutdown(), OperationTimedOut);

  EXPECT_EQ(h.statusQueries(), 3u);
  EXPECT_EQ(h.clock.now(), IClock::time_point{2s});
}

TEST(DriveControllerTests, StatusWaitHonoursAttemptBudget) {
  auto settings = testSettings();
  settings.polling.power = PollPolicy{1s, 1000s, 4};
  Harness h(settings);
  h.device().setAutoStatus(false);

  EXPECT_THROW(h.controller->setShutdown(), OperationTimedOut);
  EXPECT_EQ(h.statusQueries(), 4u);
  EXPECT_EQ(h.clock.sleepCount(), 3u);
}

TEST(DriveControllerTests, ProgressCallbackSeesEachUnsuccessfulPoll) {
  Harness h;
  h.device().setAutoStatus(false);
  h.device().queueStatus({0x0250, 0x0250, 0x0621});
  std::vector<std::uint32_t> attempts;
  std::vector<IClock::duration> elapsed;

  OperationContext context;
  context.onPoll = [&](const PollProgress& progress) {
    attempts.push_back(progress.attempt);
    elapsed.push_back(progress.elapsed);
    EXPECT_EQ(progress.expectation, "ReadyToSwitchOn");
    EXPECT_EQ(statusFromReply(progress.lastReply).raw(), 0x0250);
  };
  h.controller->setShutdown(context);

  EXPECT_EQ(attempts, (std::vector<std::uint32_t>{1, 2}));
  EXPECT_EQ(elapsed, (std::vector<IClock::duration>{0s, 1s}));
}

TEST(DriveControllerTests, CancellationStopsPollingAndKeepsStreamUsable) {
  Harness h;
  h.device().setAutoStatus(false);
  std::stop_source stop;

  OperationContext context;
  context.stop = stop.get_token();
  context.onPoll = [&](const PollProgress&) { stop.request_stop(); };

  EXPECT_THROW(h.controller->setShutdown(context), OperationCancelled);
  EXPECT_EQ(h.statusQueries(), 1u);
  EXPECT_TRUE(h.controller->isOpen());

  h.device().setRegister(dryveD1ObjectMap().positionActualValue, 42);
  EXPECT_EQ(h.controller->getStatus().position, 42);
}

TEST(DriveControllerTests, CancelledContextSendsNothing) {
  Harness h;
  std::stop_source stop;
  stop.request_stop();

  OperationContext context;
  context.stop = stop.get_token();
  EXPECT_THROW(h.controller->init(context), OperationCancelled);
  EXPECT_TRUE(h.device().requests().empty());
}

TEST(DriveControllerTests, UnknownHomingMethodSendsNothing) {
  Harness h;

  EXPECT_THROW(h.controller->setHoming("XYZ", 600, 300, 1000),
               UnknownHomingMethodError);
  EXPECT_TRUE(h.device().requests().empty());
}

TEST(DriveControllerTests, HomingSelectsModeWritesParametersAndWaits) {
  Harness h;
  h.controller->init();
  h.device().setMotionPolls(1);
  h.device().clearRequests();

  h.controller->setHoming("LSN", 600, 300, 1000);

  const auto& objects = dryveD1ObjectMap();
  const auto requests = h.device().requests();
  ASSERT_FALSE(requests.empty());
  EXPECT_EQ(requests.front(), writeFrame(objects.modesOfOperation, 6));
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.homingMethod, 17)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.feedConstantFeed, 6000)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.homingSpeedSearch, 600)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.homingSpeedZero, 300)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.homingAcceleration, 1000)),
            1u);
  EXPECT_EQ(h.statusQueries(), 2u);
  EXPECT_EQ(requests.back(), enableOperationFrame());
}

TEST(DriveControllerTests, LimitSwitchHomingDoesNotWarn) {
  Harness h;
  h.controller->init();
  ScopedLogCapture capture;

  h.controller->setHoming("LSN", 600, 300, 1000);
  h.controller->setHoming("LSP", 600, 300, 1000);

  EXPECT_EQ(capture.sink().countContaining("not been verified"), 0u);
}

TEST(DriveControllerTests, UnverifiedHomingMethodWarnsOncePerMethod) {
  Harness h;
  h.controller->init();
  ScopedLogCapture capture;

  h.controller->setHoming("IEN", 600, 300, 1000);
  h.controller->setHoming("IEN", 600, 300, 1000);
  h.controller->setHoming("SCP", 600, 300, 1000);

  EXPECT_EQ(capture.sink().countContaining("Homing method IEN has not been verified"),
            1u);
  EXPECT_EQ(capture.sink().countContaining("Homing method SCP has not been verified"),
            1u);
}

TEST(DriveControllerTests, HomingUsesConfiguredFeedrate) {
  auto settings = testSettings();
  settings.homingFeedrate = 3000;
  Harness h(settings);
  h.controller->init();

  h.controller->setHoming(dryve::EHomingMethod::SCP, 100, 50, 200);

  const auto& objects = dryveD1ObjectMap();
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.feedConstantFeed, 3000)), 1u);
  EXPECT_EQ(h.device().countRequests(writeFrame(objects.homingMethod, 37)), 1u);
}

TEST(DriveControllerTests, SetModeWaitsForModeDisplay) {
  Harness h;
  h.device().setModeLag(2);

  h.controller->setMode(dryve::EOperationMode::ProfilePosition);

  EXPECT_EQ(h.device().countRequests(
                readFrame(dryveD1ObjectMap().modesOfOperationDisplay)),
            3u);
  EXPECT_EQ(h.clock.sleepCount(), 2u);
}

TEST(DriveControllerTests, SetFeedrateWritesFeedAndApplyOnly) {
  Harness h;

  h.controller->setFeedrate(6000);

  const auto& objects = dryveD1ObjectMap();
  EXPECT_EQ(h.device().requests(),
            (std::vector<Frame>{writeFrame(objects.feedConstantFeed, 6000),
                                writeFrame(objects.feedConstantApply, 1)}));
}

TEST(DriveControllerTests, StaggeredMoveVisitsEveryStepAndGoesBack) {
  Harness h;
  h.controller->init();

  const auto statuses =
      h.controller->staggeredMove(1000, 500, 100, 2, 50, 250ms, true);

  ASSERT_EQ(statuses.size(), 4u);
  EXPECT_EQ(statuses[0].position, 100);
  EXPECT_EQ(statuses[1].position, 150);
  EXPECT_EQ(statuses[2].position, 200);
  EXPECT_EQ(statuses[3].position, 100);
  EXPECT_EQ(h.clock.sleepCount(), 2u);
}

TEST(DriveControllerTests, StaggeredMoveRejectsNegativeIterations) {
  Harness h;

  EXPECT_THROW(
      (void)h.controller->staggeredMove(1000, 500, 0, -1, 10, 0ms, false),
      std::invalid_argument);
  EXPECT_TRUE(h.device().requests().empty());
}

TEST(DriveControllerTests, GetStatusReadsSignedPositionAndVelocity) {
  Harness h;
  const auto& objects = dryveD1ObjectMap();
  h.device().setRegister(objects.positionActualValue, -12345);
  h.device().setRegister(objects.velocityActualValue, 77);

  EXPECT_EQ(h.controller->getStatus(), (dryve::MotionStatus{-12345, 77}));
  EXPECT_EQ(h.device().requests().size(), 2u);
}

TEST(DriveControllerTests, SendCommandReturnsRawReply) {
  Harness h;
  h.device().setStatus(0x0621);

  EXPECT_EQ(h.controller->sendCommand(statusQueryFrame()), statusReply(0x0621));
}

TEST(DriveControllerTests, PeerCloseBecomesConnectionErrorAndClosesStream) {
  Harness h;
  h.fake->failNext(FakeDriveFailure::PeerClose);

  EXPECT_THROW((void)h.controller->getStatus(), ConnectionError);
  EXPECT_FALSE(h.controller->isOpen());
  EXPECT_THROW((void)h.controller->getStatus(), ConnectionError);
}

TEST(DriveControllerTests, ReceiveTimeoutClosesStreamBeforeLateReplyIsRead) {
  Harness h;
  h.fake->failNext(FakeDriveFailure::ReceiveTimeout);

  EXPECT_THROW((void)h.controller->getStatus(), ConnectionError);
  EXPECT_FALSE(h.controller->isOpen());

  // The reply withheld above is now queued; nothing may consume it as the
  // answer to a new request.
  const auto sentBefore = h.device().requests().size();
  EXPECT_THROW((void)h.controller->getStatus(), ConnectionError);
  EXPECT_THROW(h.controller->setShutdown(), ConnectionError);
  EXPECT_EQ(h.device().requests().size(), sentBefore);
}

TEST(DriveControllerTests, LateReplyWouldAnswerTheNextRequest) {
  // Without closing, the fake hands the withheld reply to the next reader.
  FakeDrive drive;
  drive.device().setStatus(0x0621);
  const auto& objects = dryveD1ObjectMap();
  drive.failNext(FakeDriveFailure::ReceiveTimeout);

  ASSERT_TRUE(drive.send(readFrame(objects.positionActualValue)).has_value());
  const auto timedOut = drive.receive(kMbapHeaderSize);
  ASSERT_FALSE(timedOut.has_value());
  EXPECT_EQ(timedOut.error().kind, TransportErrorKind::Timeout);

  ASSERT_TRUE(drive.send(statusQueryFrame()).has_value());
  const auto header = drive.receive(kMbapHeaderSize);
  ASSERT_TRUE(header.has_value());
  const auto body = drive.receive((*header)[kMbapHeaderSize - 1]);
  ASSERT_TRUE(body.has_value());
  Frame stale = *header;
  stale.insert(stale.end(), body->begin(), body->end());
  EXPECT_EQ(parseHeader(stale).objectIndex, objects.positionActualValue.index);
}

TEST(DriveControllerTests, IsOpenIsSafeWhileAnotherThreadCloses) {
  Harness h;
  std::atomic<bool> done{false};

  std::jthread watcher([&] {
    while (!done) {
      (void)h.controller->isOpen();
    }
  });
  for (int i = 0; i < 50; ++i) {
    (void)h.controller->getStatus();
  }
  h.controller->close();
  done = true;
  watcher.join();

  EXPECT_FALSE(h.controller->isOpen());
}

TEST(DriveControllerTests, SendFailureBecomesConnectionError) {
  Harness h;
  h.fake->failNext(FakeDriveFailure::SendIo);

  EXPECT_THROW(h.controller->setFeedrate(10), ConnectionError);
}

TEST(DriveControllerTests, ReplyForAnotherObjectIsMalformed) {
  Harness h;
  h.device().setAutoStatus(false);
  h.fake->overrideNextReply(writeFrame(dryveD1ObjectMap().targetPosition, 5));

  EXPECT_THROW(h.controller->setShutdown(), MalformedReplyError);
}

TEST(DriveControllerTests, ExceptionReplyIsMalformed) {
  Harness h;
  h.fake->overrideNextReply(Frame{0, 0, 0, 0, 0, 3, 0, 0xAB, 0x01});

  EXPECT_THROW(h.controller->setFeedrate(10), MalformedReplyError);
}

TEST(DriveControllerTests, OversizedReplyIsDrainedAndRejected) {
  Harness h;
  Frame oversized(kMbapHeaderSize + 30, 0);
  oversized[5] = 30;
  h.fake->overrideNextReply(oversized);

  EXPECT_THROW((void)h.controller->sendCommand(statusQueryFrame()),
               MalformedReplyError);
  h.device().setStatus(0x0621);
  EXPECT_EQ(h.controller->sendCommand(statusQueryFrame()), statusReply(0x0621));
}

TEST(DriveControllerTests, CloseMakesFurtherOperationsFail) {
  Harness h;

  h.controller->close();

  EXPECT_FALSE(h.controller->isOpen());
  EXPECT_THROW((void)h.controller->getStatus(), ConnectionError);
  EXPECT_TRUE(h.device().requests().empty());
}
