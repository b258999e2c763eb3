#include <gtest/gtest.h>

#include <DriveErrors.hpp>
#include <DryveD1ObjectMap.hpp>
#include <FrameCodec.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace {
Frame readReplyWith(const ObjectAddress& object,
                    const std::vector<std::uint8_t>& payload) {
  Frame reply = readFrame(object);
  reply.insert(reply.end(), payload.begin(), payload.end());
  reply[5] = static_cast<std::uint8_t>(reply.size() - kMbapHeaderSize);
  return reply;
}
}  // namespace

TEST(FrameCodecTests, ShutdownFrameMatchesGenericWriteFrame) {
  const std::array<std::uint8_t, 2> payload{0x06, 0x00};
  EXPECT_EQ(buildFrame(AccessMode::Write, {0x60, 0x40}, 0, 2, payload),
            shutdownFrame());
}

TEST(FrameCodecTests, StatusQueryHasExactWireLayout) {
  const Frame expected{0, 0, 0, 0, 0, 13, 0, 43, 13, 0,
                       0, 0, 0x60, 0x41, 0, 0, 0, 0, 2};
  EXPECT_EQ(statusQueryFrame(), expected);
}

TEST(FrameCodecTests, CannedControlWordFramesCarryTheirCommand) {
  EXPECT_EQ(switchOnFrame().back(), 0x00);
  EXPECT_EQ(switchOnFrame()[kPayloadOffset], 0x07);
  EXPECT_EQ(enableOperationFrame()[kPayloadOffset], 0x0F);
  EXPECT_EQ(startMotionFrame()[kPayloadOffset], 0x1F);
  EXPECT_EQ(enableOperationFrame(),
            controlWordFrame(ControlCommand::EnableOperation));
}

TEST(FrameCodecTests, LengthByteMatchesFrameSizeForEveryByteCount) {
  for (std::uint8_t count = 0; count <= kMaxPayloadSize; ++count) {
    const std::vector<std::uint8_t> payload(count, 0xAB);
    const auto write = buildFrame(AccessMode::Write, {0x60, 0x7A}, 0, count, payload);
    const auto read = buildFrame(AccessMode::Read, {0x60, 0x7A}, 0, count);

    EXPECT_EQ(write.size(), kPayloadOffset + count);
    EXPECT_EQ(write[5], write.size() - 6);
    EXPECT_EQ(read.size(), kPayloadOffset);
    EXPECT_EQ(read[5], read.size() - 6);
    EXPECT_LE(write.size(), kMaxFrameSize);
  }
}

TEST(FrameCodecTests, ParsedHeaderReproducesBuildInputs) {
  const std::array<std::uint8_t, 3> payload{1, 2, 3};
  const auto frame = buildFrame(AccessMode::Write, {0x60, 0x99}, 2, 3, payload);

  const auto header = parseHeader(frame);
  EXPECT_EQ(header.mode, AccessMode::Write);
  EXPECT_EQ(header.objectIndex, 0x6099);
  EXPECT_EQ(header.subIndex, 2);
  EXPECT_EQ(header.byteCount, 3);
  ASSERT_EQ(header.payload.size(), 3u);
  EXPECT_EQ(header.payload[2], 3);
}

TEST(FrameCodecTests, BuildRejectsInconsistentInputs) {
  const std::array<std::uint8_t, 2> two{1, 2};
  const std::array<std::uint8_t, 5> five{1, 2, 3, 4, 5};

  EXPECT_THROW((void)buildFrame(AccessMode::Write, {0x60, 0x40}, 0, 3, two),
               InvalidFrameError);
  EXPECT_THROW((void)buildFrame(AccessMode::Write, {0x60, 0x40}, 0, 5, five),
               InvalidFrameError);
  EXPECT_THROW((void)buildFrame(AccessMode::Read, {0x60, 0x41}, 0, 2, two),
               InvalidFrameError);
}

TEST(FrameCodecTests, WriteFrameRejectsValuesWiderThanRegister) {
  EXPECT_THROW((void)writeFrame(dryveD1ObjectMap().feedConstantFeed, 70000),
               InvalidFrameError);
  EXPECT_NO_THROW((void)writeFrame(dryveD1ObjectMap().feedConstantFeed, 65535));
}

TEST(FrameCodecTests, FourByteFieldRoundTripsUnsignedAndSigned) {
  const auto object = dryveD1ObjectMap().targetPosition;

  const auto positive = readReplyWith(object, encodeLittleEndian(50000, 4));
  EXPECT_EQ(decodeRegister(positive, 4), 50000);

  const auto negative = readReplyWith(object, encodeLittleEndian(-12345, 4));
  EXPECT_EQ(decodeRegister(negative, 4), -12345);
}

TEST(FrameCodecTests, LittleEndianEncodingPutsLowByteFirst) {
  EXPECT_EQ(encodeLittleEndian(6000, 2), (std::vector<std::uint8_t>{0x70, 0x17}));
  EXPECT_EQ(encodeLittleEndian(-1, 4),
            (std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF, 0xFF}));
  const std::array<std::uint8_t, 2> raw{0x27, 0x16};
  EXPECT_EQ(decodeLittleEndian(raw, false), 0x1627);
}

TEST(FrameCodecTests, DecodeRegisterRejectsShortRepliesAndBadWidths) {
  const auto reply = readReplyWith(dryveD1ObjectMap().statusWord, {0x27});

  EXPECT_THROW((void)decodeRegister(reply, 2), MalformedReplyError);
  EXPECT_THROW((void)decodeRegister(reply, 0), InvalidFrameError);
  EXPECT_THROW((void)decodeRegister(reply, 5), InvalidFrameError);
}

TEST(FrameCodecTests, ParseHeaderRejectsForeignFrames) {
  auto frame = statusQueryFrame();
  frame[7] = 3;
  EXPECT_THROW((void)parseHeader(frame), MalformedReplyError);

  auto wrongLength = statusQueryFrame();
  wrongLength[5] = 20;
  EXPECT_THROW((void)parseHeader(wrongLength), MalformedReplyError);

  const Frame tooShort{0, 0, 0, 0, 0, 3, 0, 43, 13};
  EXPECT_THROW((void)parseHeader(tooShort), MalformedReplyError);
}

TEST(FrameCodecTests, ExceptionResponseIsReportedAsMalformedReply) {
  const Frame exception{0, 0, 0, 0, 0, 3, 0, 0xAB, 0x02};
  try {
    (void)parseHeader(exception);
    FAIL() << "expected MalformedReplyError";
  } catch (const MalformedReplyError& e) {
    EXPECT_NE(std::string(e.what()).find("0x02"), std::string::npos);
  }
}

TEST(FrameCodecTests, EchoCheckComparesObjectAndAccessMode) {
  const auto query = statusQueryFrame();
  const auto reply = readReplyWith(dryveD1ObjectMap().statusWord, {0x21, 0x06});
  EXPECT_NO_THROW(expectEcho(query, reply));

  const auto other = readReplyWith(dryveD1ObjectMap().modesOfOperationDisplay, {1});
  EXPECT_THROW(expectEcho(query, other), MalformedReplyError);
  EXPECT_THROW(expectEcho(shutdownFrame(), reply), MalformedReplyError);
}

TEST(FrameCodecTests, DescribeFrameNamesKnownObjects) {
  EXPECT_EQ(describeFrame(shutdownFrame()), "Write 0x6040/0 (Controlword) = 06 00");
  EXPECT_EQ(describeFrame(statusQueryFrame()),
            "Read 0x6041/0 (Statusword) [2 bytes]");
  const Frame garbage{1, 2, 3};
  EXPECT_EQ(describeFrame(garbage), "raw [01 02 03]");
}
