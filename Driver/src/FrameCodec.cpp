#include <FrameCodec.hpp>

#include <DriveErrors.hpp>
#include <DryveD1ObjectMap.hpp>
#include <magic_enum/magic_enum.hpp>

#include <format>

namespace {
constexpr std::size_t kLengthOffset = 5;
constexpr std::size_t kFunctionOffset = 7;
constexpr std::size_t kMeiOffset = 8;
constexpr std::size_t kModeOffset = 9;
constexpr std::size_t kIndexHighOffset = 12;
constexpr std::size_t kIndexLowOffset = 13;
constexpr std::size_t kSubIndexOffset = 14;
constexpr std::size_t kByteCountOffset = 18;

std::string objectLabel(const std::uint16_t index, const std::uint8_t subIndex) {
  const auto name = dryveObjectName(index, subIndex);
  if (name) {
    return std::format("0x{:04X}/{} ({})", index, subIndex, *name);
  }
  return std::format("0x{:04X}/{}", index, subIndex);
}

void validateWidth(const std::size_t width) {
  if (width < 1 || width > kMaxPayloadSize) {
    throw InvalidFrameError(
        std::format("Register width must be 1..{} bytes (got {})",
                    kMaxPayloadSize, width));
  }
}
}  // namespace

Frame buildFrame(const AccessMode mode, const std::array<std::uint8_t, 2> address,
                 const std::uint8_t subIndex, const std::uint8_t byteCount,
                 const std::span<const std::uint8_t> payload) {
  if (byteCount > kMaxPayloadSize) {
    throw InvalidFrameError(std::format(
        "Data byte count must be 0..{} (got {})", kMaxPayloadSize, byteCount));
  }
  if (mode == AccessMode::Read && !payload.empty()) {
    throw InvalidFrameError(std::format(
        "Read frame for 0x{:02X}{:02X}/{} must not carry payload ({} bytes given)",
        address[0], address[1], subIndex, payload.size()));
  }
  if (mode == AccessMode::Write && payload.size() != byteCount) {
    throw InvalidFrameError(std::format(
        "Write frame for 0x{:02X}{:02X}/{} declares {} data bytes but carries {}",
        address[0], address[1], subIndex, byteCount, payload.size()));
  }

  Frame frame{0, 0,
              0, 0,
              0,
              0,
              0, kFunctionCode, kMeiType,
              static_cast<std::uint8_t>(mode),
              0, 0,
              address[0], address[1],
              subIndex,
              0, 0, 0,
              byteCount};
  frame.insert(frame.end(), payload.begin(), payload.end());
  frame[kLengthOffset] = static_cast<std::uint8_t>(frame.size() - kMbapHeaderSize);
  return frame;
}

Frame readFrame(const ObjectAddress& object) {
  return buildFrame(AccessMode::Read, {object.indexHigh(), object.indexLow()},
                    object.subIndex, object.width);
}

Frame writeFrame(const ObjectAddress& object, const std::int64_t value) {
  const auto payload = encodeLittleEndian(value, object.width);
  return buildFrame(AccessMode::Write, {object.indexHigh(), object.indexLow()},
                    object.subIndex, object.width, payload);
}

Frame controlWordFrame(const ControlCommand command) {
  return writeFrame(dryveD1ObjectMap().controlWord,
                    static_cast<std::int64_t>(command));
}

Frame statusQueryFrame() { return readFrame(dryveD1ObjectMap().statusWord); }

Frame shutdownFrame() { return controlWordFrame(ControlCommand::Shutdown); }

Frame switchOnFrame() { return controlWordFrame(ControlCommand::SwitchOn); }

Frame enableOperationFrame() {
  return controlWordFrame(ControlCommand::EnableOperation);
}

Frame startMotionFrame() { return controlWordFrame(ControlCommand::StartMotion); }

std::vector<std::uint8_t> encodeLittleEndian(const std::int64_t value,
                                             const std::size_t width) {
  validateWidth(width);
  const auto bits = static_cast<int>(width * 8);
  const std::int64_t minValue = -(std::int64_t{1} << (bits - 1));
  const std::int64_t maxValue = (std::int64_t{1} << bits) - 1;
  if (value < minValue || value > maxValue) {
    throw InvalidFrameError(std::format(
        "Value {} does not fit into a {}-byte register", value, width));
  }

  const auto raw = static_cast<std::uint64_t>(value);
  std::vector<std::uint8_t> bytes(width);
  for (std::size_t i = 0; i < width; ++i) {
    bytes[i] = static_cast<std::uint8_t>((raw >> (8 * i)) & 0xFFu);
  }
  return bytes;
}

std::int64_t decodeLittleEndian(const std::span<const std::uint8_t> bytes,
                                const bool isSigned) {
  validateWidth(bytes.size());
  std::uint64_t raw = 0;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    raw |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
  }
  const auto bits = bytes.size() * 8;
  const auto signBit = std::uint64_t{1} << (bits - 1);
  if (isSigned && (raw & signBit) != 0) {
    return static_cast<std::int64_t>(raw) - (std::int64_t{1} << bits);
  }
  return static_cast<std::int64_t>(raw);
}

FrameHeader parseHeader(const std::span<const std::uint8_t> frame) {
  if (frame.size() > kFunctionOffset + 1 &&
      frame[kFunctionOffset] == kExceptionFunctionCode) {
    throw MalformedReplyError(std::format(
        "Device answered with Modbus exception code 0x{:02X}",
        frame[kFunctionOffset + 1]));
  }
  if (frame.size() < kPayloadOffset) {
    throw MalformedReplyError(std::format(
        "Frame too short: {} bytes, expected at least {} ({})", frame.size(),
        kPayloadOffset, toHex(frame)));
  }
  if (static_cast<std::size_t>(frame[kLengthOffset]) !=
      frame.size() - kMbapHeaderSize) {
    throw MalformedReplyError(std::format(
        "Frame length byte {} does not match frame size {}",
        frame[kLengthOffset], frame.size()));
  }
  if (frame[kFunctionOffset] != kFunctionCode || frame[kMeiOffset] != kMeiType) {
    throw MalformedReplyError(std::format(
        "Unexpected function/MEI type {}/{} (expected {}/{})",
        frame[kFunctionOffset], frame[kMeiOffset], kFunctionCode, kMeiType));
  }
  const auto mode = magic_enum::enum_cast<AccessMode>(frame[kModeOffset]);
  if (!mode.has_value()) {
    throw MalformedReplyError(
        std::format("Unknown read/write flag {}", frame[kModeOffset]));
  }

  FrameHeader header;
  header.mode = *mode;
  header.objectIndex = static_cast<std::uint16_t>(
      (static_cast<std::uint16_t>(frame[kIndexHighOffset]) << 8) |
      frame[kIndexLowOffset]);
  header.subIndex = frame[kSubIndexOffset];
  header.byteCount = frame[kByteCountOffset];
  header.payload = frame.subspan(kPayloadOffset);
  return header;
}

std::int64_t decodeRegister(const std::span<const std::uint8_t> reply,
                            const std::size_t width) {
  validateWidth(width);
  if (reply.size() < kPayloadOffset + width) {
    throw MalformedReplyError(std::format(
        "Reply of {} bytes is too short for a {}-byte register ({})",
        reply.size(), width, toHex(reply)));
  }
  return decodeLittleEndian(reply.subspan(kPayloadOffset, width));
}

void expectEcho(const std::span<const std::uint8_t> request,
                const std::span<const std::uint8_t> reply) {
  const auto sent = parseHeader(request);
  const auto received = parseHeader(reply);
  if (sent.objectIndex != received.objectIndex ||
      sent.subIndex != received.subIndex || sent.mode != received.mode) {
    throw MalformedReplyError(std::format(
        "Reply {} {} does not echo request {} {}",
        magic_enum::enum_name(received.mode),
        objectLabel(received.objectIndex, received.subIndex),
        magic_enum::enum_name(sent.mode),
        objectLabel(sent.objectIndex, sent.subIndex)));
  }
}

std::string toHex(const std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i != 0) {
      out += ' ';
    }
    out += std::format("{:02X}", bytes[i]);
  }
  return out;
}

std::string describeFrame(const std::span<const std::uint8_t> frame) {
  try {
    const auto header = parseHeader(frame);
    if (header.payload.empty()) {
      return std::format("{} {} [{} bytes]", magic_enum::enum_name(header.mode),
                         objectLabel(header.objectIndex, header.subIndex),
                         header.byteCount);
    }
    return std::format("{} {} = {}", magic_enum::enum_name(header.mode),
                       objectLabel(header.objectIndex, header.subIndex),
                       toHex(header.payload));
  } catch (const MalformedReplyError&) {
    return std::format("raw [{}]", toHex(frame));
  }
}
