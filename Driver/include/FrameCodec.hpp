#pragma once

#include <DriveObjectMap.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Modbus TCP "encapsulated interface transport" frames (function 43, MEI
// type 13) as used by the dryve D1 gateway to access its object dictionary.
//
// offset  size  field
// 0-1     2     transaction id (always 0)
// 2-3     2     protocol id (always 0)
// 4       1     reserved
// 5       1     remaining length = total length - 6
// 6       1     reserved (unit id)
// 7       1     function code 43
// 8       1     MEI type 13
// 9       1     0 = read, 1 = write
// 10-11   2     reserved
// 12-13   2     object index, high byte first
// 14      1     sub-index
// 15-17   3     reserved
// 18      1     data byte count (0-4)
// 19-22   0-4   little-endian payload

using Frame = std::vector<std::uint8_t>;

enum class AccessMode : std::uint8_t {
  Read = 0,
  Write = 1,
};

enum class ControlCommand : std::uint16_t {
  Shutdown = 0x0006,
  SwitchOn = 0x0007,
  EnableOperation = 0x000F,
  // EnableOperation with the "new set-point / start" bit 4 raised
  StartMotion = 0x001F,
};

inline constexpr std::size_t kMbapHeaderSize = 6;
inline constexpr std::size_t kPayloadOffset = 19;
inline constexpr std::size_t kMaxPayloadSize = 4;
inline constexpr std::size_t kMaxFrameSize = 24;
inline constexpr std::uint8_t kFunctionCode = 43;
inline constexpr std::uint8_t kExceptionFunctionCode = kFunctionCode | 0x80u;
inline constexpr std::uint8_t kMeiType = 13;

struct FrameHeader {
  AccessMode mode{AccessMode::Read};
  std::uint16_t objectIndex{0};
  std::uint8_t subIndex{0};
  std::uint8_t byteCount{0};
  std::span<const std::uint8_t> payload{};
};

// Builds a request frame. `address` is the object index as (high, low) byte
// pair. Write frames must carry exactly `byteCount` payload bytes, read frames
// none. Throws InvalidFrameError otherwise.
[[nodiscard]] Frame buildFrame(AccessMode mode,
                               std::array<std::uint8_t, 2> address,
                               std::uint8_t subIndex, std::uint8_t byteCount,
                               std::span<const std::uint8_t> payload = {});

[[nodiscard]] Frame readFrame(const ObjectAddress& object);
// Packs `value` little-endian into the object's register width.
[[nodiscard]] Frame writeFrame(const ObjectAddress& object, std::int64_t value);

[[nodiscard]] Frame controlWordFrame(ControlCommand command);
[[nodiscard]] Frame statusQueryFrame();
[[nodiscard]] Frame shutdownFrame();
[[nodiscard]] Frame switchOnFrame();
[[nodiscard]] Frame enableOperationFrame();
[[nodiscard]] Frame startMotionFrame();

[[nodiscard]] std::vector<std::uint8_t> encodeLittleEndian(std::int64_t value,
                                                           std::size_t width);
[[nodiscard]] std::int64_t decodeLittleEndian(std::span<const std::uint8_t> bytes,
                                              bool isSigned = true);

// Throws MalformedReplyError for short or foreign frames and for Modbus
// exception responses.
[[nodiscard]] FrameHeader parseHeader(std::span<const std::uint8_t> frame);

// Signed little-endian value of `width` bytes at the payload offset.
[[nodiscard]] std::int64_t decodeRegister(std::span<const std::uint8_t> reply,
                                          std::size_t width);

// Reply must address the same object, sub-index and access mode as the request.
void expectEcho(std::span<const std::uint8_t> request,
                std::span<const std::uint8_t> reply);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::string describeFrame(std::span<const std::uint8_t> frame);
