#pragma once

#include <cstdint>

#include <magic_enum/magic_enum.hpp>

namespace dryve {
// Homing methods supported by the dryve D1 (object 0x6098).
enum class EHomingMethod : std::uint8_t {
  LSN = 17,   // limit switch negative
  LSP = 18,   // limit switch positive
  IEN = 33,   // index pulse, negative direction
  IEP = 34,   // index pulse, positive direction
  SCP = 37,   // set current position as home
  AAF = 255,  // absolute encoder, no motion
};

// Modes of operation (object 0x6060).
enum class EOperationMode : std::int8_t {
  ProfilePosition = 1,
  Homing = 6,
};

enum class EPowerPhase { ReadyToSwitchOn, SwitchedOn, OperationEnabled };

struct MotionStatus {
  std::int32_t position{0};
  std::int32_t velocity{0};

  friend bool operator==(const MotionStatus&, const MotionStatus&) = default;
};

}  // namespace dryve

// Homing codes go up to 255, outside magic_enum's default reflection range.
template <>
struct magic_enum::customize::enum_range<dryve::EHomingMethod> {
  static constexpr int min = 0;
  static constexpr int max = 255;
};
