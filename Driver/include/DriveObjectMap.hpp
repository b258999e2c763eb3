#pragma once

#include <cstdint>

// Object dictionary address: 16-bit object index, 8-bit sub-index and the
// number of data bytes the register carries on the wire.
struct ObjectAddress {
  std::uint16_t index{0};
  std::uint8_t subIndex{0};
  std::uint8_t width{0};

  [[nodiscard]] constexpr std::uint8_t indexHigh() const {
    return static_cast<std::uint8_t>(index >> 8);
  }
  [[nodiscard]] constexpr std::uint8_t indexLow() const {
    return static_cast<std::uint8_t>(index & 0xFFu);
  }

  friend constexpr bool operator==(const ObjectAddress&,
                                   const ObjectAddress&) = default;
};

struct DriveObjectMap {
  // 16-bit power state machine registers
  ObjectAddress controlWord{0x6040, 0, 2};
  ObjectAddress statusWord{0x6041, 0, 2};

  // 8-bit mode selection and its read-back
  ObjectAddress modesOfOperation{0x6060, 0, 1};
  ObjectAddress modesOfOperationDisplay{0x6061, 0, 1};

  // 32-bit monitor values (signed)
  ObjectAddress positionActualValue{0x6064, 0, 4};
  ObjectAddress velocityActualValue{0x606C, 0, 4};

  // Profile position parameters (32-bit)
  ObjectAddress targetPosition{0x607A, 0, 4};
  ObjectAddress profileVelocity{0x6081, 0, 4};
  ObjectAddress profileAcceleration{0x6083, 0, 4};

  // Feed constant: feed is 16-bit, sub 2 is written with 1 to apply it.
  ObjectAddress feedConstantFeed{0x6092, 1, 2};
  ObjectAddress feedConstantApply{0x6092, 2, 1};

  // Homing parameters
  ObjectAddress homingMethod{0x6098, 1, 1};
  ObjectAddress homingSpeedSearch{0x6099, 1, 2};
  ObjectAddress homingSpeedZero{0x6099, 2, 2};
  ObjectAddress homingAcceleration{0x609A, 0, 2};
};
