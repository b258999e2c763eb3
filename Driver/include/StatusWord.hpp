#pragma once

#include <CommonDefinitions.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// CiA 402 statusword (object 0x6041) bits as reported by the dryve D1.
enum class StatusFlag : std::uint16_t {
  ReadyToSwitchOn = 1u << 0,
  SwitchedOn = 1u << 1,
  OperationEnabled = 1u << 2,
  Fault = 1u << 3,
  VoltageEnabled = 1u << 4,
  QuickStop = 1u << 5,
  SwitchOnDisabled = 1u << 6,
  Warning = 1u << 7,
  ManufacturerSpecific8 = 1u << 8,
  Remote = 1u << 9,
  TargetReached = 1u << 10,
  InternalLimitActive = 1u << 11,
  // Profile position: set-point acknowledge, homing: homing attained
  OperationModeSpecific12 = 1u << 12,
  // Profile position: following error, homing: homing error
  OperationModeSpecific13 = 1u << 13,
  ManufacturerSpecific14 = 1u << 14,
  ManufacturerSpecific15 = 1u << 15,
};

class StatusWord {
 public:
  constexpr StatusWord() = default;
  explicit constexpr StatusWord(const std::uint16_t raw) : _raw(raw) {}

  [[nodiscard]] static constexpr StatusWord fromRaw(const std::uint16_t raw) {
    return StatusWord{raw};
  }

  [[nodiscard]] constexpr std::uint16_t raw() const { return _raw; }
  [[nodiscard]] constexpr bool isSet(const StatusFlag flag) const {
    return (_raw & static_cast<std::uint16_t>(flag)) != 0;
  }

  [[nodiscard]] constexpr bool readyToSwitchOn() const {
    return isSet(StatusFlag::ReadyToSwitchOn);
  }
  [[nodiscard]] constexpr bool switchedOn() const {
    return isSet(StatusFlag::SwitchedOn);
  }
  [[nodiscard]] constexpr bool operationEnabled() const {
    return isSet(StatusFlag::OperationEnabled);
  }
  [[nodiscard]] constexpr bool fault() const { return isSet(StatusFlag::Fault); }
  [[nodiscard]] constexpr bool remote() const { return isSet(StatusFlag::Remote); }
  [[nodiscard]] constexpr bool targetReached() const {
    return isSet(StatusFlag::TargetReached);
  }
  [[nodiscard]] constexpr bool homingAttained() const {
    return isSet(StatusFlag::OperationModeSpecific12);
  }

  [[nodiscard]] std::vector<std::string_view> activeFlags() const;
  // "0x0627 [RTSO SO OE QS REMOTE TR]"
  [[nodiscard]] std::string describe() const;

 private:
  std::uint16_t _raw{0};
};

// Unsigned 2-byte status word at the payload offset of a status reply.
[[nodiscard]] StatusWord statusFromReply(std::span<const std::uint8_t> reply);

// Each predicate accepts exactly the statusword values the dryve D1 reports
// for that condition:
//   ReadyToSwitchOn  0x0221, 0x0621, 0x1621
//   SwitchedOn       0x0223, 0x0623, 0x1623
//   OperationEnabled 0x0227, 0x0627, 0x1627
//   homing complete  0x1627
//   target reached   0x0627
[[nodiscard]] bool isInPowerPhase(StatusWord status, dryve::EPowerPhase phase);
[[nodiscard]] bool isHomingComplete(StatusWord status);
[[nodiscard]] bool isTargetReached(StatusWord status);
