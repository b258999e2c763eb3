#include <StatusWord.hpp>

#include <DriveErrors.hpp>
#include <FrameCodec.hpp>

#include <array>
#include <format>
#include <utility>

namespace {
constexpr std::array<std::pair<StatusFlag, std::string_view>, 16> kStatusFlags{{
    {StatusFlag::ReadyToSwitchOn, "RTSO"},
    {StatusFlag::SwitchedOn, "SO"},
    {StatusFlag::OperationEnabled, "OE"},
    {StatusFlag::Fault, "FAULT"},
    {StatusFlag::VoltageEnabled, "VE"},
    {StatusFlag::QuickStop, "QS"},
    {StatusFlag::SwitchOnDisabled, "SOD"},
    {StatusFlag::Warning, "WARN"},
    {StatusFlag::ManufacturerSpecific8, "MS8"},
    {StatusFlag::Remote, "REMOTE"},
    {StatusFlag::TargetReached, "TR"},
    {StatusFlag::InternalLimitActive, "ILA"},
    {StatusFlag::OperationModeSpecific12, "OMS12"},
    {StatusFlag::OperationModeSpecific13, "OMS13"},
    {StatusFlag::ManufacturerSpecific14, "MS14"},
    {StatusFlag::ManufacturerSpecific15, "MS15"},
}};

// Lower byte: the power state bits. The drive never raises voltage-enabled,
// switch-on-disabled, fault or warning while it is in one of the accepted
// states, and always keeps quick-stop high.
bool powerBitsMatch(const StatusWord status, const bool switchedOn,
                    const bool operationEnabled) {
  return status.readyToSwitchOn() && status.switchedOn() == switchedOn &&
         status.operationEnabled() == operationEnabled && !status.fault() &&
         !status.isSet(StatusFlag::VoltageEnabled) &&
         status.isSet(StatusFlag::QuickStop) &&
         !status.isSet(StatusFlag::SwitchOnDisabled) &&
         !status.isSet(StatusFlag::Warning);
}

// Upper byte: remote is always set; bit 12 only ever appears together with
// target-reached; every other bit must be clear.
bool upperBitsMatch(const StatusWord status) {
  return status.remote() && !status.isSet(StatusFlag::ManufacturerSpecific8) &&
         !status.isSet(StatusFlag::InternalLimitActive) &&
         !status.isSet(StatusFlag::OperationModeSpecific13) &&
         !status.isSet(StatusFlag::ManufacturerSpecific14) &&
         !status.isSet(StatusFlag::ManufacturerSpecific15) &&
         (!status.homingAttained() || status.targetReached());
}
}  // namespace

StatusWord statusFromReply(const std::span<const std::uint8_t> reply) {
  if (reply.size() < kPayloadOffset + 2) {
    throw MalformedReplyError(std::format(
        "Statusword reply of {} bytes is too short ({})", reply.size(),
        toHex(reply)));
  }
  return StatusWord{static_cast<std::uint16_t>(
      decodeLittleEndian(reply.subspan(kPayloadOffset, 2), false))};
}

std::vector<std::string_view> StatusWord::activeFlags() const {
  std::vector<std::string_view> out;
  for (const auto& [flag, name] : kStatusFlags) {
    if (isSet(flag)) {
      out.emplace_back(name);
    }
  }
  return out;
}

std::string StatusWord::describe() const {
  std::string out = std::format("0x{:04X} [", _raw);
  bool first = true;
  for (const auto name : activeFlags()) {
    if (!first) {
      out += ' ';
    }
    out += name;
    first = false;
  }
  out += ']';
  return out;
}

bool isInPowerPhase(const StatusWord status, const dryve::EPowerPhase phase) {
  if (!upperBitsMatch(status)) {
    return false;
  }
  switch (phase) {
    case dryve::EPowerPhase::ReadyToSwitchOn:
      return powerBitsMatch(status, false, false);
    case dryve::EPowerPhase::SwitchedOn:
      return powerBitsMatch(status, true, false);
    case dryve::EPowerPhase::OperationEnabled:
      return powerBitsMatch(status, true, true);
  }
  return false;
}

bool isHomingComplete(const StatusWord status) {
  return isInPowerPhase(status, dryve::EPowerPhase::OperationEnabled) &&
         status.targetReached() && status.homingAttained();
}

bool isTargetReached(const StatusWord status) {
  return isInPowerPhase(status, dryve::EPowerPhase::OperationEnabled) &&
         status.targetReached() && !status.homingAttained();
}
