#include <DryveD1ObjectMap.hpp>

#include <algorithm>
#include <array>
#include <tuple>

namespace {
constexpr std::array<DryveObjectEntry, 44> kObjects{{
    DryveObjectEntry{0x1000, 0, "Device type"},
    DryveObjectEntry{0x1001, 0, "Error register"},
    DryveObjectEntry{0x1008, 0, "Manufacturer device name"},
    DryveObjectEntry{0x1009, 0, "Manufacturer hardware version"},
    DryveObjectEntry{0x100A, 0, "Manufacturer software version"},
    DryveObjectEntry{0x1018, 1, "Identity object: vendor id"},
    DryveObjectEntry{0x1018, 2, "Identity object: product code"},
    DryveObjectEntry{0x1018, 3, "Identity object: revision number"},
    DryveObjectEntry{0x1018, 4, "Identity object: serial number"},
    DryveObjectEntry{0x603F, 0, "Error code"},
    DryveObjectEntry{0x6040, 0, "Controlword"},
    DryveObjectEntry{0x6041, 0, "Statusword"},
    DryveObjectEntry{0x605A, 0, "Quick stop option code"},
    DryveObjectEntry{0x6060, 0, "Modes of operation"},
    DryveObjectEntry{0x6061, 0, "Modes of operation display"},
    DryveObjectEntry{0x6062, 0, "Position demand value"},
    DryveObjectEntry{0x6063, 0, "Position actual internal value"},
    DryveObjectEntry{0x6064, 0, "Position actual value"},
    DryveObjectEntry{0x6065, 0, "Following error window"},
    DryveObjectEntry{0x6066, 0, "Following error time out"},
    DryveObjectEntry{0x6067, 0, "Position window"},
    DryveObjectEntry{0x6068, 0, "Position window time"},
    DryveObjectEntry{0x606B, 0, "Velocity demand value"},
    DryveObjectEntry{0x606C, 0, "Velocity actual value"},
    DryveObjectEntry{0x6071, 0, "Target torque"},
    DryveObjectEntry{0x6077, 0, "Torque actual value"},
    DryveObjectEntry{0x6078, 0, "Current actual value"},
    DryveObjectEntry{0x607A, 0, "Target position"},
    DryveObjectEntry{0x607C, 0, "Home offset"},
    DryveObjectEntry{0x607D, 1, "Software position limit: min"},
    DryveObjectEntry{0x607D, 2, "Software position limit: max"},
    DryveObjectEntry{0x6081, 0, "Profile velocity"},
    DryveObjectEntry{0x6083, 0, "Profile acceleration"},
    DryveObjectEntry{0x6084, 0, "Profile deceleration"},
    DryveObjectEntry{0x6085, 0, "Quick stop deceleration"},
    DryveObjectEntry{0x6092, 1, "Feed constant: feed"},
    DryveObjectEntry{0x6092, 2, "Feed constant: shaft revolutions"},
    DryveObjectEntry{0x6098, 0, "Homing method"},
    DryveObjectEntry{0x6098, 1, "Homing method (gateway)"},
    DryveObjectEntry{0x6099, 1, "Homing speeds: switch search"},
    DryveObjectEntry{0x6099, 2, "Homing speeds: zero search"},
    DryveObjectEntry{0x609A, 0, "Homing acceleration"},
    DryveObjectEntry{0x60F4, 0, "Following error actual value"},
    DryveObjectEntry{0x60FF, 0, "Target velocity"},
}};

constexpr auto kKey = [](const DryveObjectEntry& entry) {
  return std::tuple{entry.index, entry.subIndex};
};
}  // namespace

const DriveObjectMap& dryveD1ObjectMap() {
  static const DriveObjectMap map{};
  return map;
}

std::span<const DryveObjectEntry> dryveD1ObjectDictionary() {
  return kObjects;
}

std::optional<std::string_view> dryveObjectName(const std::uint16_t index,
                                                const std::uint8_t subIndex) {
  const auto key = std::tuple{index, subIndex};
  const auto it = std::lower_bound(
      kObjects.begin(), kObjects.end(), key,
      [](const DryveObjectEntry& entry, const auto& k) { return kKey(entry) < k; });
  if (it == kObjects.end() || kKey(*it) != key) {
    return std::nullopt;
  }
  return it->name;
}
