#pragma once

#include <DriveObjectMap.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

// dryve D1 object map taken from the igus "dryve D1 Modbus TCP gateway"
// manual (CiA 402 object dictionary subset used by this driver).
const DriveObjectMap& dryveD1ObjectMap();

struct DryveObjectEntry {
  std::uint16_t index;
  std::uint8_t subIndex;
  std::string_view name;
};

// Object names as listed in the dryve D1 manual, sorted by (index, sub).
std::span<const DryveObjectEntry> dryveD1ObjectDictionary();

std::optional<std::string_view> dryveObjectName(std::uint16_t index,
                                                std::uint8_t subIndex);
