#pragma once

#include <yaml-cpp/yaml.h>

#include <magic_enum/magic_enum.hpp>
#include <string>
#include <type_traits>

#include "CommonDefinitions.hpp"

namespace YAML {

// Generic enum converter, enums are written by name
template <typename T>
struct convert_enum {
  static_assert(std::is_enum_v<T>, "convert_enum<T> requires an enum type");

  static Node encode(const T& rhs) {
    return Node(std::string(magic_enum::enum_name(rhs)));
  }

  static bool decode(const Node& node, T& rhs) {
    if (!node.IsScalar()) return false;
    auto opt = magic_enum::enum_cast<T>(node.as<std::string>());
    if (!opt.has_value()) return false;
    rhs = opt.value();
    return true;
  }
};

template <>
struct convert<dryve::EHomingMethod> : convert_enum<dryve::EHomingMethod> {};

template <>
struct convert<dryve::EOperationMode> : convert_enum<dryve::EOperationMode> {};

template <>
struct convert<dryve::EPowerPhase> : convert_enum<dryve::EPowerPhase> {};

template <>
struct convert<dryve::MotionStatus> {
  static Node encode(const dryve::MotionStatus& rhs) {
    Node node;
    node["position"] = rhs.position;
    node["velocity"] = rhs.velocity;
    return node;
  }

  static bool decode(const Node& node, dryve::MotionStatus& rhs) {
    if (!node.IsMap()) return false;
    rhs.position = node["position"].as<std::int32_t>();
    rhs.velocity = node["velocity"].as<std::int32_t>();
    return true;
  }
};

}  // namespace YAML
