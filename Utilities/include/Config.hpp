#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Logger.hpp"
#include "Singleton.hpp"
#include "yaml-cpp/yaml.h"

namespace dryve {
// Process-wide YAML configuration. Settings live under classes.<ClassName>;
// keys may address nested maps with dots, e.g. "polling.move.intervalMS".
class Config : public Singleton<Config> {
public:
  void setConfigPath(const std::string& configPath);
  // In-memory document, `sourceName` is used in error messages.
  void setConfigText(const std::string& yamlText, std::string sourceName);
  [[nodiscard]] const std::string& configPath() const { return _configPath; }

  YAML::Node getClassConfig(std::string_view className) const;
  [[nodiscard]] bool hasClassConfig(std::string_view className) const;
  [[nodiscard]] bool hasKey(std::string_view className,
                            std::string_view keyPath) const;

  template <typename T>
  T getRequired(std::string_view className, std::string_view keyPath) const {
    const YAML::Node valueNode = lookup(className, keyPath);
    if (!valueNode || !valueNode.IsDefined()) {
      throw std::runtime_error(std::format(
          "Missing required key '{}.{}' in config '{}'", className, keyPath,
          _configPath));
    }
    return convert<T>(valueNode, className, keyPath);
  }

  template <typename T>
  T getOptional(std::string_view className, std::string_view keyPath,
                T defaultValue) const {
    const YAML::Node valueNode = lookup(className, keyPath);
    if (!valueNode || !valueNode.IsDefined() || valueNode.IsNull()) {
      return defaultValue;
    }
    return convert<T>(valueNode, className, keyPath);
  }

private:
  Config() = default;
  ~Config() = default;

  // Undefined node when any segment of `keyPath` is missing.
  YAML::Node lookup(std::string_view className, std::string_view keyPath) const;

  template <typename T>
  T convert(const YAML::Node& node, std::string_view className,
            std::string_view keyPath) const {
    try {
      return node.as<T>();
    } catch (const YAML::Exception& e) {
      throw std::runtime_error(std::format(
          "Invalid type for '{}.{}' in config '{}': {}", className, keyPath,
          _configPath, e.what()));
    }
  }

  std::string _configPath{};
  YAML::Node _topNode;
  friend class Singleton;
};
}  // namespace dryve
