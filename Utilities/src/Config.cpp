#include "Config.hpp"

#include <string>
#include <utility>

namespace dryve {

void Config::setConfigPath(const std::string& configPath) {
  _configPath = configPath;
  try {
    _topNode = YAML::LoadFile(configPath);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::format(
        "Failed to load config file '{}': {}", configPath, e.what()));
  }
  SPDLOG_DEBUG("Loaded config file '{}'", configPath);
}

void Config::setConfigText(const std::string& yamlText, std::string sourceName) {
  _configPath = std::move(sourceName);
  try {
    _topNode = YAML::Load(yamlText);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::format(
        "Failed to parse config '{}': {}", _configPath, e.what()));
  }
}

YAML::Node Config::getClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    throw std::runtime_error(std::format(
        "Config '{}' is missing 'classes' section", _configPath));
  }

  YAML::Node classNode = _topNode["classes"][std::string(className)];
  if (!classNode || !classNode.IsDefined()) {
    throw std::runtime_error(std::format(
        "Failed to find entry for '{}' in config '{}'", className, _configPath));
  }

  return classNode;
}

bool Config::hasClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    return false;
  }
  const YAML::Node classNode = _topNode["classes"][std::string(className)];
  return classNode && classNode.IsDefined();
}

bool Config::hasKey(std::string_view className, std::string_view keyPath) const {
  const YAML::Node node = lookup(className, keyPath);
  return node && node.IsDefined();
}

YAML::Node Config::lookup(std::string_view className,
                          std::string_view keyPath) const {
  YAML::Node current = getClassConfig(className);
  while (!keyPath.empty()) {
    const auto dot = keyPath.find('.');
    const std::string segment{keyPath.substr(0, dot)};
    keyPath = dot == std::string_view::npos ? std::string_view{}
                                            : keyPath.substr(dot + 1);
    if (!current.IsMap()) {
      return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node child = std::as_const(current)[segment];
    if (!child) {
      return YAML::Node(YAML::NodeType::Undefined);
    }
    // reset() rebinds the handle; assignment would overwrite the parent map
    current.reset(child);
  }
  return current;
}

}  // namespace dryve
