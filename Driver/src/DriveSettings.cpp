#include <DriveSettings.hpp>

#include <Config.hpp>
#include <YamlExtensions.hpp>

#include <format>
#include <stdexcept>
#include <string>

namespace {
using dryve::Config;

constexpr auto kClass = DriveSettings::kConfigClass;

long long readRange(const std::string& key, const long long fallback,
                    const long long lo, const long long hi) {
  const auto value = Config::instance().getOptional<long long>(kClass, key, fallback);
  if (value < lo || value > hi) {
    throw std::runtime_error(std::format("{}.{} must be in range {}..{} (got {})",
                                         kClass, key, lo, hi, value));
  }
  return value;
}

std::chrono::milliseconds readPositiveMs(const std::string& key,
                                         const std::chrono::milliseconds fallback) {
  const auto value =
      Config::instance().getOptional<long long>(kClass, key, fallback.count());
  if (value <= 0) {
    throw std::runtime_error(
        std::format("{}.{} must be positive (got {})", kClass, key, value));
  }
  return std::chrono::milliseconds{value};
}

PollPolicy readPolicy(const std::string& name, const PollPolicy fallback) {
  const auto prefix = "polling." + name + ".";
  PollPolicy policy;
  policy.interval = readPositiveMs(prefix + "intervalMS", fallback.interval);
  policy.timeout = readPositiveMs(prefix + "timeoutMS", fallback.timeout);
  policy.maxAttempts = static_cast<std::uint32_t>(
      readRange(prefix + "maxAttempts", fallback.maxAttempts, 0, UINT32_MAX));
  return policy;
}
}  // namespace

DriveSettings DriveSettings::fromConfig() {
  auto& config = Config::instance();

  DriveSettings settings;
  settings.host = config.getRequired<std::string>(kClass, "host");
  if (settings.host.empty()) {
    throw std::runtime_error(std::format("{}.host must not be empty", kClass));
  }

  settings.port = static_cast<int>(readRange("port", settings.port, 1, 65535));
  settings.connectTimeout =
      readPositiveMs("connectTimeoutMS", settings.connectTimeout);
  settings.responseTimeout =
      readPositiveMs("responseTimeoutMS", settings.responseTimeout);
  settings.homingFeedrate = static_cast<std::uint16_t>(
      readRange("homingFeedrate", settings.homingFeedrate, 1, 65535));
  settings.homingMethod = config.getOptional<dryve::EHomingMethod>(
      kClass, "homingMethod", settings.homingMethod);

  settings.polling.power = readPolicy("power", settings.polling.power);
  settings.polling.mode = readPolicy("mode", settings.polling.mode);
  settings.polling.homing = readPolicy("homing", settings.polling.homing);
  settings.polling.move = readPolicy("move", settings.polling.move);
  return settings;
}
