#pragma once

#include <CommonDefinitions.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// Status polling budget for one kind of wait. A wait ends with
// OperationTimedOut once `timeout` has elapsed or `maxAttempts` queries
// (when non-zero) were answered without the expected status.
struct PollPolicy {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds timeout{30000};
  std::uint32_t maxAttempts{0};

  friend bool operator==(const PollPolicy&, const PollPolicy&) = default;
};

struct PollingSettings {
  PollPolicy power{std::chrono::milliseconds{1000},
                   std::chrono::milliseconds{30000}, 0};
  PollPolicy mode{std::chrono::milliseconds{1000},
                  std::chrono::milliseconds{10000}, 0};
  PollPolicy homing{std::chrono::milliseconds{1000},
                    std::chrono::milliseconds{300000}, 0};
  PollPolicy move{std::chrono::milliseconds{100},
                  std::chrono::milliseconds{120000}, 0};
};

struct DriveSettings {
  static constexpr std::string_view kConfigClass = "DriveController";

  std::string host;
  int port{502};
  std::chrono::milliseconds connectTimeout{2000};
  std::chrono::milliseconds responseTimeout{2000};
  std::uint16_t homingFeedrate{6000};
  // Used when the caller does not name a method.
  dryve::EHomingMethod homingMethod{dryve::EHomingMethod::LSN};
  PollingSettings polling;

  // Reads classes.DriveController from the Config singleton. Only `host` is
  // required; invalid values throw std::runtime_error naming the key path.
  [[nodiscard]] static DriveSettings fromConfig();
};
