#pragma once

#include <chrono>
#include <stop_token>

class IClock {
 public:
  using duration = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~IClock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
  virtual void sleepUntil(time_point target) const = 0;
  // Returns early when `stop` is requested. Returns false in that case.
  virtual bool sleepUntil(time_point target, std::stop_token stop) const = 0;
};
