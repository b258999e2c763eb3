#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>

#include "IClock.hpp"

class SteadyClockAdapter final : public IClock {
 public:
  [[nodiscard]] time_point now() const override {
    return std::chrono::steady_clock::now();
  }

  void sleepUntil(const time_point target) const override {
    std::this_thread::sleep_until(target);
  }

  bool sleepUntil(const time_point target,
                  const std::stop_token stop) const override {
    std::unique_lock lock(_mutex);
    (void)_wakeup.wait_until(lock, stop, target, [] { return false; });
    return !stop.stop_requested();
  }

 private:
  mutable std::mutex _mutex;
  mutable std::condition_variable_any _wakeup;
};
