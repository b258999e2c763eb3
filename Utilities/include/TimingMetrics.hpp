#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Logger.hpp"

#ifndef DRYVE_TIMING_ENABLED
#define DRYVE_TIMING_ENABLED 0
#endif

namespace dryve {

// Collects per-scope wall time of frame exchanges and polling sequences.
// Reports are emitted on demand (e.g. when a controller is closed).
class TimingMetricsRegistry {
 public:
  struct Stat {
    std::uint64_t count{0};
    std::uint64_t totalNs{0};
    std::uint64_t maxNs{0};
  };

  static TimingMetricsRegistry& instance() {
    static TimingMetricsRegistry registry;
    return registry;
  }

  void record(const char* name, const std::chrono::nanoseconds duration) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto& stat = _stats[std::string(name)];
    stat.count += 1;
    stat.totalNs += static_cast<std::uint64_t>(duration.count());
    stat.maxNs =
        std::max(stat.maxNs, static_cast<std::uint64_t>(duration.count()));
  }

  [[nodiscard]] std::vector<std::pair<std::string, Stat>> snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::pair<std::string, Stat>> out(_stats.begin(), _stats.end());
    std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
      return lhs.second.totalNs > rhs.second.totalNs;
    });
    return out;
  }

  void reportAndReset() {
    const auto stats = snapshot();
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _stats.clear();
    }
    if (stats.empty()) {
      return;
    }
    SPDLOG_INFO("Timing report ({} scopes):", stats.size());
    for (const auto& [name, stat] : stats) {
      const auto avgUs = stat.count == 0
                             ? 0.0
                             : static_cast<double>(stat.totalNs) /
                                   static_cast<double>(stat.count) / 1'000.0;
      SPDLOG_INFO("  {:<40} count={:<8} avg={:>10.3f} us max={:>10.3f} us",
                  name, stat.count, avgUs,
                  static_cast<double>(stat.maxNs) / 1'000.0);
    }
  }

 private:
  TimingMetricsRegistry() = default;

  mutable std::mutex _mutex;
  std::unordered_map<std::string, Stat> _stats;
};

class ScopedTiming {
 public:
  explicit ScopedTiming(const char* name)
      : _name(name), _start(std::chrono::steady_clock::now()) {}

  ~ScopedTiming() {
    TimingMetricsRegistry::instance().record(
        _name, std::chrono::duration_cast<std::chrono::nanoseconds>(
                   std::chrono::steady_clock::now() - _start));
  }

  ScopedTiming(const ScopedTiming&) = delete;
  ScopedTiming& operator=(const ScopedTiming&) = delete;

 private:
  const char* _name;
  std::chrono::steady_clock::time_point _start;
};

}  // namespace dryve

#if DRYVE_TIMING_ENABLED
#define DRYVE_TIMING_CONCAT_IMPL(a, b) a##b
#define DRYVE_TIMING_CONCAT(a, b) DRYVE_TIMING_CONCAT_IMPL(a, b)
#define DRYVE_TIMED_SCOPE(name_literal) \
  ::dryve::ScopedTiming DRYVE_TIMING_CONCAT(_dryve_timed_scope_, __COUNTER__)(name_literal)
#else
#define DRYVE_TIMED_SCOPE(name_literal) ((void)0)
#endif
