#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conj_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn = std::function<TimePoint()>;

struct Entry {
  std::vector<std::uint8_t> value;
  TimePoint stored_at{};
  // Original argument tuple, kept for inspection only. Lookups use the digest.
  std::vector<std::string> args;
};

using EntryMap = std::unordered_map<std::string, Entry>;

inline std::int64_t to_epoch_ns(TimePoint t) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch())
          .count());
}

inline TimePoint from_epoch_ns(std::int64_t ns) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(
      std::chrono::nanoseconds(ns))};
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms))};
}

} // namespace conj_cache
