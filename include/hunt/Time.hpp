#pragma once

#include <chrono>
#include <cstdint>

namespace hunt {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline double secondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

// Wall-clock unix milliseconds (exchange timestamps, login signing).
inline int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace hunt
