#pragma once

#include <chrono>
#include <cstdint>

/*
  Clock.h

  Monotonic millisecond clock for the host, the same shape as Arduino millis():
  32-bit, wraps after ~49 days. Everything downstream uses the rollover-safe
  (int32_t)(a - b) comparison.
*/

inline uint32_t millis() {
  static const auto start = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::steady_clock::now() - start;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

// Wall-clock seconds (used for channel pong timestamps only)
inline double wallSeconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}
