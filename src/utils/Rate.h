#pragma once

#include <cstdint>

class Rate {
public:
  // hz = how many times per second you want to run
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    _period_ms = (uint32_t)(1000UL / hz);
    if (_period_ms == 0) _period_ms = 1;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  // Ticks are scheduled on a fixed grid; if we fall more than one period
  // behind, the grid restarts from now instead of bursting to catch up.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    // Safe with clock rollover because of signed subtraction trick
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms += _period_ms;
      if ((int32_t)(now_ms - _next_ms) >= 0) {
        _next_ms = now_ms + _period_ms;
      }
      return true;
    }
    return false;
  }

  // Milliseconds until the next tick is due (0 if already due)
  uint32_t msUntilNext(uint32_t now_ms) const {
    if (!_initialized) return 0;
    const int32_t remaining = (int32_t)(_next_ms - now_ms);
    return remaining > 0 ? (uint32_t)remaining : 0;
  }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
