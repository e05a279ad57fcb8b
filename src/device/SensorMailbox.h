#pragma once

#include <atomic>
#include <cstdint>

/*
  SensorMailbox

  Single-slot handoff from the transport's notify thread to the control tick.
  post() sets the slot, consume() reads and clears it in one step.

  At most one unconsumed collision is buffered. A second pulse before the
  tick consumes the first is merged into it, which is harmless because the
  debouncer ignores pulses while Active.
*/

class SensorMailbox {
public:
  void post() {
    _pending.store(true, std::memory_order_release);
    _posted.fetch_add(1, std::memory_order_relaxed);
  }

  bool consume() {
    return _pending.exchange(false, std::memory_order_acq_rel);
  }

  bool pending() const { return _pending.load(std::memory_order_acquire); }

  // Total pulses posted (including merged ones)
  uint32_t posted() const { return _posted.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> _pending{false};
  std::atomic<uint32_t> _posted{0};
};
