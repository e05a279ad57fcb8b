#pragma once

#include <cstdint>
#include <random>

#include "Params.h"

/*
===============================================================================
  CollisionDebouncer.h
===============================================================================

  PURPOSE
  -------
  Turns raw collision pulses from the cube into a held collision flag.

  Two policies share one state machine (Idle / Active):

    TIMED_HOLD
      pulse while Idle -> Active for hold_ms of wall-clock time.
      No rotation direction, progress stays 0.

    PROGRESS_COUNTED
      pulse while Idle -> Active, picks a rotation direction and resets the
      counter. Every later update advances the counter by one; after
      max_frames updates the FSM returns to Idle with direction and
      progress back to 0.

  Pulses while Active are ignored in both policies (no re-trigger mid
  maneuver).

  Rotation direction: sign of the steering hint when |hint| exceeds the
  deadzone, otherwise a coin flip from the seeded generator.

  USAGE
  -----
  Call update(now_ms, pulse, steering_hint) exactly once per frame.
  Output is the observation triple (collision, rotation_direction, progress).
===============================================================================
*/

enum class DebounceKind : uint8_t {
  TIMED_HOLD = 0,
  PROGRESS_COUNTED,
};

struct DebouncePolicy {
  DebounceKind kind = DebounceKind::PROGRESS_COUNTED;
  uint32_t hold_ms = COLLISION_HOLD_MS;          // TIMED_HOLD
  uint16_t max_frames = COLLISION_MAX_FRAMES;    // PROGRESS_COUNTED
  float steer_deadzone = COLLISION_STEER_DEADZONE;

  static DebouncePolicy timedHold(uint32_t hold_ms) {
    DebouncePolicy p;
    p.kind = DebounceKind::TIMED_HOLD;
    p.hold_ms = hold_ms;
    return p;
  }

  static DebouncePolicy progressCounted(uint16_t max_frames) {
    DebouncePolicy p;
    p.kind = DebounceKind::PROGRESS_COUNTED;
    p.max_frames = max_frames;
    return p;
  }
};

struct CollisionObservation {
  bool active = false;
  int8_t rotation_direction = 0;   // -1 left, 0 none, +1 right
  float progress = 0.0f;           // 0..1
};

class CollisionDebouncer {
public:
  enum class Phase : uint8_t { IDLE = 0, ACTIVE };

  explicit CollisionDebouncer(const DebouncePolicy& policy = DebouncePolicy(),
                              uint32_t seed = 1);

  CollisionObservation update(uint32_t now_ms, bool pulse, float steering_hint = 0.0f);

  // Back to Idle with neutral outputs (session boundaries).
  void reset();

  void setPolicy(const DebouncePolicy& policy);

  const DebouncePolicy& policy() const { return _policy; }
  Phase phase() const { return _phase; }
  bool active() const { return _phase == Phase::ACTIVE; }
  uint16_t progressCount() const { return _count; }
  int8_t rotationDirection() const { return _direction; }

  // Idle -> Active transitions since construction
  uint32_t activations() const { return _activations; }

  CollisionObservation observation() const;

private:
  void activate_(uint32_t now_ms, float steering_hint);
  int8_t pickDirection_(float steering_hint);

  DebouncePolicy _policy;
  std::minstd_rand _rng;

  Phase _phase = Phase::IDLE;
  uint16_t _count = 0;
  int8_t _direction = 0;
  uint32_t _active_since_ms = 0;
  uint32_t _activations = 0;
};
