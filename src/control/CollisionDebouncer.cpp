#include "control/CollisionDebouncer.h"

#include <math.h>  // fabsf

CollisionDebouncer::CollisionDebouncer(const DebouncePolicy& policy, uint32_t seed)
: _policy(policy),
  _rng(seed == 0 ? 1u : seed)
{
}

void CollisionDebouncer::setPolicy(const DebouncePolicy& policy) {
  _policy = policy;
  reset();
}

void CollisionDebouncer::reset() {
  _phase = Phase::IDLE;
  _count = 0;
  _direction = 0;
  _active_since_ms = 0;
}

int8_t CollisionDebouncer::pickDirection_(float steering_hint) {
  if (fabsf(steering_hint) >= _policy.steer_deadzone) {
    return steering_hint < 0.0f ? -1 : 1;
  }
  std::bernoulli_distribution coin(0.5);
  return coin(_rng) ? 1 : -1;
}

void CollisionDebouncer::activate_(uint32_t now_ms, float steering_hint) {
  _phase = Phase::ACTIVE;
  _count = 0;
  _active_since_ms = now_ms;
  _activations++;

  if (_policy.kind == DebounceKind::PROGRESS_COUNTED) {
    _direction = pickDirection_(steering_hint);
  } else {
    _direction = 0;
  }
}

CollisionObservation CollisionDebouncer::update(uint32_t now_ms, bool pulse, float steering_hint) {
  if (_phase == Phase::IDLE) {
    if (pulse) activate_(now_ms, steering_hint);
    return observation();
  }

  // Active: pulses are ignored, only time / frames move the state
  if (_policy.kind == DebounceKind::TIMED_HOLD) {
    if ((now_ms - _active_since_ms) > _policy.hold_ms) {
      reset();
    }
  } else {
    _count++;
    if (_count >= _policy.max_frames) {
      reset();
    }
  }
  return observation();
}

CollisionObservation CollisionDebouncer::observation() const {
  CollisionObservation obs;
  if (_phase != Phase::ACTIVE) return obs;

  obs.active = true;
  obs.rotation_direction = _direction;

  if (_policy.kind == DebounceKind::PROGRESS_COUNTED) {
    if (_policy.max_frames <= 1) {
      obs.progress = 1.0f;
    } else {
      const float p = (float)_count / (float)(_policy.max_frames - 1);
      obs.progress = p > 1.0f ? 1.0f : p;
    }
  }
  return obs;
}
