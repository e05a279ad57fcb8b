#include "control/Mixer.h"

#include <math.h>  // fabsf, lroundf

static float clampUnit(float v) {
  if (v > 1.0f) return 1.0f;
  if (v < -1.0f) return -1.0f;
  return v;
}

Mixer::Mixer(const MixerConfig& cfg)
: _cfg(cfg)
{
  if (_cfg.max_speed < 0) _cfg.max_speed = -_cfg.max_speed;
  if (_cfg.deadzone < 0.0f) _cfg.deadzone = 0.0f;
  if (_cfg.rate_hz < 1.0f) _cfg.rate_hz = 1.0f;
  _dt_s = 1.0f / _cfg.rate_hz;
}

void Mixer::reset() {
  _prev_left = 0.0f;
  _prev_right = 0.0f;
}

float Mixer::shape_(float v) const {
  if (fabsf(v) < _cfg.deadzone) return 0.0f;
  const float e = _cfg.expo;
  return (1.0f - e) * v + e * v * v * v;
}

float Mixer::slew_(float target, float previous) const {
  if (_cfg.slew_rate <= 0.0f) return target;

  // Move previous toward target by at most (slew_rate * dt)
  const float max_step = maxStep();
  if (target > previous + max_step) return previous + max_step;
  if (target < previous - max_step) return previous - max_step;
  return target;
}

WheelSpeeds Mixer::mix(float x, float y) {
  if (_cfg.invert_x) x = -x;
  if (_cfg.invert_y) y = -y;

  // NaN from a bad client counts as centered
  if (x != x) x = 0.0f;
  if (y != y) y = 0.0f;

  x = shape_(clampUnit(x));
  y = shape_(clampUnit(y));

  float left = y + x;
  float right = y - x;

  float magnitude = 1.0f;
  if (fabsf(left) > magnitude) magnitude = fabsf(left);
  if (fabsf(right) > magnitude) magnitude = fabsf(right);
  left /= magnitude;
  right /= magnitude;

  left *= (float)_cfg.max_speed;
  right *= (float)_cfg.max_speed;

  left = slew_(left, _prev_left);
  right = slew_(right, _prev_right);

  _prev_left = left;
  _prev_right = right;

  WheelSpeeds out;
  out.left = (int)lroundf(left);
  out.right = (int)lroundf(right);
  return out;
}
