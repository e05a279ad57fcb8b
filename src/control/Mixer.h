#pragma once

#include <cstdint>

#include "Params.h"

/*
  Mixer

  Purpose:
  - Turn a 2-axis joystick (x = steering, y = throttle) into per-wheel speeds
  - Shape each axis (inversion, clamp, deadzone, expo curve)
  - Arcade-mix, normalize so diagonals never exceed full scale
  - Slew-limit each wheel so output changes by at most slew_rate * dt per tick

  Usage pattern:
  - Call mix(x, y) exactly once per control tick
  - Call reset() on e-stop / disconnect so the next command ramps from zero

  The slew memory belongs to one control session. Do not share a Mixer
  between sessions without reset().
*/

struct MixerConfig {
  int   max_speed = MIXER_MAX_SPEED;
  float deadzone  = MIXER_DEADZONE;
  float expo      = MIXER_EXPO;
  float slew_rate = MIXER_SLEW_RATE;   // units per second (<= 0 disables slewing)
  float rate_hz   = (float)CONTROL_RATE_HZ;
  bool  invert_x  = MIXER_INVERT_X;
  bool  invert_y  = MIXER_INVERT_Y;
};

struct WheelSpeeds {
  int left = 0;
  int right = 0;
};

class Mixer {
public:
  explicit Mixer(const MixerConfig& cfg = MixerConfig());

  WheelSpeeds mix(float x, float y);

  // Zero the slew-limiter memory.
  void reset();

  const MixerConfig& config() const { return _cfg; }

  // Largest per-tick change the slew limiter allows.
  float maxStep() const { return _cfg.slew_rate * _dt_s; }

  float prevLeft() const { return _prev_left; }
  float prevRight() const { return _prev_right; }

private:
  float shape_(float v) const;
  float slew_(float target, float previous) const;

  MixerConfig _cfg;
  float _dt_s;

  float _prev_left = 0.0f;
  float _prev_right = 0.0f;
};
