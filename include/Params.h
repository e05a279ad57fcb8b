#pragma once
#include <cstddef>
#include <cstdint>

/*
  Params.h

  Purpose:
  Central location for operator constants and tunable parameters.
  Every runtime config struct takes its defaults from here.

  Target:
  toio Core Cube (two-wheel differential drive) over BLE

  Convention:
  - Wheel speeds: device units (cube accepts 0..100 per wheel)
  - Joystick axes: normalized [-1, 1]
  - Times: milliseconds unless the name says otherwise
*/

/* ============================================================================
   CONTROL LOOP
============================================================================ */

constexpr uint16_t CONTROL_RATE_HZ = 60;

// Motor commands carry a duration so the cube stops by itself if commands
// stop arriving. 3x the tick period gives overlap between commands.
constexpr uint32_t MOTOR_DURATION_PERIODS = 3;
constexpr uint32_t MOTOR_DURATION_MIN_MS  = 30;

// Duration used for the explicit stop command and for replay frames
constexpr uint32_t STOP_DURATION_MS = 100;

/* ============================================================================
   MIXER (joystick -> wheel speeds)
============================================================================ */

constexpr int   MIXER_MAX_SPEED = 120;
constexpr float MIXER_DEADZONE  = 0.08f;
constexpr float MIXER_EXPO      = 0.3f;    // 0 = linear, 1 = pure cubic
constexpr float MIXER_SLEW_RATE = 300.0f;  // device units per second
constexpr bool  MIXER_INVERT_X  = false;
constexpr bool  MIXER_INVERT_Y  = false;

/* ============================================================================
   SAFETY
============================================================================ */

constexpr bool ESTOP_ON_DISCONNECT = true;

// Consecutive failed motor writes before the device is treated as lost
constexpr uint32_t DEVICE_MAX_CONSECUTIVE_WRITE_FAILURES = 30;

/* ============================================================================
   COLLISION DEBOUNCE
============================================================================ */

// Sensor pulse stretch applied by the control loop (timed hold)
constexpr uint32_t COLLISION_HOLD_MS = 100;

// Observation FSM used by the recorder: 0 = timed hold, 1 = progress counted
constexpr uint8_t COLLISION_POLICY = 1;

// Progress-counted maneuver length: backward (10 frames) + rotation (12 frames)
constexpr uint16_t COLLISION_MAX_FRAMES = 22;

// |steering| below this picks a random rotation direction
constexpr float COLLISION_STEER_DEADZONE = 0.1f;

// 0 = seed from the clock at startup
constexpr uint32_t COLLISION_RANDOM_SEED = 0;

/* ============================================================================
   RECORDING
============================================================================ */

constexpr bool RECORDING_ENABLED = true;
constexpr const char* RECORDING_OUTPUT_DIR   = "./datasets";
constexpr const char* RECORDING_DATASET_NAME = "toio_dataset";
constexpr const char* RECORDING_TASK         = "toio_teleoperation";

// Actions are quantized to this step before they reach the dataset
constexpr int RECORD_ACTION_QUANTUM = 10;

// Recording gate: skip near-stationary frames (both wheels <= this)
constexpr int RECORD_MIN_SPEED = 5;

// Recording gate: during a collision hold, skip weak rotations
constexpr int RECORD_MIN_ROTATION = 30;

// Bumped whenever observation.state layout changes
constexpr int DATASET_SCHEMA_VERSION = 1;

constexpr size_t OBSERVATION_DIM = 3;   // collision, rotation_direction, frame_count
constexpr size_t ACTION_DIM      = 2;   // left_motor, right_motor

/* ============================================================================
   DEVICE (toio Core Cube)
============================================================================ */

// 1..10, lower = more sensitive
constexpr uint8_t DEVICE_COLLISION_THRESHOLD = 3;

/* ============================================================================
   CHANNEL (joystick / e-stop / recording commands)
============================================================================ */

constexpr uint32_t CHANNEL_TIMEOUT_MS = 2000;
constexpr uint16_t CHANNEL_LINE_BUFFER_BYTES = 512;

/* ============================================================================
   LOGGING
============================================================================ */

// 0 = DEBUG, 1 = INFO, 2 = WARN, 3 = ERROR
constexpr int LOG_MIN_LEVEL = 1;
constexpr size_t LOG_LINE_BYTES = 256;
