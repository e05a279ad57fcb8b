#pragma once
#include <cstddef>
#include <cstdint>

/*
===============================================================================
  CubeMessages.h
===============================================================================

  PURPOSE
  -------
  Byte layouts exchanged with the toio Core Cube over BLE GATT.

  Motor characteristic (write without response), 8 bytes:
    [0] control type   0x02 = motor control with duration
    [1] left motor id  0x01
    [2] left direction 0x01 forward / 0x02 backward
    [3] left speed     0..100
    [4] right motor id 0x02
    [5] right direction
    [6] right speed    0..100
    [7] duration       10 ms units, 0 = no time limit

  Sensor characteristic (notify), motion report, >= 3 bytes:
    [0] 0x01 motion detection
    [1] horizontal
    [2] collision      <-- only bit used by the control loop
    [3] double tap
    [4] posture        1..6
    [5] shake          0..10

  Configuration characteristic (write with response), collision threshold:
    [0] 0x06  [1] 0x00  [2] threshold 1..10
===============================================================================
*/

constexpr size_t MOTOR_FRAME_BYTES = 8;
constexpr size_t COLLISION_THRESHOLD_FRAME_BYTES = 3;
constexpr size_t SENSOR_MIN_FRAME_BYTES = 3;

constexpr uint8_t MOTOR_CONTROL_TIMED = 0x02;
constexpr uint8_t MOTOR_ID_LEFT       = 0x01;
constexpr uint8_t MOTOR_ID_RIGHT      = 0x02;
constexpr uint8_t MOTOR_DIR_FORWARD   = 0x01;
constexpr uint8_t MOTOR_DIR_BACKWARD  = 0x02;
constexpr uint8_t MOTOR_SPEED_MAX     = 100;
constexpr uint8_t MOTOR_DURATION_MAX_UNITS = 255;

constexpr uint8_t SENSOR_TYPE_MOTION = 0x01;

constexpr uint8_t CONFIG_COLLISION_THRESHOLD = 0x06;
constexpr uint8_t COLLISION_THRESHOLD_MIN = 1;
constexpr uint8_t COLLISION_THRESHOLD_MAX = 10;

struct MotorFrame {
  uint8_t bytes[MOTOR_FRAME_BYTES] = {0};
};

// Decoded motion report. Fields beyond [2] are only valid if present_len covers them.
struct MotionReport {
  bool collision = false;
  bool horizontal = false;
  bool double_tap = false;
  uint8_t posture = 0;
  uint8_t shake = 0;
  uint8_t present_len = 0;
};
