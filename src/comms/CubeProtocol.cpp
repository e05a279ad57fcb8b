#include "comms/CubeProtocol.h"

/*
===============================================================================
  CubeProtocol.cpp
===============================================================================

  Notes:
  - Direction byte is forward for speed >= 0, so a zero speed is "forward 0".
  - Sensor decode is best effort. Short or foreign frames are dropped and
    never block motion.
===============================================================================
*/

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static uint8_t speedMagnitude(int speed) {
  long mag = speed < 0 ? -(long)speed : (long)speed;
  if (mag > MOTOR_SPEED_MAX) mag = MOTOR_SPEED_MAX;
  return (uint8_t)mag;
}

static uint8_t speedDirection(int speed) {
  return speed >= 0 ? MOTOR_DIR_FORWARD : MOTOR_DIR_BACKWARD;
}


namespace protocol {

/*=============================================================================
  ENCODE (Operator -> Cube)
=============================================================================*/

uint8_t durationToUnits(uint32_t duration_ms) {
  if (duration_ms >= (uint32_t)MOTOR_DURATION_MAX_UNITS * 10) return MOTOR_DURATION_MAX_UNITS;
  // round half up to the nearest 10 ms
  const uint32_t units = (duration_ms + 5) / 10;
  if (units > MOTOR_DURATION_MAX_UNITS) return MOTOR_DURATION_MAX_UNITS;
  return (uint8_t)units;
}

MotorFrame encodeMotorCommand(int left, int right, uint32_t duration_ms) {
  MotorFrame f;
  f.bytes[0] = MOTOR_CONTROL_TIMED;
  f.bytes[1] = MOTOR_ID_LEFT;
  f.bytes[2] = speedDirection(left);
  f.bytes[3] = speedMagnitude(left);
  f.bytes[4] = MOTOR_ID_RIGHT;
  f.bytes[5] = speedDirection(right);
  f.bytes[6] = speedMagnitude(right);
  f.bytes[7] = durationToUnits(duration_ms);
  return f;
}

MotorFrame encodeStop(uint32_t duration_ms) {
  return encodeMotorCommand(0, 0, duration_ms);
}

void encodeCollisionThreshold(uint8_t level, uint8_t (&out)[COLLISION_THRESHOLD_FRAME_BYTES]) {
  if (level < COLLISION_THRESHOLD_MIN) level = COLLISION_THRESHOLD_MIN;
  if (level > COLLISION_THRESHOLD_MAX) level = COLLISION_THRESHOLD_MAX;
  out[0] = CONFIG_COLLISION_THRESHOLD;
  out[1] = 0x00;
  out[2] = level;
}

/*=============================================================================
  DECODE (Cube -> Operator)
=============================================================================*/

bool decodeSensorNotification(const uint8_t* data, size_t len, MotionReport& out) {
  out = MotionReport();
  if (!data) return false;
  if (len < SENSOR_MIN_FRAME_BYTES) return false;
  if (data[0] != SENSOR_TYPE_MOTION) return false;

  out.present_len = (uint8_t)(len > 255 ? 255 : len);
  out.horizontal = (data[1] == 0x01);
  out.collision = (data[2] == 0x01);
  if (len > 3) out.double_tap = (data[3] == 0x01);
  if (len > 4) out.posture = data[4];
  if (len > 5) out.shake = data[5];
  return true;
}

int decodeWheelSpeed(uint8_t direction, uint8_t magnitude) {
  return direction == MOTOR_DIR_BACKWARD ? -(int)magnitude : (int)magnitude;
}

}  // namespace protocol
