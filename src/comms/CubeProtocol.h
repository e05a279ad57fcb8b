#pragma once

#include "comms/CubeMessages.h"

/*
===============================================================================
  CubeProtocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the cube's binary GATT frames.
  Layouts are documented in CubeMessages.h.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Operator -> Cube)
=============================================================================*/

/*
  Builds one timed motor command.

  left / right : signed wheel speed, magnitude clamped to 0..100
  duration_ms  : rounded to 10 ms units and clamped to 0..255.
                 0 means "run until told otherwise"; the control loop never
                 sends it because the duration is its dead-man timeout.
*/
MotorFrame encodeMotorCommand(int left, int right, uint32_t duration_ms);

MotorFrame encodeStop(uint32_t duration_ms);

// Writes [0x06, 0x00, clamp(level, 1, 10)] into out.
void encodeCollisionThreshold(uint8_t level, uint8_t (&out)[COLLISION_THRESHOLD_FRAME_BYTES]);

// Duration helper used by encodeMotorCommand (exposed for tests)
uint8_t durationToUnits(uint32_t duration_ms);

/*=============================================================================
  DECODE (Cube -> Operator)
=============================================================================*/

/*
  Decodes one sensor notification.

  Returns:
    - true if data is a motion report (len >= 3, data[0] == 0x01)
    - false for short or non-motion frames (caller drops them)
*/
bool decodeSensorNotification(const uint8_t* data, size_t len, MotionReport& out);

// Signed speed carried by one wheel's direction + magnitude bytes
int decodeWheelSpeed(uint8_t direction, uint8_t magnitude);

}  // namespace protocol
