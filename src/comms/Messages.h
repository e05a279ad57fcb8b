#pragma once
#include <cstdint>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines the channel messages exchanged between the controller UI and the
  operator over newline-delimited JSON, and the latest-value snapshot the
  control loop reads once per tick.

  Must mirror the controller page:
    {"type": "stick", "x": <float>, "y": <float>}
    {"type": "estop"}
    {"type": "recording", "command": "start" | "end"}
    {"type": "ping" | "pong", "ts": <float>}

  Notes:
  - Field names must match the UI exactly.
  - Unknown types decode as failures and are dropped by the link.
===============================================================================
*/


/*=============================================================================
  CHANNEL MESSAGES (UI -> Operator)
=============================================================================*/

enum class ChannelMessageType : uint8_t {
  UNKNOWN = 0,
  STICK,
  ESTOP,
  RECORDING,
  PING,
  PONG,
};

enum class RecordingCommand : uint8_t {
  NONE = 0,
  START,
  END,
};

// "stick": {"x": <float>, "y": <float>}
struct StickCommand {
  float x = 0.0f;   // steering, + = right
  float y = 0.0f;   // throttle, + = forward
};

struct ChannelMessage {
  ChannelMessageType type = ChannelMessageType::UNKNOWN;

  StickCommand stick;                                // STICK
  RecordingCommand recording = RecordingCommand::NONE;  // RECORDING
  double ts = 0.0;                                   // PING / PONG
  bool has_ts = false;

  bool valid = false;  // set true after successful decode
};


/*=============================================================================
  SNAPSHOT (Channel -> Control loop)
=============================================================================*/

// One consistent read of the channel state for a single control tick.
struct ChannelSnapshot {
  StickCommand stick;

  // Latched e-stop, consumed by the read that returned it
  bool estop = false;

  // Pending recording command, consumed by the read that returned it
  RecordingCommand recording = RecordingCommand::NONE;

  // connected and a message arrived within the timeout
  bool alive = false;

  uint32_t age_ms = 0xFFFFFFFFUL;
};
