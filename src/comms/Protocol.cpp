#include "comms/Protocol.h"
#include <math.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON channel helpers.

  Wire format:
    - One JSON object per line
    - UI -> Operator: stick / estop / recording / ping / pong
    - Operator -> UI: pong

  Notes:
  - Decoding uses ArduinoJson for safe parsing.
  - Non-finite stick values decode as 0 so they never reach the mixer.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Convert type string -> enum
static ChannelMessageType parseType(const char* s) {
  if (!s) return ChannelMessageType::UNKNOWN;
  if (strcmp(s, "stick") == 0)     return ChannelMessageType::STICK;
  if (strcmp(s, "estop") == 0)     return ChannelMessageType::ESTOP;
  if (strcmp(s, "recording") == 0) return ChannelMessageType::RECORDING;
  if (strcmp(s, "ping") == 0)      return ChannelMessageType::PING;
  if (strcmp(s, "pong") == 0)      return ChannelMessageType::PONG;
  return ChannelMessageType::UNKNOWN;
}

static float finiteOrZero(float v) {
  return isfinite(v) ? v : 0.0f;
}


namespace protocol {

/*=============================================================================
  ENCODE (Operator -> UI)
=============================================================================*/

void encodePongLine(double ts, std::string& out) {
  StaticJsonDocument<64> doc;

  doc["type"] = "pong";
  doc["ts"] = ts;

  out.clear();
  serializeJson(doc, out);
  out += '\n';
}


/*=============================================================================
  DECODE (UI -> Operator)
=============================================================================*/

RecordingCommand parseRecordingCommand(const char* s) {
  if (!s) return RecordingCommand::NONE;
  if (strcmp(s, "start") == 0 || strcmp(s, "start_episode") == 0) {
    return RecordingCommand::START;
  }
  if (strcmp(s, "end") == 0 || strcmp(s, "stop") == 0 || strcmp(s, "end_episode") == 0) {
    return RecordingCommand::END;
  }
  return RecordingCommand::NONE;
}

bool decodeChannelLine(const char* line, ChannelMessage& out_msg) {
  out_msg = ChannelMessage();   // reset everything
  if (!line) return false;

  // Channel messages are tiny; 256 bytes leaves room for extra UI fields
  StaticJsonDocument<256> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  const ChannelMessageType type = parseType(obj["type"]);

  switch (type) {
    case ChannelMessageType::STICK:
      out_msg.stick.x = finiteOrZero(obj["x"] | 0.0f);
      out_msg.stick.y = finiteOrZero(obj["y"] | 0.0f);
      break;

    case ChannelMessageType::ESTOP:
      break;

    case ChannelMessageType::RECORDING:
      out_msg.recording = parseRecordingCommand(obj["command"]);
      if (out_msg.recording == RecordingCommand::NONE) return false;
      break;

    case ChannelMessageType::PING:
    case ChannelMessageType::PONG:
      if (obj.containsKey("ts")) {
        out_msg.ts = obj["ts"] | 0.0;
        out_msg.has_ts = true;
      }
      break;

    case ChannelMessageType::UNKNOWN:
      return false;
  }

  out_msg.type = type;
  out_msg.valid = true;
  return true;
}

}  // namespace protocol
