#pragma once

#include <string>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the UI <-> Operator channel protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Operator -> UI)
=============================================================================*/

// Writes one pong JSON line (includes trailing '\n') into out.
void encodePongLine(double ts, std::string& out);


/*=============================================================================
  DECODE (UI -> Operator)
=============================================================================*/

/*
  Attempts to parse one channel JSON line.

  Returns:
    - true if decoded into out_msg (and out_msg.valid will be true)
    - false if not a known message or parse failed
*/
bool decodeChannelLine(const char* line, ChannelMessage& out_msg);

// Maps "start"/"start_episode" and "end"/"stop"/"end_episode".
RecordingCommand parseRecordingCommand(const char* s);

}  // namespace protocol
