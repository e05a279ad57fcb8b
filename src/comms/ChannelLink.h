#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  ChannelLink.h
===============================================================================

  PURPOSE
  -------
  Operator-side channel handler:

    - Accepts raw bytes from any transport (feed), never blocks on it
    - Accumulates bytes into a newline-delimited line buffer
    - Decodes channel messages and overwrites the latest-value state
    - Tracks message age for liveness (CHANNEL_TIMEOUT_MS)
    - Answers ping with pong through the reply sink

  THREADING
  ---------
  feed() runs on the receive thread, takeSnapshot() on the control thread.
  Both go through one mutex. takeSnapshot() consumes the e-stop latch and the
  pending recording command in the same critical section as the copy.

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

struct ChannelConfig {
  uint32_t timeout_ms = CHANNEL_TIMEOUT_MS;
};

class ChannelLink {
public:
  using ReplySink = std::function<void(const std::string& line)>;

  explicit ChannelLink(const ChannelConfig& cfg = ChannelConfig());

  // Transport came up. Liveness is measured from here until the first message.
  void begin(uint32_t now_ms);

  // Transport went away (EOF, socket closed). alive() is false from now on.
  void close();

  // Receive path: hand over whatever bytes arrived.
  void feed(const char* data, size_t len, uint32_t now_ms);

  // Decode one complete line (no newline), as if it had been fed.
  void feedLine(const char* line, uint32_t now_ms);

  // Control path: one consistent read per tick.
  ChannelSnapshot takeSnapshot(uint32_t now_ms);

  // Non-consuming liveness check
  bool alive(uint32_t now_ms) const;
  bool connected() const;

  void setReplySink(ReplySink sink);

  // Optional: RX stats
  uint32_t rxLines() const;
  uint32_t rxOk() const;
  uint32_t rxFail() const;
  uint32_t rxOverflow() const;
  uint16_t rxMaxLenSeen() const;

private:
  void apply_(const ChannelMessage& msg, uint32_t now_ms);
  bool aliveLocked_(uint32_t now_ms) const;

  ChannelConfig _cfg;

  mutable std::mutex _mutex;

  static constexpr size_t RX_BUF_SIZE = CHANNEL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  // Latest-value state
  StickCommand _stick;
  bool _estop = false;
  RecordingCommand _recording = RecordingCommand::NONE;

  // Freshness
  bool _connected = false;
  uint32_t _last_msg_ms = 0;

  ReplySink _reply;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint16_t _max_len_seen = 0;
};
