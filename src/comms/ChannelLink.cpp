#include "comms/ChannelLink.h"

#include <string.h>
#include <utility>
#include <vector>

#include "comms/Protocol.h"
#include "utils/Clock.h"
#include "utils/Log.h"

/*
===============================================================================
  ChannelLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - Replies are sent after the lock is released
===============================================================================
*/

static const char* TAG = "channel";

ChannelLink::ChannelLink(const ChannelConfig& cfg)
: _cfg(cfg)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

void ChannelLink::begin(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  _rx_len = 0;
  _dropping = false;

  _stick = StickCommand();
  _estop = false;
  _recording = RecordingCommand::NONE;

  _connected = true;
  _last_msg_ms = now_ms;

  _lines = _ok = _fail = _ovf = 0;
  _max_len_seen = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
  logf(LogLevel::INFO, TAG, "open RX_BUF_SIZE=%u timeout=%lums",
       (unsigned)RX_BUF_SIZE, (unsigned long)_cfg.timeout_ms);
}

void ChannelLink::close() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_connected) return;
  _connected = false;
  logf(LogLevel::INFO, TAG, "closed (lines=%lu ok=%lu fail=%lu ovf=%lu)",
       (unsigned long)_lines, (unsigned long)_ok,
       (unsigned long)_fail, (unsigned long)_ovf);
}

void ChannelLink::setReplySink(ReplySink sink) {
  std::lock_guard<std::mutex> lock(_mutex);
  _reply = std::move(sink);
}

bool ChannelLink::connected() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _connected;
}

bool ChannelLink::aliveLocked_(uint32_t now_ms) const {
  if (!_connected) return false;
  return (now_ms - _last_msg_ms) < _cfg.timeout_ms;
}

bool ChannelLink::alive(uint32_t now_ms) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return aliveLocked_(now_ms);
}

ChannelSnapshot ChannelLink::takeSnapshot(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);

  ChannelSnapshot s;
  s.stick = _stick;
  s.estop = _estop;
  s.recording = _recording;
  s.alive = aliveLocked_(now_ms);
  s.age_ms = _connected ? (now_ms - _last_msg_ms) : 0xFFFFFFFFUL;

  // Edge-triggered: honored once by whoever read it
  _estop = false;
  _recording = RecordingCommand::NONE;
  return s;
}

void ChannelLink::feedLine(const char* line, uint32_t now_ms) {
  if (!line) return;
  feed(line, strlen(line), now_ms);
  feed("\n", 1, now_ms);
}

void ChannelLink::feed(const char* data, size_t len, uint32_t now_ms) {
  std::vector<std::string> replies;
  ReplySink reply;

  {
    std::lock_guard<std::mutex> lock(_mutex);

    for (size_t i = 0; i < len; i++) {
      const char ch = data[i];

      if (ch == '\r') continue;

      if (_dropping) {
        // We overflowed earlier; discard until newline to resync
        if (ch == '\n') {
          _dropping = false;
          _rx_len = 0;
          memset(_rx_buf, 0, sizeof(_rx_buf));
        }
        continue;
      }

      if (ch == '\n') {
        // End of frame
        _rx_buf[_rx_len] = '\0';

        _lines++;

        // Track max length seen (helps confirm sizing)
        if (_rx_len > _max_len_seen) _max_len_seen = (uint16_t)_rx_len;

        if (_rx_buf[0] != '\0') {
          ChannelMessage msg;
          if (protocol::decodeChannelLine(_rx_buf, msg) && msg.valid) {
            _ok++;
            apply_(msg, now_ms);

            if (msg.type == ChannelMessageType::PING && _reply) {
              std::string pong;
              protocol::encodePongLine(wallSeconds(), pong);
              replies.push_back(pong);
            }
          } else {
            _fail++;
            logf(LogLevel::DEBUG, TAG, "RX FAIL (lines=%lu ok=%lu fail=%lu) len=%u head=%.24s",
                 (unsigned long)_lines, (unsigned long)_ok, (unsigned long)_fail,
                 (unsigned)_rx_len, _rx_buf);
          }
        }

        _rx_len = 0;
        continue;
      }

      // Append to buffer if there is room (leave space for '\0')
      if (_rx_len + 1 < RX_BUF_SIZE) {
        _rx_buf[_rx_len++] = ch;
      } else {
        // Buffer overflow: discard remainder until newline
        _ovf++;
        _dropping = true;
        _rx_buf[RX_BUF_SIZE - 1] = '\0';
        logf(LogLevel::WARN, TAG, "RX overflow ovf=%lu head=%.24s",
             (unsigned long)_ovf, _rx_buf);

        _rx_len = 0;
        memset(_rx_buf, 0, sizeof(_rx_buf));
      }
    }

    if (!replies.empty()) reply = _reply;
  }

  for (const std::string& line : replies) {
    reply(line);
  }
}

void ChannelLink::apply_(const ChannelMessage& msg, uint32_t now_ms) {
  _last_msg_ms = now_ms;

  switch (msg.type) {
    case ChannelMessageType::STICK:
      _stick = msg.stick;
      break;

    case ChannelMessageType::ESTOP:
      _estop = true;
      logf(LogLevel::INFO, TAG, "ESTOP received");
      break;

    case ChannelMessageType::RECORDING:
      _recording = msg.recording;
      logf(LogLevel::INFO, TAG, "recording command: %s",
           msg.recording == RecordingCommand::START ? "start" : "end");
      break;

    case ChannelMessageType::PING:
    case ChannelMessageType::PONG:
    case ChannelMessageType::UNKNOWN:
      break;
  }
}

uint32_t ChannelLink::rxLines() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _lines;
}

uint32_t ChannelLink::rxOk() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _ok;
}

uint32_t ChannelLink::rxFail() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _fail;
}

uint32_t ChannelLink::rxOverflow() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _ovf;
}

uint16_t ChannelLink::rxMaxLenSeen() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _max_len_seen;
}
