#include "replay/EpisodeReplayer.h"

#include <math.h>

#include "comms/CubeProtocol.h"
#include "utils/Log.h"

static const char* TAG = "replay";

EpisodeReplayer::EpisodeReplayer(CubeDevice& device, const ReplayConfig& cfg)
: _device(device),
  _cfg(cfg)
{
}

void EpisodeReplayer::load(const EpisodeTrack& track) {
  _track = track;
  _playing = false;
  _cursor = 0;
}

bool EpisodeReplayer::start(uint32_t now_ms) {
  if (_track.frames.empty()) {
    logf(LogLevel::WARN, TAG, "nothing to replay");
    return false;
  }
  _playing = true;
  _start_ms = now_ms;
  _cursor = 0;
  logf(LogLevel::INFO, TAG, "episode %lld: %lu frames, %.2fs",
       (long long)_track.episode_index, (unsigned long)_track.frames.size(),
       (double)_track.frames.back().timestamp);
  return true;
}

bool EpisodeReplayer::send_(int left, int right, uint32_t duration_ms) {
  const MotorFrame frame = protocol::encodeMotorCommand(left, right, duration_ms);
  if (_device.writeMotor(frame.bytes, sizeof(frame.bytes))) {
    _sent++;
    return true;
  }
  _write_failures++;
  logf(LogLevel::WARN, TAG, "motor write failed");
  return false;
}

bool EpisodeReplayer::tick(uint32_t now_ms) {
  if (!_playing) return false;

  const size_t n = _track.frames.size();

  // Every frame went out on an earlier tick
  if (_cursor >= n) {
    stop();
    return false;
  }

  const double elapsed_s = (double)(now_ms - _start_ms) / 1000.0;
  size_t due = _cursor;
  while (due < n && (double)_track.frames[due].timestamp <= elapsed_s) due++;

  if (due == 0) return true;   // first frame not due yet

  const Frame& f = _track.frames[due - 1];
  send_((int)lroundf(f.action[0]), (int)lroundf(f.action[1]), _cfg.frame_duration_ms);
  _cursor = due;
  return true;
}

void EpisodeReplayer::stop() {
  if (!_playing) return;
  _playing = false;

  const MotorFrame frame = protocol::encodeStop(_cfg.frame_duration_ms);
  if (!_device.writeMotor(frame.bytes, sizeof(frame.bytes))) {
    _write_failures++;
    logf(LogLevel::WARN, TAG, "stop command failed");
  }
  logf(LogLevel::INFO, TAG, "done: %lu/%lu frames, %lu commands",
       (unsigned long)_cursor, (unsigned long)_track.frames.size(), (unsigned long)_sent);
}
