#include "control/ControlLoop.h"

#include <chrono>
#include <stdlib.h>  // abs
#include <thread>

#include "comms/ChannelLink.h"
#include "comms/CubeProtocol.h"
#include "recording/EpisodeRecorder.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

static const char* TAG = "loop";

static uint32_t motorDurationFor(uint16_t rate_hz) {
  if (rate_hz == 0) rate_hz = 1;
  // round(PERIODS * 1000 / hz)
  const uint32_t ms = (MOTOR_DURATION_PERIODS * 1000UL + rate_hz / 2) / rate_hz;
  return ms < MOTOR_DURATION_MIN_MS ? MOTOR_DURATION_MIN_MS : ms;
}

// Slew steps follow the loop rate
static MixerConfig mixerConfigFor(const ControlLoopConfig& cfg) {
  MixerConfig mc = cfg.mixer;
  mc.rate_hz = (float)(cfg.rate_hz == 0 ? 1 : cfg.rate_hz);
  return mc;
}

ControlLoop::ControlLoop(CubeDevice& device, EpisodeRecorder* recorder, const ControlLoopConfig& cfg)
: _device(device),
  _recorder(recorder),
  _cfg(cfg),
  _mixer(mixerConfigFor(cfg)),
  _hold(DebouncePolicy::timedHold(cfg.collision_hold_ms)),
  _duration_ms(motorDurationFor(cfg.rate_hz))
{
}

uint32_t ControlLoop::periodMs() const {
  const uint16_t hz = _cfg.rate_hz == 0 ? 1 : _cfg.rate_hz;
  const uint32_t p = 1000UL / hz;
  return p == 0 ? 1 : p;
}

void ControlLoop::begin() {
  _device.onNotify([this](const uint8_t* data, size_t len) {
    MotionReport report;
    if (!protocol::decodeSensorNotification(data, len, report)) return;
    if (report.collision) _mailbox.post();
  });

  uint8_t frame[COLLISION_THRESHOLD_FRAME_BYTES];
  protocol::encodeCollisionThreshold(_cfg.collision_threshold, frame);
  if (!_device.writeConfig(frame, sizeof(frame))) {
    logf(LogLevel::WARN, TAG, "collision threshold write failed on %s", _device.name());
  }

  logf(LogLevel::INFO, TAG, "ready: %u Hz, motor duration %lums, max speed %d",
       (unsigned)_cfg.rate_hz, (unsigned long)_duration_ms, _mixer.config().max_speed);
}

bool ControlLoop::sendMotor_(int left, int right, uint32_t duration_ms) {
  const MotorFrame frame = protocol::encodeMotorCommand(left, right, duration_ms);
  const bool ok = _device.writeMotor(frame.bytes, sizeof(frame.bytes));

  if (ok) {
    if (_stats.consecutive_write_failures >= _cfg.max_consecutive_write_failures) {
      logf(LogLevel::INFO, TAG, "motor writes recovered");
    }
    _stats.consecutive_write_failures = 0;
    return true;
  }

  _stats.write_failures++;
  _stats.consecutive_write_failures++;
  if (_stats.consecutive_write_failures == 1) {
    logf(LogLevel::WARN, TAG, "motor write failed on %s", _device.name());
  } else if (_stats.consecutive_write_failures == _cfg.max_consecutive_write_failures) {
    logf(LogLevel::ERROR, TAG, "%lu consecutive motor write failures, device lost",
         (unsigned long)_stats.consecutive_write_failures);
  }
  return false;
}

bool ControlLoop::deviceLost() const {
  return _cfg.max_consecutive_write_failures > 0 &&
         _stats.consecutive_write_failures >= _cfg.max_consecutive_write_failures;
}

bool ControlLoop::passesRecordingGate_(const WheelSpeeds& ws, bool collision) const {
  // Near-stationary
  if (abs(ws.left) <= _cfg.record_min_speed && abs(ws.right) <= _cfg.record_min_speed) {
    return false;
  }
  // Weak rotation while holding a collision
  if (collision && abs(ws.left - ws.right) < _cfg.record_min_rotation) {
    return false;
  }
  return true;
}

void ControlLoop::applyRecordingCommand_(RecordingCommand cmd, uint32_t now_ms) {
  if (cmd == RecordingCommand::NONE) return;
  if (!_recorder) {
    logf(LogLevel::WARN, TAG, "recording command ignored (no recorder)");
    return;
  }
  if (cmd == RecordingCommand::START) {
    _recorder->start(now_ms);
  } else {
    _recorder->end();
  }
}

TickResult ControlLoop::tick(uint32_t now_ms, const ChannelSnapshot& snap) {
  TickResult out;
  _stats.ticks++;

  applyRecordingCommand_(snap.recording, now_ms);

  // Device state first, then the channel snapshot taken for this tick
  const bool pulse = _mailbox.consume();
  const bool was_held = _hold.active();
  const bool held = _hold.update(now_ms, pulse).active;
  if (held && !was_held) {
    _stats.collisions++;
    logf(LogLevel::INFO, TAG, "collision");
  }
  out.collision = held;
  out.channel_alive = snap.alive;

  if (snap.alive != _was_alive) {
    _was_alive = snap.alive;
    logf(snap.alive ? LogLevel::INFO : LogLevel::WARN, TAG, "%s",
         snap.alive ? "channel alive" : "channel lost");
  }

  // Safety gate
  if (snap.estop) {
    out.estop = true;
    _stats.estops++;
    logf(LogLevel::WARN, TAG, "e-stop");
  }
  const bool gate = snap.estop || (_cfg.estop_on_disconnect && !snap.alive);

  if (gate) {
    _mixer.reset();
    out.gated = true;
    _stats.gated_ticks++;
    out.write_ok = sendMotor_(0, 0, _duration_ms);
    return out;
  }

  const WheelSpeeds ws = _mixer.mix(snap.stick.x, snap.stick.y);
  out.command = ws;
  out.write_ok = sendMotor_(ws.left, ws.right, _duration_ms);

  if (_recorder && _recorder->isRecording()) {
    if (passesRecordingGate_(ws, held)) {
      out.recorded = _recorder->record(ws.left, ws.right, held, snap.stick.x, now_ms);
      if (out.recorded) _stats.frames_recorded++;
    } else {
      _stats.frames_skipped++;
    }
  }

  return out;
}

void ControlLoop::shutdown(ChannelLink* channel) {
  if (_shut_down) return;
  _shut_down = true;

  logf(LogLevel::INFO, TAG, "shutting down");

  const MotorFrame stop = protocol::encodeStop(STOP_DURATION_MS);
  if (!_device.writeMotor(stop.bytes, sizeof(stop.bytes))) {
    logf(LogLevel::WARN, TAG, "final stop command failed");
  }

  _device.onNotify(CubeDevice::NotifyCallback());
  _device.disconnect();

  if (channel) channel->close();

  if (_recorder) {
    if (_recorder->isRecording()) {
      _recorder->end();
    } else if (_recorder->pendingCount() > 0) {
      _recorder->flush();
    }

    const EpisodeRecorder::Stats& rs = _recorder->stats();
    logf(LogLevel::INFO, TAG, "recording: %lu episodes, %llu frames, %.1fs total, %lu unsaved",
         (unsigned long)rs.episodes_ended, (unsigned long long)rs.frames_recorded,
         rs.total_duration_s, (unsigned long)_recorder->pendingCount());
  }

  logf(LogLevel::INFO, TAG,
       "stats: ticks=%lu gated=%lu estops=%lu collisions=%lu recorded=%lu skipped=%lu write_fail=%lu",
       (unsigned long)_stats.ticks, (unsigned long)_stats.gated_ticks,
       (unsigned long)_stats.estops, (unsigned long)_stats.collisions,
       (unsigned long)_stats.frames_recorded, (unsigned long)_stats.frames_skipped,
       (unsigned long)_stats.write_failures);
}

uint32_t runControlLoop(ControlLoop& loop, ChannelLink& link, const std::atomic<bool>& stop) {
  Rate rate(loop.config().rate_hz);
  uint32_t ticks = 0;

  while (!stop.load()) {
    const uint32_t now_ms = millis();

    if (rate.ready(now_ms)) {
      loop.tick(now_ms, link.takeSnapshot(now_ms));
      ticks++;
      if (loop.deviceLost()) break;
    }

    const uint32_t wait_ms = rate.msUntilNext(millis());
    if (wait_ms > 0) {
      std::this_thread::sleep_until(std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(wait_ms));
    }
  }

  loop.shutdown(&link);
  return ticks;
}
