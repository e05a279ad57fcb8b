#pragma once

#include <atomic>
#include <cstdint>

#include "Params.h"
#include "comms/Messages.h"
#include "control/CollisionDebouncer.h"
#include "control/Mixer.h"
#include "device/CubeDevice.h"
#include "device/SensorMailbox.h"

class ChannelLink;
class EpisodeRecorder;

/*
===============================================================================
  ControlLoop.h
===============================================================================

  PURPOSE
  -------
  One control session with one cube. Each tick:

    1. apply the pending recording command (start / end)
    2. consume the sensor mailbox, update the held collision flag
    3. safety gate: e-stop latch or dead channel -> mixer reset + stop
    4. otherwise mix the stick and send one timed motor command
    5. recording gate, then hand the frame to the recorder

  tick() never sleeps. runControlLoop() paces it with Rate.

  SAFETY
  ------
  - Every motor command carries a duration of max(30 ms, 3 tick periods).
    If commands stop arriving the cube stops by itself.
  - The e-stop latch is edge-triggered (consumed by the snapshot).
  - "Channel not alive" is level-triggered and re-checked every tick
    (when estop_on_disconnect is set).
  - A failed motor write is counted and reported; the tick still completes.
    deviceLost() turns true after max_consecutive_write_failures in a row.
===============================================================================
*/

struct ControlLoopConfig {
  uint16_t rate_hz = CONTROL_RATE_HZ;
  bool estop_on_disconnect = ESTOP_ON_DISCONNECT;

  uint32_t collision_hold_ms = COLLISION_HOLD_MS;
  uint8_t collision_threshold = DEVICE_COLLISION_THRESHOLD;

  int record_min_speed = RECORD_MIN_SPEED;
  int record_min_rotation = RECORD_MIN_ROTATION;

  uint32_t max_consecutive_write_failures = DEVICE_MAX_CONSECUTIVE_WRITE_FAILURES;

  MixerConfig mixer;
};

struct TickResult {
  WheelSpeeds command;        // speeds sent this tick (0/0 when gated)
  bool gated = false;         // safety gate replaced the mixed output
  bool estop = false;         // e-stop latch honored this tick
  bool channel_alive = false;
  bool collision = false;     // held collision flag
  bool recorded = false;      // frame handed to the recorder
  bool write_ok = false;
};

class ControlLoop {
public:
  struct Stats {
    uint32_t ticks = 0;
    uint32_t gated_ticks = 0;
    uint32_t estops = 0;
    uint32_t collisions = 0;          // Idle -> held transitions
    uint32_t frames_recorded = 0;
    uint32_t frames_skipped = 0;      // rejected by the recording gate
    uint32_t write_failures = 0;
    uint32_t consecutive_write_failures = 0;
  };

  // recorder may be null (recording off)
  ControlLoop(CubeDevice& device, EpisodeRecorder* recorder = nullptr,
              const ControlLoopConfig& cfg = ControlLoopConfig());

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  // Hooks sensor notifications into the mailbox and writes the collision
  // threshold. Call after the device is connected.
  void begin();

  TickResult tick(uint32_t now_ms, const ChannelSnapshot& snap);

  // Final stop, device disconnect, channel close, recording end + flush.
  void shutdown(ChannelLink* channel = nullptr);

  bool deviceLost() const;

  uint32_t motorDurationMs() const { return _duration_ms; }
  uint32_t periodMs() const;

  SensorMailbox& mailbox() { return _mailbox; }
  const Mixer& mixer() const { return _mixer; }
  const CollisionDebouncer& hold() const { return _hold; }
  const Stats& stats() const { return _stats; }
  const ControlLoopConfig& config() const { return _cfg; }

private:
  bool sendMotor_(int left, int right, uint32_t duration_ms);
  bool passesRecordingGate_(const WheelSpeeds& ws, bool collision) const;
  void applyRecordingCommand_(RecordingCommand cmd, uint32_t now_ms);

  CubeDevice& _device;
  EpisodeRecorder* _recorder;
  ControlLoopConfig _cfg;

  Mixer _mixer;
  CollisionDebouncer _hold;
  SensorMailbox _mailbox;

  uint32_t _duration_ms;
  bool _was_alive = false;
  bool _shut_down = false;

  Stats _stats;
};

/*
  Runs loop.tick() at the loop's rate until stop is set or the device is
  lost, then calls loop.shutdown(&link). Returns the number of ticks run.
*/
uint32_t runControlLoop(ControlLoop& loop, ChannelLink& link, const std::atomic<bool>& stop);
