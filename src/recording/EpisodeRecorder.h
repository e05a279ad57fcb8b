#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Params.h"
#include "control/CollisionDebouncer.h"
#include "recording/DatasetStore.h"
#include "recording/Episode.h"

/*
===============================================================================
  EpisodeRecorder.h
===============================================================================

  PURPOSE
  -------
  Records (observation, action) frames into episodes and hands finished
  episodes to the DatasetStore.

    Idle --start()--> Recording --end()--> Idle

  - start() assigns episode_index = persisted + pending. The index never
    changes after that.
  - record() quantizes the action, advances the observation FSM and appends
    a frame stamped now - start time. The first frame has timestamp 0.0.
  - end() marks the last frame done, moves the episode to the pending list
    and saves every pending episode. On failure the pending list is kept and
    retried by the next end() or by flush().

  record()/end() outside Recording are no-ops returning false, so duplicate
  or out-of-order commands from the channel are harmless.

  The recorder is owned by the control loop thread. It is not thread-safe.
===============================================================================
*/

struct RecorderConfig {
  bool enabled = RECORDING_ENABLED;
  std::string output_dir = RECORDING_OUTPUT_DIR;
  std::string dataset_name = RECORDING_DATASET_NAME;
  std::string task = RECORDING_TASK;
  float fps = (float)CONTROL_RATE_HZ;

  DebouncePolicy policy = COLLISION_POLICY == 0
                            ? DebouncePolicy::timedHold(COLLISION_HOLD_MS)
                            : DebouncePolicy::progressCounted(COLLISION_MAX_FRAMES);

  // 0 = seed from std::random_device
  uint32_t seed = COLLISION_RANDOM_SEED;

  int action_quantum = RECORD_ACTION_QUANTUM;
};

class EpisodeRecorder {
public:
  struct Stats {
    uint32_t episodes_started = 0;
    uint32_t episodes_ended = 0;
    uint32_t episodes_discarded = 0;   // ended with no frames
    uint32_t episodes_saved = 0;
    uint64_t frames_recorded = 0;
    double   total_duration_s = 0.0;
    uint32_t save_failures = 0;
  };

  explicit EpisodeRecorder(const RecorderConfig& cfg = RecorderConfig());

  bool start(uint32_t now_ms);
  bool record(int left, int right, bool collision, float steering_hint, uint32_t now_ms);
  bool end();

  // Saves pending episodes (shutdown path). NOTHING_TO_SAVE if none.
  DatasetResult flush();

  bool enabled() const { return _cfg.enabled; }
  bool isRecording() const { return _recording; }

  // Index of the open episode, -1 when idle
  int64_t currentEpisodeIndex() const { return _recording ? _current.episode_index : -1; }
  const Episode& current() const { return _current; }

  size_t pendingCount() const { return _pending.size(); }
  const std::vector<Episode>& pending() const { return _pending; }

  uint32_t persistedEpisodes() const { return _persisted; }

  const DatasetResult& lastSaveResult() const { return _last_save; }
  const Stats& stats() const { return _stats; }

  const CollisionDebouncer& debouncer() const { return _fsm; }
  DatasetStore& store() { return _store; }
  const RecorderConfig& config() const { return _cfg; }

  // Rounds to the nearest multiple of quantum, ties to even (quantum <= 0 leaves v alone)
  static int quantize(int v, int quantum);

private:
  RecorderConfig _cfg;
  DatasetStore _store;
  CollisionDebouncer _fsm;

  bool _recording = false;
  Episode _current;
  std::vector<Episode> _pending;
  uint32_t _persisted = 0;

  DatasetResult _last_save;
  Stats _stats;
};
