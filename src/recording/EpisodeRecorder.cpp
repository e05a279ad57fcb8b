#include "recording/EpisodeRecorder.h"

#include <math.h>
#include <random>
#include <utility>

#include "utils/Log.h"

static const char* TAG = "recorder";

static uint32_t resolveSeed(uint32_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return rd();
}

EpisodeRecorder::EpisodeRecorder(const RecorderConfig& cfg)
: _cfg(cfg),
  _store(cfg.output_dir, cfg.dataset_name, cfg.fps),
  _fsm(cfg.policy, resolveSeed(cfg.seed))
{
  if (_cfg.enabled) {
    _persisted = _store.persistedEpisodeCount();
    logf(LogLevel::INFO, TAG, "dataset %s has %lu episodes",
         _store.datasetDir().c_str(), (unsigned long)_persisted);
  }
}

int EpisodeRecorder::quantize(int v, int quantum) {
  if (quantum <= 0) return v;
  // Ties go to the even multiple (25 -> 20, 35 -> 40)
  return (int)nearbyint((double)v / (double)quantum) * quantum;
}

bool EpisodeRecorder::start(uint32_t now_ms) {
  if (!_cfg.enabled) {
    logf(LogLevel::WARN, TAG, "recording disabled, start ignored");
    return false;
  }
  if (_recording) {
    logf(LogLevel::DEBUG, TAG, "already recording episode %lld",
         (long long)_current.episode_index);
    return false;
  }

  _current = Episode();
  _current.episode_index = (int64_t)_persisted + (int64_t)_pending.size();
  _current.start_ms = now_ms;
  _current.task = _cfg.task;

  _fsm.reset();
  _recording = true;
  _stats.episodes_started++;

  logf(LogLevel::INFO, TAG, "episode %lld started", (long long)_current.episode_index);
  return true;
}

bool EpisodeRecorder::record(int left, int right, bool collision, float steering_hint, uint32_t now_ms) {
  if (!_recording) return false;

  const CollisionObservation obs = _fsm.update(now_ms, collision, steering_hint);

  Frame f;
  f.timestamp = _current.frames.empty()
                  ? 0.0f
                  : (float)((double)(now_ms - _current.start_ms) / 1000.0);
  f.observation[0] = obs.active ? 1.0f : 0.0f;
  f.observation[1] = (float)obs.rotation_direction;
  f.observation[2] = obs.progress;
  f.action[0] = (float)quantize(left, _cfg.action_quantum);
  f.action[1] = (float)quantize(right, _cfg.action_quantum);
  f.episode_index = _current.episode_index;
  f.frame_index = (int64_t)_current.frames.size();
  f.done = false;

  _current.frames.push_back(f);
  _stats.frames_recorded++;
  return true;
}

bool EpisodeRecorder::end() {
  if (!_recording) return false;
  _recording = false;
  _fsm.reset();
  _stats.episodes_ended++;

  if (_current.frames.empty()) {
    _stats.episodes_discarded++;
    logf(LogLevel::INFO, TAG, "episode %lld ended with no frames, discarded",
         (long long)_current.episode_index);
    _current = Episode();
    return true;
  }

  _current.frames.back().done = true;
  _stats.total_duration_s += _current.duration();

  logf(LogLevel::INFO, TAG, "episode %lld ended: %lu frames, %.2fs",
       (long long)_current.episode_index, (unsigned long)_current.numFrames(),
       _current.duration());

  _pending.push_back(std::move(_current));
  _current = Episode();

  flush();
  return true;
}

DatasetResult EpisodeRecorder::flush() {
  if (_pending.empty()) {
    return DatasetResult::fail(DatasetStatus::NOTHING_TO_SAVE, "no pending episodes");
  }

  DatasetSummary summary;
  _last_save = _store.save(_pending, &summary);

  if (!_last_save.ok()) {
    _stats.save_failures++;
    logf(LogLevel::ERROR, TAG, "save failed (%s): %s; keeping %lu episodes for retry",
         datasetStatusName(_last_save.status), _last_save.detail.c_str(),
         (unsigned long)_pending.size());
    return _last_save;
  }

  _stats.episodes_saved += summary.added_episodes;
  _pending.clear();

  // Numbering follows what is actually on disk
  _persisted = _store.persistedEpisodeCount();
  return _last_save;
}
