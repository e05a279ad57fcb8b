#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Params.h"

/*
===============================================================================
  Episode.h
===============================================================================

  PURPOSE
  -------
  In-memory frames and episodes as recorded by EpisodeRecorder.

  observation.state layout (schema version DATASET_SCHEMA_VERSION):
    [0] collision           0.0 / 1.0
    [1] rotation_direction  -1.0 left, 0.0 none, +1.0 right
    [2] frame_count         0.0..1.0 progress through the avoidance maneuver

  action layout:
    [0] left_motor, [1] right_motor (device units, quantized)
===============================================================================
*/

struct Frame {
  float timestamp = 0.0f;                     // seconds since episode start
  float observation[OBSERVATION_DIM] = {0.0f, 0.0f, 0.0f};
  float action[ACTION_DIM] = {0.0f, 0.0f};
  int64_t episode_index = 0;
  int64_t frame_index = 0;
  bool done = false;
};

struct Episode {
  int64_t episode_index = 0;
  std::vector<Frame> frames;                  // insertion order = time order
  uint32_t start_ms = 0;                      // monotonic clock at start()
  std::string task = RECORDING_TASK;

  uint32_t numFrames() const { return (uint32_t)frames.size(); }

  // Timestamp of the last frame (0 for an empty episode)
  double duration() const {
    return frames.empty() ? 0.0 : (double)frames.back().timestamp;
  }
};
