#pragma once

#include <cstddef>
#include <cstdint>

#include "Params.h"
#include "device/CubeDevice.h"
#include "recording/DatasetStore.h"

/*
  EpisodeReplayer

  Purpose:
  - Play a recorded episode's actions back to a cube on the control tick clock
  - Each tick sends the latest frame whose timestamp has elapsed
  - Once every frame has been sent, the next tick sends a stop and playback ends

  Usage pattern:
  - load(track), start(now_ms), then tick(now_ms) at a fixed rate until it
    returns false
  - stop() aborts playback and sends a stop command
*/

struct ReplayConfig {
  uint32_t frame_duration_ms = STOP_DURATION_MS;   // per motor command
};

class EpisodeReplayer {
public:
  explicit EpisodeReplayer(CubeDevice& device, const ReplayConfig& cfg = ReplayConfig());

  void load(const EpisodeTrack& track);

  bool start(uint32_t now_ms);

  // Returns true while playback continues.
  bool tick(uint32_t now_ms);

  void stop();

  bool playing() const { return _playing; }
  size_t framesTotal() const { return _track.frames.size(); }
  size_t cursor() const { return _cursor; }

  uint32_t commandsSent() const { return _sent; }
  uint32_t writeFailures() const { return _write_failures; }

private:
  bool send_(int left, int right, uint32_t duration_ms);

  CubeDevice& _device;
  ReplayConfig _cfg;

  EpisodeTrack _track;
  bool _playing = false;
  uint32_t _start_ms = 0;
  size_t _cursor = 0;   // frames whose timestamp has elapsed

  uint32_t _sent = 0;
  uint32_t _write_failures = 0;
};
