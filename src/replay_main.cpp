/*
  cube_replay

  Purpose:
  Play one recorded episode back to a cube at the control rate.

  Usage:
    cube_replay <dataset_dir> [episode]

  dataset_dir is the dataset itself (the directory holding data.npz and
  meta/). episode defaults to the last one in the dataset.
*/

#include <atomic>
#include <chrono>
#include <filesystem>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <thread>
#include <vector>

#include "Params.h"

#include "device/DryRunDevice.h"
#include "recording/DatasetStore.h"
#include "replay/EpisodeReplayer.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

static std::atomic<bool> g_stop{false};
static void onStopSignal(int) { g_stop.store(true); }

static const char* TAG = "replay";

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    fprintf(stderr, "usage: %s <dataset_dir> [episode]\n", argv[0]);
    return 2;
  }

  setLogMinLevel((LogLevel)LOG_MIN_LEVEL);

  struct sigaction sa = {};
  sigemptyset(&sa.sa_mask);
  sa.sa_handler = onStopSignal;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  const std::filesystem::path dir = std::filesystem::path(argv[1]).lexically_normal();
  const std::filesystem::path name = dir.filename().empty() ? dir.parent_path().filename() : dir.filename();
  const std::filesystem::path parent = dir.filename().empty() ? dir.parent_path().parent_path() : dir.parent_path();
  DatasetStore store(parent.string(), name.string());

  std::vector<EpisodeInfo> infos;
  const DatasetResult index = store.loadEpisodeIndex(infos);
  if (!index.ok()) {
    logf(LogLevel::ERROR, TAG, "cannot read %s (%s): %s", store.episodesPath().c_str(),
         datasetStatusName(index.status), index.detail.c_str());
    return 1;
  }
  if (infos.empty()) {
    logf(LogLevel::ERROR, TAG, "dataset %s has no episodes", store.datasetDir().c_str());
    return 1;
  }

  int64_t episode = infos.back().episode_index;
  if (argc == 3) {
    char* end = nullptr;
    episode = strtoll(argv[2], &end, 10);
    if (end == argv[2] || *end != '\0') {
      fprintf(stderr, "episode must be an integer: %s\n", argv[2]);
      return 2;
    }
  }

  EpisodeTrack track;
  const DatasetResult loaded = store.loadEpisode(episode, track);
  if (!loaded.ok()) {
    logf(LogLevel::ERROR, TAG, "cannot load episode %lld (%s): %s", (long long)episode,
         datasetStatusName(loaded.status), loaded.detail.c_str());
    return 1;
  }

  DryRunDevice device;
  if (!device.connect()) {
    logf(LogLevel::ERROR, TAG, "could not connect to %s", device.name());
    return 1;
  }

  EpisodeReplayer replayer(device);
  replayer.load(track);

  Rate rate(CONTROL_RATE_HZ);
  if (replayer.start(millis())) {
    while (!g_stop.load()) {
      const uint32_t now_ms = millis();
      if (rate.ready(now_ms) && !replayer.tick(now_ms)) break;

      const uint32_t wait_ms = rate.msUntilNext(millis());
      if (wait_ms > 0) {
        std::this_thread::sleep_until(std::chrono::steady_clock::now() +
                                      std::chrono::milliseconds(wait_ms));
      }
    }
    replayer.stop();
  }

  device.disconnect();
  return replayer.writeFailures() == 0 ? 0 : 1;
}
