#include "recording/EpisodeRecorder.h"
#include "utils/Log.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string freshDir(const char* name) {
  fs::path p = fs::temp_directory_path() /
               ("cube_teleop_rec_" + std::string(name) + "_" + std::to_string(getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p.string();
}

static RecorderConfig configIn(const std::string& dir) {
  RecorderConfig cfg;
  cfg.output_dir = dir;
  cfg.dataset_name = "ds";
  cfg.seed = 11;
  return cfg;
}

static void testQuantize() {
  assert(EpisodeRecorder::quantize(44, 10) == 40);
  assert(EpisodeRecorder::quantize(46, 10) == 50);
  assert(EpisodeRecorder::quantize(-44, 10) == -40);
  // Ties go to the even multiple
  assert(EpisodeRecorder::quantize(25, 10) == 20);
  assert(EpisodeRecorder::quantize(35, 10) == 40);
  assert(EpisodeRecorder::quantize(45, 10) == 40);
  assert(EpisodeRecorder::quantize(-45, 10) == -40);
  assert(EpisodeRecorder::quantize(-55, 10) == -60);
  assert(EpisodeRecorder::quantize(120, 10) == 120);
  assert(EpisodeRecorder::quantize(3, 10) == 0);
  assert(EpisodeRecorder::quantize(37, 0) == 37);
}

static void testIdleOperationsAreNoOps() {
  const std::string dir = freshDir("idle");
  EpisodeRecorder rec(configIn(dir));
  assert(!rec.isRecording());
  assert(!rec.record(50, 50, false, 0.0f, 0));
  assert(!rec.end());
  assert(rec.stats().frames_recorded == 0);
  assert(!rec.flush().ok());
  assert(rec.flush().status == DatasetStatus::NOTHING_TO_SAVE);
  assert(!fs::exists(fs::path(dir) / "ds" / "data.npz"));
  fs::remove_all(dir);
}

static void testEpisodeFramesAndSave() {
  const std::string dir = freshDir("basic");
  EpisodeRecorder rec(configIn(dir));
  assert(rec.persistedEpisodes() == 0);

  assert(rec.start(1000));
  assert(!rec.start(1001));   // already recording
  assert(rec.currentEpisodeIndex() == 0);

  const int n = 7;
  for (int i = 0; i < n; i++) {
    assert(rec.record(44 + i, -46, false, 0.0f, 1016 + (uint32_t)i * 16));
  }

  const Episode& ep = rec.current();
  assert(ep.numFrames() == (uint32_t)n);
  assert(ep.frames[0].timestamp == 0.0f);
  // Stamped from start(), not from the first recorded frame
  assert(std::fabs(ep.frames[1].timestamp - 0.032f) < 1e-6f);
  assert(std::fabs(ep.frames[6].timestamp - 0.112f) < 1e-6f);
  assert(std::fabs(ep.duration() - 0.112) < 1e-6);
  for (int i = 0; i < n; i++) {
    assert(ep.frames[i].episode_index == 0);
    assert(ep.frames[i].frame_index == i);
    assert(!ep.frames[i].done);
    assert(ep.frames[i].action[1] == -50.0f);
    assert(ep.frames[i].observation[0] == 0.0f);
  }
  assert(ep.frames[0].action[0] == 40.0f);
  assert(ep.frames[6].action[0] == 50.0f);

  assert(rec.end());
  assert(!rec.isRecording());
  assert(rec.pendingCount() == 0);
  assert(rec.lastSaveResult().ok());
  assert(rec.persistedEpisodes() == 1);

  DatasetColumns cols;
  assert(rec.store().loadColumns(cols).ok());
  assert(cols.rows() == (size_t)n);
  for (int i = 0; i < n; i++) assert((cols.done[i] != 0) == (i == n - 1));

  // Next episode continues the numbering
  assert(rec.start(5000));
  assert(rec.currentEpisodeIndex() == 1);
  rec.record(60, 60, false, 0.0f, 5000);
  assert(rec.end());
  assert(rec.persistedEpisodes() == 2);

  // A fresh recorder picks up the persisted count
  EpisodeRecorder again(configIn(dir));
  assert(again.persistedEpisodes() == 2);
  assert(again.start(0));
  assert(again.currentEpisodeIndex() == 2);

  fs::remove_all(dir);
}

static void testCollisionObservation() {
  const std::string dir = freshDir("collision");
  RecorderConfig cfg = configIn(dir);
  cfg.policy = DebouncePolicy::progressCounted(4);
  EpisodeRecorder rec(cfg);

  rec.start(0);
  rec.record(50, 50, false, 0.0f, 0);
  rec.record(-60, 60, true, -0.7f, 16);   // collision, steering left
  rec.record(-60, 60, true, 0.9f, 32);    // hint ignored while active
  rec.record(-60, 60, true, 0.9f, 48);
  rec.record(-60, 60, true, 0.9f, 64);
  rec.record(-60, 60, true, 0.9f, 80);    // count reaches 4 -> idle
  rec.record(-60, 60, true, 0.9f, 96);    // held flag still set -> re-arms, right

  const Episode& ep = rec.current();
  assert(ep.frames[0].observation[0] == 0.0f);

  assert(ep.frames[1].observation[0] == 1.0f);
  assert(ep.frames[1].observation[1] == -1.0f);
  assert(ep.frames[1].observation[2] == 0.0f);

  assert(ep.frames[2].observation[1] == -1.0f);
  assert(std::fabs(ep.frames[2].observation[2] - 1.0f / 3.0f) < 1e-6f);
  assert(std::fabs(ep.frames[3].observation[2] - 2.0f / 3.0f) < 1e-6f);
  assert(ep.frames[4].observation[0] == 1.0f);
  assert(ep.frames[4].observation[2] == 1.0f);

  assert(ep.frames[5].observation[0] == 0.0f);
  assert(ep.frames[5].observation[1] == 0.0f);
  assert(ep.frames[5].observation[2] == 0.0f);

  assert(ep.frames[6].observation[0] == 1.0f);
  assert(ep.frames[6].observation[1] == 1.0f);

  // The FSM restarts with each episode
  rec.end();
  rec.start(1000);
  rec.record(50, 50, false, 0.0f, 1000);
  assert(rec.current().frames[0].observation[0] == 0.0f);
  rec.end();

  fs::remove_all(dir);
}

static void testEmptyEpisodeDiscarded() {
  const std::string dir = freshDir("empty");
  EpisodeRecorder rec(configIn(dir));

  assert(rec.start(0));
  assert(rec.end());
  assert(rec.stats().episodes_discarded == 1);
  assert(rec.pendingCount() == 0);
  assert(rec.persistedEpisodes() == 0);
  assert(!fs::exists(fs::path(dir) / "ds" / "meta" / "episodes.json"));

  // Index is reused
  assert(rec.start(10));
  assert(rec.currentEpisodeIndex() == 0);
  rec.end();
  fs::remove_all(dir);
}

static void testDisabled() {
  const std::string dir = freshDir("disabled");
  RecorderConfig cfg = configIn(dir);
  cfg.enabled = false;
  EpisodeRecorder rec(cfg);
  assert(!rec.start(0));
  assert(!rec.isRecording());
  assert(!rec.record(50, 50, false, 0.0f, 0));
  fs::remove_all(dir);
}

// Failed save keeps the episode; the next successful end() writes both.
static void testRetryAfterFailedSave() {
  const std::string dir = freshDir("retry");
  EpisodeRecorder rec(configIn(dir));

  // A directory where the data temp file should go makes the write fail
  const fs::path blocker = fs::path(dir) / "ds" / "data.npz.tmp";
  fs::create_directories(blocker);

  rec.start(0);
  for (uint32_t i = 0; i < 3; i++) rec.record(30, 30, false, 0.0f, i * 16);
  assert(rec.end());
  assert(!rec.lastSaveResult().ok());
  assert(rec.lastSaveResult().status == DatasetStatus::IO_ERROR);
  assert(rec.pendingCount() == 1);
  assert(rec.pending()[0].episode_index == 0);
  assert(rec.persistedEpisodes() == 0);
  assert(rec.stats().save_failures == 1);

  rec.start(1000);
  assert(rec.currentEpisodeIndex() == 1);
  for (uint32_t i = 0; i < 5; i++) rec.record(-30, -30, false, 0.0f, 1000 + i * 16);

  fs::remove_all(blocker);
  assert(rec.end());
  assert(rec.lastSaveResult().ok());
  assert(rec.pendingCount() == 0);
  assert(rec.persistedEpisodes() == 2);

  std::vector<EpisodeInfo> infos;
  assert(rec.store().loadEpisodeIndex(infos).ok());
  assert(infos.size() == 2);
  assert(infos[0].episode_index == 0 && infos[0].num_frames == 3);
  assert(infos[1].episode_index == 1 && infos[1].num_frames == 5);

  DatasetColumns cols;
  assert(rec.store().loadColumns(cols).ok());
  assert(cols.rows() == 8);
  for (size_t r = 0; r < 3; r++) assert(cols.episode_index[r] == 0 && cols.action[r * 2] == 30.0f);
  for (size_t r = 3; r < 8; r++) assert(cols.episode_index[r] == 1 && cols.action[r * 2] == -30.0f);

  fs::remove_all(dir);
}

// A save that fails after data.npz was replaced must not leave the dataset
// claiming the episode; the retry then writes contiguous indices.
static void testRetryAfterFailedMetadataWrite() {
  const char* blocked[] = {"meta/info.json.tmp", "meta/episodes.json.tmp"};
  for (const char* name : blocked) {
    const std::string dir = freshDir("meta_retry");
    EpisodeRecorder rec(configIn(dir));
    const fs::path blocker = fs::path(dir) / "ds" / name;
    fs::create_directories(blocker);

    rec.start(0);
    for (uint32_t i = 0; i < 3; i++) rec.record(30, 30, false, 0.0f, i * 16);
    assert(rec.end());
    assert(rec.lastSaveResult().status == DatasetStatus::IO_ERROR);
    assert(rec.pendingCount() == 1);
    assert(!fs::exists(fs::path(dir) / "ds" / "meta" / "episodes.json"));
    assert(rec.store().persistedEpisodeCount() == 0);

    rec.start(1000);
    assert(rec.currentEpisodeIndex() == 1);
    for (uint32_t i = 0; i < 2; i++) rec.record(-30, -30, false, 0.0f, 1000 + i * 16);

    fs::remove_all(blocker);
    assert(rec.end());
    assert(rec.lastSaveResult().ok());
    assert(rec.pendingCount() == 0);
    assert(rec.persistedEpisodes() == 2);

    std::vector<EpisodeInfo> infos;
    assert(rec.store().loadEpisodeIndex(infos).ok());
    assert(infos.size() == 2);
    assert(infos[0].episode_index == 0 && infos[0].num_frames == 3);
    assert(infos[1].episode_index == 1 && infos[1].num_frames == 2);

    // Rows from the failed attempt are not duplicated
    DatasetColumns cols;
    assert(rec.store().loadColumns(cols).ok());
    assert(cols.rows() == 5);
    for (size_t r = 0; r < 3; r++) assert(cols.episode_index[r] == 0);
    for (size_t r = 3; r < 5; r++) assert(cols.episode_index[r] == 1);

    fs::remove_all(dir);
  }
}

static void testFlushOnShutdownPath() {
  const std::string dir = freshDir("flush");
  EpisodeRecorder rec(configIn(dir));
  const fs::path blocker = fs::path(dir) / "ds" / "data.npz.tmp";
  fs::create_directories(blocker);

  rec.start(0);
  rec.record(20, 20, false, 0.0f, 0);
  rec.end();
  assert(rec.pendingCount() == 1);

  fs::remove_all(blocker);
  assert(rec.flush().ok());
  assert(rec.pendingCount() == 0);
  assert(rec.persistedEpisodes() == 1);
  fs::remove_all(dir);
}

int main() {
  setLogSink([](LogLevel, const char*) {});

  testQuantize();
  testIdleOperationsAreNoOps();
  testEpisodeFramesAndSave();
  testCollisionObservation();
  testEmptyEpisodeDiscarded();
  testDisabled();
  testRetryAfterFailedSave();
  testRetryAfterFailedMetadataWrite();
  testFlushOnShutdownPath();

  std::cout << "All tests passed\n";
  return 0;
}
