#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "recording/Episode.h"

/*
===============================================================================
  DatasetStore.h
===============================================================================

  PURPOSE
  -------
  Durable, append-only dataset on disk:

    <output_dir>/<dataset_name>/data.npz            column arrays
    <output_dir>/<dataset_name>/meta/info.json      schema + totals
    <output_dir>/<dataset_name>/meta/episodes.json  one entry per episode

  Columns (all with the same row count):
    observation.state  float32 (N, 3)
    action             float32 (N, 2)
    episode_index      int64   (N,)
    frame_index        int64   (N,)
    timestamp          float32 (N,)
    next.done          bool    (N,)

  save() merges new episodes after the existing rows. Every file is written
  to "<file>.tmp" and renamed into place: data first, then metadata, then the
  episode index. The index rename is the commit point. Rows whose episode_index is not listed in episodes.json are
  leftovers of an interrupted save and are dropped before merging.

  ERRORS
  ------
  IO_ERROR        filesystem failure (retry later)
  SCHEMA_MISMATCH existing dtype / shape / schema_version differs
  CORRUPT         unreadable archive, unequal row counts, index gaps
===============================================================================
*/

enum class DatasetStatus : uint8_t {
  OK = 0,
  NOTHING_TO_SAVE,
  NOT_FOUND,
  IO_ERROR,
  SCHEMA_MISMATCH,
  CORRUPT,
};

const char* datasetStatusName(DatasetStatus status);

struct DatasetResult {
  DatasetStatus status = DatasetStatus::OK;
  std::string detail;

  bool ok() const { return status == DatasetStatus::OK; }

  static DatasetResult success() { return DatasetResult(); }
  static DatasetResult fail(DatasetStatus s, const std::string& detail) {
    DatasetResult r;
    r.status = s;
    r.detail = detail;
    return r;
  }
};

struct DatasetSummary {
  uint32_t added_episodes = 0;
  uint64_t added_frames = 0;
  uint32_t total_episodes = 0;
  uint64_t total_frames = 0;
  std::string path;
};

// One entry of meta/episodes.json
struct EpisodeInfo {
  int64_t episode_index = 0;
  uint32_t num_frames = 0;
  double duration = 0.0;
  std::string task;
};

// All column arrays, row-major
struct DatasetColumns {
  std::vector<float> observation;     // rows * OBSERVATION_DIM
  std::vector<float> action;          // rows * ACTION_DIM
  std::vector<int64_t> episode_index;
  std::vector<int64_t> frame_index;
  std::vector<float> timestamp;
  std::vector<uint8_t> done;

  size_t rows() const { return episode_index.size(); }

  void append(const Frame& f);
  void append(const DatasetColumns& other);

  // Keeps only rows with episode_index < limit
  size_t truncateEpisodes(int64_t limit);
};

// One episode read back for replay
struct EpisodeTrack {
  int64_t episode_index = 0;
  std::vector<Frame> frames;
};

class DatasetStore {
public:
  DatasetStore(const std::string& output_dir,
               const std::string& dataset_name = RECORDING_DATASET_NAME,
               float fps = (float)CONTROL_RATE_HZ);

  // Appends episodes (in order) to the dataset.
  DatasetResult save(const std::vector<Episode>& episodes, DatasetSummary* summary = nullptr);

  // Number of entries in meta/episodes.json (0 if missing or unreadable)
  uint32_t persistedEpisodeCount() const;

  DatasetResult loadEpisodeIndex(std::vector<EpisodeInfo>& out) const;
  DatasetResult loadColumns(DatasetColumns& out) const;
  DatasetResult loadEpisode(int64_t episode_index, EpisodeTrack& out) const;

  const std::string& datasetDir() const { return _dir; }
  std::string dataPath() const;
  std::string infoPath() const;
  std::string episodesPath() const;

  float fps() const { return _fps; }

private:
  DatasetResult readSchemaVersion_() const;
  DatasetResult writeData_(const DatasetColumns& cols) const;
  DatasetResult writeEpisodeIndex_(const std::vector<EpisodeInfo>& infos) const;
  DatasetResult writeInfo_(uint32_t total_episodes, uint64_t total_frames) const;

  std::string _dir;
  float _fps;
};
