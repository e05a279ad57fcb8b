#include "recording/DatasetStore.h"

#include <ArduinoJson.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string.h>
#include <system_error>

#include "recording/NpzArchive.h"
#include "utils/Log.h"

/*
===============================================================================
  DatasetStore.cpp
===============================================================================

  Notes:
  - Array payloads are encoded little-endian byte by byte, so the files are
    the same on any host.
  - JSON documents use ArduinoJson. Keys and feature names are string
    literals (stored by pointer, no copy).
===============================================================================
*/

namespace fs = std::filesystem;

static const char* TAG = "dataset";

static const char* COL_OBSERVATION = "observation.state";
static const char* COL_ACTION      = "action";
static const char* COL_EPISODE     = "episode_index";
static const char* COL_FRAME       = "frame_index";
static const char* COL_TIMESTAMP   = "timestamp";
static const char* COL_DONE        = "next.done";

static const char* OBSERVATION_NAMES[OBSERVATION_DIM] = {
  "collision", "rotation_direction", "frame_count"
};
static const char* ACTION_NAMES[ACTION_DIM] = {
  "left_motor", "right_motor"
};

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

const char* datasetStatusName(DatasetStatus status) {
  switch (status) {
    case DatasetStatus::OK:              return "OK";
    case DatasetStatus::NOTHING_TO_SAVE: return "NOTHING_TO_SAVE";
    case DatasetStatus::NOT_FOUND:       return "NOT_FOUND";
    case DatasetStatus::IO_ERROR:        return "IO_ERROR";
    case DatasetStatus::SCHEMA_MISMATCH: return "SCHEMA_MISMATCH";
    case DatasetStatus::CORRUPT:         return "CORRUPT";
  }
  return "?";
}

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

// Write "<path>.tmp" then rename over path
static DatasetResult writeFileAtomic(const std::string& path, const void* data, size_t len) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return DatasetResult::fail(DatasetStatus::IO_ERROR, "cannot open " + tmp);
    }
    out.write(static_cast<const char*>(data), (std::streamsize)len);
    out.flush();
    if (!out) {
      return DatasetResult::fail(DatasetStatus::IO_ERROR, "short write to " + tmp);
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "rename to " + path + " failed");
  }
  return DatasetResult::success();
}

static void putF32(std::vector<uint8_t>& out, float v) {
  uint32_t bits;
  memcpy(&bits, &v, sizeof(bits));
  for (int i = 0; i < 4; i++) out.push_back((uint8_t)((bits >> (8 * i)) & 0xFF));
}

static void putI64(std::vector<uint8_t>& out, int64_t v) {
  const uint64_t bits = (uint64_t)v;
  for (int i = 0; i < 8; i++) out.push_back((uint8_t)((bits >> (8 * i)) & 0xFF));
}

static float getF32(const uint8_t* p) {
  const uint32_t bits = (uint32_t)p[0] | ((uint32_t)p[1] << 8) |
                        ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
  float v;
  memcpy(&v, &bits, sizeof(v));
  return v;
}

static int64_t getI64(const uint8_t* p) {
  uint64_t bits = 0;
  for (int i = 7; i >= 0; i--) bits = (bits << 8) | p[i];
  return (int64_t)bits;
}

static NpyArray floatArray(const char* name, const std::vector<float>& values, uint64_t rows, uint64_t width) {
  NpyArray a;
  a.name = name;
  a.dtype = NpyDtype::FLOAT32;
  a.shape.push_back(rows);
  if (width > 0) a.shape.push_back(width);
  a.data.reserve(values.size() * 4);
  for (float v : values) putF32(a.data, v);
  return a;
}

static NpyArray intArray(const char* name, const std::vector<int64_t>& values) {
  NpyArray a;
  a.name = name;
  a.dtype = NpyDtype::INT64;
  a.shape.push_back(values.size());
  a.data.reserve(values.size() * 8);
  for (int64_t v : values) putI64(a.data, v);
  return a;
}

static NpyArray boolArray(const char* name, const std::vector<uint8_t>& values) {
  NpyArray a;
  a.name = name;
  a.dtype = NpyDtype::BOOL;
  a.shape.push_back(values.size());
  a.data.reserve(values.size());
  for (uint8_t v : values) a.data.push_back(v ? 1 : 0);
  return a;
}

// width 0 = 1-D column
static DatasetResult checkColumn(const NpyArray* a, const char* name, NpyDtype dtype, uint64_t width) {
  if (!a) {
    return DatasetResult::fail(DatasetStatus::SCHEMA_MISMATCH,
                               std::string("existing dataset has no column ") + name);
  }
  if (a->dtype != dtype) {
    return DatasetResult::fail(DatasetStatus::SCHEMA_MISMATCH,
                               std::string(name) + " is " + npz::dtypeName(a->dtype) +
                               ", expected " + npz::dtypeName(dtype));
  }
  const size_t ndim = width == 0 ? 1 : 2;
  if (a->shape.size() != ndim || (width > 0 && a->shape[1] != width)) {
    std::string shape = "(";
    for (size_t i = 0; i < a->shape.size(); i++) {
      if (i) shape += ", ";
      shape += std::to_string(a->shape[i]);
    }
    shape += ")";
    return DatasetResult::fail(DatasetStatus::SCHEMA_MISMATCH,
                               std::string(name) + " has shape " + shape +
                               ", expected width " + std::to_string(width == 0 ? 1 : width));
  }
  return DatasetResult::success();
}

static const NpyArray* findArray(const std::vector<NpyArray>& arrays, const char* name) {
  for (const NpyArray& a : arrays) {
    if (a.name == name) return &a;
  }
  return nullptr;
}


/*=============================================================================
  DatasetColumns
=============================================================================*/

void DatasetColumns::append(const Frame& f) {
  observation.insert(observation.end(), f.observation, f.observation + OBSERVATION_DIM);
  action.insert(action.end(), f.action, f.action + ACTION_DIM);
  episode_index.push_back(f.episode_index);
  frame_index.push_back(f.frame_index);
  timestamp.push_back(f.timestamp);
  done.push_back(f.done ? 1 : 0);
}

void DatasetColumns::append(const DatasetColumns& other) {
  observation.insert(observation.end(), other.observation.begin(), other.observation.end());
  action.insert(action.end(), other.action.begin(), other.action.end());
  episode_index.insert(episode_index.end(), other.episode_index.begin(), other.episode_index.end());
  frame_index.insert(frame_index.end(), other.frame_index.begin(), other.frame_index.end());
  timestamp.insert(timestamp.end(), other.timestamp.begin(), other.timestamp.end());
  done.insert(done.end(), other.done.begin(), other.done.end());
}

size_t DatasetColumns::truncateEpisodes(int64_t limit) {
  DatasetColumns kept;
  const size_t n = rows();
  for (size_t r = 0; r < n; r++) {
    if (episode_index[r] >= limit) continue;
    kept.observation.insert(kept.observation.end(),
                            observation.begin() + r * OBSERVATION_DIM,
                            observation.begin() + (r + 1) * OBSERVATION_DIM);
    kept.action.insert(kept.action.end(),
                       action.begin() + r * ACTION_DIM,
                       action.begin() + (r + 1) * ACTION_DIM);
    kept.episode_index.push_back(episode_index[r]);
    kept.frame_index.push_back(frame_index[r]);
    kept.timestamp.push_back(timestamp[r]);
    kept.done.push_back(done[r]);
  }
  const size_t dropped = n - kept.rows();
  *this = kept;
  return dropped;
}


/*=============================================================================
  DatasetStore
=============================================================================*/

DatasetStore::DatasetStore(const std::string& output_dir, const std::string& dataset_name, float fps)
: _dir((fs::path(output_dir) / dataset_name).string()),
  _fps(fps)
{
}

std::string DatasetStore::dataPath() const {
  return (fs::path(_dir) / "data.npz").string();
}

std::string DatasetStore::infoPath() const {
  return (fs::path(_dir) / "meta" / "info.json").string();
}

std::string DatasetStore::episodesPath() const {
  return (fs::path(_dir) / "meta" / "episodes.json").string();
}

uint32_t DatasetStore::persistedEpisodeCount() const {
  std::vector<EpisodeInfo> infos;
  const DatasetResult r = loadEpisodeIndex(infos);
  if (r.status == DatasetStatus::NOT_FOUND) return 0;
  if (!r.ok()) {
    logf(LogLevel::WARN, TAG, "could not read existing episodes: %s", r.detail.c_str());
    return 0;
  }
  return (uint32_t)infos.size();
}

DatasetResult DatasetStore::loadEpisodeIndex(std::vector<EpisodeInfo>& out) const {
  out.clear();

  std::error_code ec;
  if (!fs::exists(episodesPath(), ec)) {
    return DatasetResult::fail(DatasetStatus::NOT_FOUND, episodesPath());
  }

  std::string text;
  if (!readFile(episodesPath(), text)) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "cannot read " + episodesPath());
  }

  // Grow the pool until the whole index fits
  size_t capacity = text.size() * 2 + 512;
  for (int attempt = 0; attempt < 8; attempt++) {
    DynamicJsonDocument doc(capacity);
    const DeserializationError err = deserializeJson(doc, text);
    if (err == DeserializationError::NoMemory) {
      capacity *= 2;
      continue;
    }
    if (err) {
      return DatasetResult::fail(DatasetStatus::CORRUPT,
                                 episodesPath() + ": " + err.c_str());
    }

    JsonArray arr = doc.as<JsonArray>();
    if (arr.isNull()) {
      return DatasetResult::fail(DatasetStatus::CORRUPT, episodesPath() + " is not an array");
    }

    for (JsonObject o : arr) {
      EpisodeInfo info;
      info.episode_index = o["episode_index"] | (int64_t)-1;
      info.num_frames = o["num_frames"] | (uint32_t)0;
      info.duration = o["duration"] | 0.0;
      info.task = o["task"] | "";
      out.push_back(info);
    }
    return DatasetResult::success();
  }
  return DatasetResult::fail(DatasetStatus::CORRUPT, episodesPath() + " too large");
}

DatasetResult DatasetStore::loadColumns(DatasetColumns& out) const {
  out = DatasetColumns();

  std::error_code ec;
  if (!fs::exists(dataPath(), ec)) {
    return DatasetResult::fail(DatasetStatus::NOT_FOUND, dataPath());
  }

  std::string raw;
  if (!readFile(dataPath(), raw)) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "cannot read " + dataPath());
  }
  const std::vector<uint8_t> image(raw.begin(), raw.end());

  std::vector<NpyArray> arrays;
  std::string error;
  if (!npz::decodeArchive(image, arrays, error)) {
    return DatasetResult::fail(DatasetStatus::CORRUPT, dataPath() + ": " + error);
  }

  const NpyArray* obs  = findArray(arrays, COL_OBSERVATION);
  const NpyArray* act  = findArray(arrays, COL_ACTION);
  const NpyArray* epi  = findArray(arrays, COL_EPISODE);
  const NpyArray* frm  = findArray(arrays, COL_FRAME);
  const NpyArray* ts   = findArray(arrays, COL_TIMESTAMP);
  const NpyArray* done = findArray(arrays, COL_DONE);

  DatasetResult r;
  if (!(r = checkColumn(obs,  COL_OBSERVATION, NpyDtype::FLOAT32, OBSERVATION_DIM)).ok()) return r;
  if (!(r = checkColumn(act,  COL_ACTION,      NpyDtype::FLOAT32, ACTION_DIM)).ok()) return r;
  if (!(r = checkColumn(epi,  COL_EPISODE,     NpyDtype::INT64,   0)).ok()) return r;
  if (!(r = checkColumn(frm,  COL_FRAME,       NpyDtype::INT64,   0)).ok()) return r;
  if (!(r = checkColumn(ts,   COL_TIMESTAMP,   NpyDtype::FLOAT32, 0)).ok()) return r;
  if (!(r = checkColumn(done, COL_DONE,        NpyDtype::BOOL,    0)).ok()) return r;

  const uint64_t rows = epi->rows();
  if (obs->rows() != rows || act->rows() != rows || frm->rows() != rows ||
      ts->rows() != rows || done->rows() != rows) {
    return DatasetResult::fail(DatasetStatus::CORRUPT, "column row counts differ in " + dataPath());
  }

  out.observation.reserve(rows * OBSERVATION_DIM);
  for (uint64_t i = 0; i < rows * OBSERVATION_DIM; i++) out.observation.push_back(getF32(&obs->data[i * 4]));
  out.action.reserve(rows * ACTION_DIM);
  for (uint64_t i = 0; i < rows * ACTION_DIM; i++) out.action.push_back(getF32(&act->data[i * 4]));
  for (uint64_t i = 0; i < rows; i++) {
    out.episode_index.push_back(getI64(&epi->data[i * 8]));
    out.frame_index.push_back(getI64(&frm->data[i * 8]));
    out.timestamp.push_back(getF32(&ts->data[i * 4]));
    out.done.push_back(done->data[i] ? 1 : 0);
  }
  return DatasetResult::success();
}

DatasetResult DatasetStore::loadEpisode(int64_t episode_index, EpisodeTrack& out) const {
  out = EpisodeTrack();
  out.episode_index = episode_index;

  DatasetColumns cols;
  const DatasetResult r = loadColumns(cols);
  if (!r.ok()) return r;

  for (size_t row = 0; row < cols.rows(); row++) {
    if (cols.episode_index[row] != episode_index) continue;
    Frame f;
    for (size_t k = 0; k < OBSERVATION_DIM; k++) f.observation[k] = cols.observation[row * OBSERVATION_DIM + k];
    for (size_t k = 0; k < ACTION_DIM; k++) f.action[k] = cols.action[row * ACTION_DIM + k];
    f.episode_index = episode_index;
    f.frame_index = cols.frame_index[row];
    f.timestamp = cols.timestamp[row];
    f.done = cols.done[row] != 0;
    out.frames.push_back(f);
  }

  if (out.frames.empty()) {
    return DatasetResult::fail(DatasetStatus::NOT_FOUND,
                               "episode " + std::to_string(episode_index) + " not in dataset");
  }
  return DatasetResult::success();
}

DatasetResult DatasetStore::readSchemaVersion_() const {
  std::error_code ec;
  if (!fs::exists(infoPath(), ec)) return DatasetResult::success();

  std::string text;
  if (!readFile(infoPath(), text)) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "cannot read " + infoPath());
  }

  DynamicJsonDocument doc(text.size() * 2 + 1024);
  if (deserializeJson(doc, text)) {
    // Metadata is regenerated on every save; column checks still guard the data
    logf(LogLevel::WARN, TAG, "ignoring unreadable %s", infoPath().c_str());
    return DatasetResult::success();
  }

  if (doc.containsKey("schema_version")) {
    const int version = doc["schema_version"] | -1;
    if (version != DATASET_SCHEMA_VERSION) {
      return DatasetResult::fail(DatasetStatus::SCHEMA_MISMATCH,
                                 "dataset schema_version " + std::to_string(version) +
                                 ", expected " + std::to_string(DATASET_SCHEMA_VERSION));
    }
  }

  // Older datasets have no version; their observation width must still match
  JsonArray shape = doc["features"][COL_OBSERVATION]["shape"];
  if (!shape.isNull() && shape.size() == 1 && (shape[0] | 0) != (int)OBSERVATION_DIM) {
    return DatasetResult::fail(DatasetStatus::SCHEMA_MISMATCH,
                               "observation.state width " + std::to_string(shape[0] | 0) +
                               ", expected " + std::to_string(OBSERVATION_DIM));
  }
  return DatasetResult::success();
}

DatasetResult DatasetStore::writeData_(const DatasetColumns& cols) const {
  const uint64_t rows = cols.rows();

  std::vector<NpyArray> arrays;
  arrays.push_back(floatArray(COL_OBSERVATION, cols.observation, rows, OBSERVATION_DIM));
  arrays.push_back(floatArray(COL_ACTION, cols.action, rows, ACTION_DIM));
  arrays.push_back(intArray(COL_EPISODE, cols.episode_index));
  arrays.push_back(intArray(COL_FRAME, cols.frame_index));
  arrays.push_back(floatArray(COL_TIMESTAMP, cols.timestamp, rows, 0));
  arrays.push_back(boolArray(COL_DONE, cols.done));

  const std::vector<uint8_t> image = npz::encodeArchive(arrays);
  if (image.size() >= 0xFFFFFFFFull) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "dataset exceeds 4 GiB (ZIP64 not supported)");
  }
  return writeFileAtomic(dataPath(), image.data(), image.size());
}

DatasetResult DatasetStore::writeEpisodeIndex_(const std::vector<EpisodeInfo>& infos) const {
  const size_t capacity = JSON_ARRAY_SIZE(infos.size()) +
                          infos.size() * JSON_OBJECT_SIZE(4) + 256;
  DynamicJsonDocument doc(capacity);
  JsonArray arr = doc.to<JsonArray>();

  for (const EpisodeInfo& info : infos) {
    JsonObject o = arr.createNestedObject();
    o["episode_index"] = info.episode_index;
    o["num_frames"] = info.num_frames;
    o["duration"] = info.duration;
    o["task"] = info.task.c_str();   // stored by pointer, infos outlives doc
  }
  if (doc.overflowed()) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "episode index document overflowed");
  }

  std::string text;
  serializeJsonPretty(doc, text);
  text += '\n';
  return writeFileAtomic(episodesPath(), text.data(), text.size());
}

DatasetResult DatasetStore::writeInfo_(uint32_t total_episodes, uint64_t total_frames) const {
  DynamicJsonDocument doc(4096);

  doc["schema_version"] = DATASET_SCHEMA_VERSION;
  doc["fps"] = _fps;
  doc["total_episodes"] = total_episodes;
  doc["total_frames"] = total_frames;

  JsonObject features = doc.createNestedObject("features");

  JsonObject obs = features.createNestedObject(COL_OBSERVATION);
  obs["dtype"] = "float32";
  obs.createNestedArray("shape").add(OBSERVATION_DIM);
  JsonArray obs_names = obs.createNestedArray("names");
  for (const char* n : OBSERVATION_NAMES) obs_names.add(n);

  JsonObject act = features.createNestedObject(COL_ACTION);
  act["dtype"] = "float32";
  act.createNestedArray("shape").add(ACTION_DIM);
  JsonArray act_names = act.createNestedArray("names");
  for (const char* n : ACTION_NAMES) act_names.add(n);

  struct Scalar { const char* name; const char* dtype; };
  const Scalar scalars[] = {
    {COL_EPISODE, "int64"},
    {COL_FRAME, "int64"},
    {COL_TIMESTAMP, "float32"},
    {COL_DONE, "bool"},
  };
  for (const Scalar& s : scalars) {
    JsonObject f = features.createNestedObject(s.name);
    f["dtype"] = s.dtype;
    f.createNestedArray("shape").add(1);
    f["names"] = static_cast<const char*>(nullptr);
  }

  if (doc.overflowed()) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR, "metadata document overflowed");
  }

  std::string text;
  serializeJsonPretty(doc, text);
  text += '\n';
  return writeFileAtomic(infoPath(), text.data(), text.size());
}

DatasetResult DatasetStore::save(const std::vector<Episode>& episodes, DatasetSummary* summary) {
  DatasetColumns added;
  std::vector<EpisodeInfo> added_infos;
  for (const Episode& ep : episodes) {
    for (const Frame& f : ep.frames) added.append(f);

    EpisodeInfo info;
    info.episode_index = ep.episode_index;
    info.num_frames = ep.numFrames();
    info.duration = ep.duration();
    info.task = ep.task;
    added_infos.push_back(info);
  }
  if (added.rows() == 0) {
    return DatasetResult::fail(DatasetStatus::NOTHING_TO_SAVE, "no frames to save");
  }

  std::error_code ec;
  fs::create_directories(fs::path(_dir) / "meta", ec);
  if (ec) {
    return DatasetResult::fail(DatasetStatus::IO_ERROR,
                               "cannot create " + _dir + ": " + ec.message());
  }

  DatasetResult r = readSchemaVersion_();
  if (!r.ok()) return r;

  // Existing episode index (the source of truth for what is persisted)
  std::vector<EpisodeInfo> infos;
  r = loadEpisodeIndex(infos);
  if (!r.ok() && r.status != DatasetStatus::NOT_FOUND) return r;

  const int64_t first = (int64_t)infos.size();
  for (size_t i = 0; i < added_infos.size(); i++) {
    if (added_infos[i].episode_index != first + (int64_t)i) {
      return DatasetResult::fail(DatasetStatus::CORRUPT,
                                 "episode " + std::to_string(added_infos[i].episode_index) +
                                 " does not follow " + std::to_string(first + (int64_t)i - 1));
    }
  }

  // Existing rows
  DatasetColumns merged;
  r = loadColumns(merged);
  if (r.status == DatasetStatus::NOT_FOUND) {
    if (!infos.empty()) {
      return DatasetResult::fail(DatasetStatus::CORRUPT,
                                 "episode index lists " + std::to_string(infos.size()) +
                                 " episodes but " + dataPath() + " is missing");
    }
    logf(LogLevel::INFO, TAG, "starting new dataset at %s", _dir.c_str());
  } else if (!r.ok()) {
    return r;
  } else {
    logf(LogLevel::INFO, TAG, "merging with existing dataset (%lu rows)",
         (unsigned long)merged.rows());
    const size_t dropped = merged.truncateEpisodes(first);
    if (dropped > 0) {
      logf(LogLevel::WARN, TAG, "dropped %lu rows from an interrupted save", (unsigned long)dropped);
    }
  }

  merged.append(added);
  infos.insert(infos.end(), added_infos.begin(), added_infos.end());

  // The episode index rename commits the save
  r = writeData_(merged);
  if (!r.ok()) return r;
  r = writeInfo_((uint32_t)infos.size(), merged.rows());
  if (!r.ok()) return r;
  r = writeEpisodeIndex_(infos);
  if (!r.ok()) return r;

  logf(LogLevel::INFO, TAG, "saved %s: +%lu episodes (+%lu frames), total %lu episodes / %lu frames",
       _dir.c_str(), (unsigned long)added_infos.size(), (unsigned long)added.rows(),
       (unsigned long)infos.size(), (unsigned long)merged.rows());

  if (summary) {
    summary->added_episodes = (uint32_t)added_infos.size();
    summary->added_frames = added.rows();
    summary->total_episodes = (uint32_t)infos.size();
    summary->total_frames = merged.rows();
    summary->path = _dir;
  }
  return DatasetResult::success();
}
