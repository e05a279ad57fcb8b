#include "recording/DatasetStore.h"
#include "recording/Crc32.h"
#include "recording/NpzArchive.h"
#include "utils/Log.h"

#include <ArduinoJson.h>

#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

/*=============================================================================
  HELPERS
=============================================================================*/

static std::string freshDir(const char* name) {
  fs::path p = fs::temp_directory_path() /
               ("cube_teleop_ds_" + std::string(name) + "_" + std::to_string(getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p.string();
}

static std::vector<uint8_t> readBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write((const char*)bytes.data(), (std::streamsize)bytes.size());
}

static void writeText(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

static Episode makeEpisode(int64_t index, int frames, float base) {
  Episode ep;
  ep.episode_index = index;
  for (int i = 0; i < frames; i++) {
    Frame f;
    f.timestamp = (float)i * 0.016f;
    f.observation[0] = (float)(i % 2);
    f.observation[1] = (float)(i % 3 - 1);
    f.observation[2] = (float)i / (float)frames;
    f.action[0] = base + (float)i * 10.0f;
    f.action[1] = -base;
    f.episode_index = index;
    f.frame_index = i;
    f.done = (i == frames - 1);
    ep.frames.push_back(f);
  }
  return ep;
}

static bool sameColumns(const DatasetColumns& a, const DatasetColumns& b) {
  return a.observation == b.observation && a.action == b.action &&
         a.episode_index == b.episode_index && a.frame_index == b.frame_index &&
         a.timestamp == b.timestamp && a.done == b.done;
}

// Rewrites data.npz with one array replaced
static void replaceArray(DatasetStore& store, const NpyArray& replacement) {
  std::vector<NpyArray> arrays;
  std::string error;
  assert(npz::decodeArchive(readBytes(store.dataPath()), arrays, error));
  for (NpyArray& a : arrays) {
    if (a.name == replacement.name) a = replacement;
  }
  writeBytes(store.dataPath(), npz::encodeArchive(arrays));
}


/*=============================================================================
  TESTS
=============================================================================*/

static void testNothingToSave() {
  const std::string dir = freshDir("empty");
  DatasetStore store(dir, "ds");
  assert(store.persistedEpisodeCount() == 0);

  std::vector<Episode> none;
  assert(store.save(none).status == DatasetStatus::NOTHING_TO_SAVE);

  DatasetColumns cols;
  assert(store.loadColumns(cols).status == DatasetStatus::NOT_FOUND);
  fs::remove_all(dir);
}

static void testSaveWritesAllFiles() {
  const std::string dir = freshDir("files");
  DatasetStore store(dir, "ds", 60.0f);

  std::vector<Episode> eps;
  eps.push_back(makeEpisode(0, 4, 30.0f));
  eps.push_back(makeEpisode(1, 6, 50.0f));

  DatasetSummary summary;
  DatasetResult r = store.save(eps, &summary);
  assert(r.ok());
  assert(summary.added_episodes == 2 && summary.added_frames == 10);
  assert(summary.total_episodes == 2 && summary.total_frames == 10);
  assert(store.persistedEpisodeCount() == 2);

  assert(!fs::exists(store.dataPath() + ".tmp"));
  assert(!fs::exists(store.infoPath() + ".tmp"));
  assert(!fs::exists(store.episodesPath() + ".tmp"));

  // data.npz: stored ZIP, first entry is a v1.0 .npy with a 64-byte aligned header
  const std::vector<uint8_t> image = readBytes(store.dataPath());
  assert(image.size() > 30);
  assert(image[0] == 'P' && image[1] == 'K' && image[2] == 3 && image[3] == 4);
  const uint16_t name_len = (uint16_t)(image[26] | (image[27] << 8));
  const std::string first_name((const char*)&image[30], name_len);
  assert(first_name == "observation.state.npy");

  const uint8_t* npy = &image[30 + name_len];
  assert(npy[0] == 0x93 && memcmp(npy + 1, "NUMPY", 5) == 0);
  assert(npy[6] == 1 && npy[7] == 0);
  const uint16_t header_len = (uint16_t)(npy[8] | (npy[9] << 8));
  assert((10 + header_len) % 64 == 0);
  const std::string header((const char*)npy + 10, header_len);
  assert(header.find("'descr': '<f4'") != std::string::npos);
  assert(header.find("'fortran_order': False") != std::string::npos);
  assert(header.find("'shape': (10, 3)") != std::string::npos);
  assert(header.back() == '\n');

  // meta/info.json
  std::ifstream info_in(store.infoPath());
  DynamicJsonDocument info(4096);
  assert(!deserializeJson(info, info_in));
  assert(info["schema_version"] == DATASET_SCHEMA_VERSION);
  assert(info["fps"] == 60);
  assert(info["total_episodes"] == 2);
  assert(info["total_frames"] == 10);
  assert(info["features"]["observation.state"]["dtype"] == "float32");
  assert(info["features"]["observation.state"]["shape"][0] == 3);
  assert(info["features"]["observation.state"]["names"][1] == "rotation_direction");
  assert(info["features"]["action"]["shape"][0] == 2);
  assert(info["features"]["episode_index"]["dtype"] == "int64");
  assert(info["features"]["next.done"]["dtype"] == "bool");

  // meta/episodes.json
  std::vector<EpisodeInfo> infos;
  assert(store.loadEpisodeIndex(infos).ok());
  assert(infos.size() == 2);
  assert(infos[0].episode_index == 0 && infos[0].num_frames == 4);
  assert(infos[1].episode_index == 1 && infos[1].num_frames == 6);
  assert(infos[1].task == RECORDING_TASK);
  assert(infos[1].duration > 0.079 && infos[1].duration < 0.081);

  fs::remove_all(dir);
}

static void testMergeIsAssociative() {
  const std::string dir = freshDir("merge");
  DatasetStore together(dir, "together");
  DatasetStore apart(dir, "apart");

  const Episode a = makeEpisode(0, 5, 20.0f);
  const Episode b = makeEpisode(1, 3, -40.0f);

  std::vector<Episode> both;
  both.push_back(a);
  both.push_back(b);
  assert(together.save(both).ok());

  assert(apart.save(std::vector<Episode>(1, a)).ok());
  DatasetSummary summary;
  assert(apart.save(std::vector<Episode>(1, b), &summary).ok());
  assert(summary.added_episodes == 1 && summary.total_episodes == 2);
  assert(summary.total_frames == 8);

  DatasetColumns c1, c2;
  assert(together.loadColumns(c1).ok());
  assert(apart.loadColumns(c2).ok());
  assert(c1.rows() == 8);
  assert(sameColumns(c1, c2));

  std::vector<EpisodeInfo> i1, i2;
  assert(together.loadEpisodeIndex(i1).ok());
  assert(apart.loadEpisodeIndex(i2).ok());
  assert(i1.size() == i2.size());
  for (size_t i = 0; i < i1.size(); i++) {
    assert(i1[i].episode_index == i2[i].episode_index);
    assert(i1[i].num_frames == i2[i].num_frames);
  }

  // Values survive the round trip through the file
  assert(c1.action[0] == 20.0f && c1.action[1] == -20.0f);
  assert(c1.episode_index[5] == 1 && c1.frame_index[5] == 0);
  assert(c1.done[4] == 1 && c1.done[3] == 0 && c1.done[7] == 1);

  fs::remove_all(dir);
}

static void testEpisodeNumberingMustContinue() {
  const std::string dir = freshDir("gap");
  DatasetStore store(dir, "ds");

  assert(store.save(std::vector<Episode>(1, makeEpisode(3, 2, 10.0f))).status == DatasetStatus::CORRUPT);
  assert(!fs::exists(store.dataPath()));

  assert(store.save(std::vector<Episode>(1, makeEpisode(0, 2, 10.0f))).ok());
  assert(store.save(std::vector<Episode>(1, makeEpisode(0, 2, 10.0f))).status == DatasetStatus::CORRUPT);
  assert(store.save(std::vector<Episode>(1, makeEpisode(1, 2, 10.0f))).ok());
  fs::remove_all(dir);
}

static void testSchemaMismatch() {
  const std::string dir = freshDir("schema");

  // observation.state width changed
  {
    DatasetStore store(dir, "width");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());

    NpyArray obs;
    obs.name = "observation.state";
    obs.dtype = NpyDtype::FLOAT32;
    obs.shape = {3, 2};
    obs.data.assign(3 * 2 * 4, 0);
    replaceArray(store, obs);

    DatasetColumns cols;
    assert(store.loadColumns(cols).status == DatasetStatus::SCHEMA_MISMATCH);
    DatasetResult r = store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f)));
    assert(r.status == DatasetStatus::SCHEMA_MISMATCH);
    assert(!r.detail.empty());
    assert(store.persistedEpisodeCount() == 1);
  }

  // action dtype changed
  {
    DatasetStore store(dir, "dtype");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());

    NpyArray act;
    act.name = "action";
    act.dtype = NpyDtype::INT64;
    act.shape = {3, 2};
    act.data.assign(3 * 2 * 8, 0);
    replaceArray(store, act);

    assert(store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f))).status ==
           DatasetStatus::SCHEMA_MISMATCH);
  }

  // schema_version changed
  {
    DatasetStore store(dir, "version");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    writeText(store.infoPath(), "{\"schema_version\": 2, \"fps\": 60}");
    assert(store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f))).status ==
           DatasetStatus::SCHEMA_MISMATCH);
  }

  // Unversioned metadata with a 2-D observation
  {
    DatasetStore store(dir, "legacy");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    writeText(store.infoPath(),
              "{\"fps\": 60, \"features\": {\"observation.state\": {\"dtype\": \"float32\", \"shape\": [2]}}}");
    assert(store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f))).status ==
           DatasetStatus::SCHEMA_MISMATCH);
  }

  fs::remove_all(dir);
}

static void testCorruptDataset() {
  const std::string dir = freshDir("corrupt");

  // Flipped payload byte fails the CRC check
  {
    DatasetStore store(dir, "crc");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    std::vector<uint8_t> image = readBytes(store.dataPath());
    image[30 + 21 + 64 + 2] ^= 0xFF;
    writeBytes(store.dataPath(), image);

    DatasetColumns cols;
    assert(store.loadColumns(cols).status == DatasetStatus::CORRUPT);
    assert(store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f))).status == DatasetStatus::CORRUPT);
  }

  // Index without data
  {
    DatasetStore store(dir, "nodata");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    fs::remove(store.dataPath());
    assert(store.save(std::vector<Episode>(1, makeEpisode(1, 3, 10.0f))).status == DatasetStatus::CORRUPT);
  }

  // Unequal row counts
  {
    DatasetStore store(dir, "rows");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    NpyArray ts;
    ts.name = "timestamp";
    ts.dtype = NpyDtype::FLOAT32;
    ts.shape = {2};
    ts.data.assign(2 * 4, 0);
    replaceArray(store, ts);

    DatasetColumns cols;
    assert(store.loadColumns(cols).status == DatasetStatus::CORRUPT);
  }

  // Malformed episode index: counts as 0 but appending is refused
  {
    DatasetStore store(dir, "index");
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).ok());
    writeText(store.episodesPath(), "[{\"episode_index\": 0,");
    assert(store.persistedEpisodeCount() == 0);
    assert(store.save(std::vector<Episode>(1, makeEpisode(0, 3, 10.0f))).status == DatasetStatus::CORRUPT);
  }

  fs::remove_all(dir);
}

// Data replaced but episode index not yet written: the orphan rows are dropped.
static void testInterruptedSaveLeftoversDropped() {
  const std::string dir = freshDir("interrupted");
  DatasetStore store(dir, "ds");
  DatasetStore scratch(dir, "scratch");

  assert(store.save(std::vector<Episode>(1, makeEpisode(0, 4, 10.0f))).ok());

  std::vector<Episode> two;
  two.push_back(makeEpisode(0, 4, 10.0f));
  two.push_back(makeEpisode(1, 9, 99.0f));
  assert(scratch.save(two).ok());
  fs::copy_file(scratch.dataPath(), store.dataPath(), fs::copy_options::overwrite_existing);

  assert(store.persistedEpisodeCount() == 1);

  DatasetSummary summary;
  assert(store.save(std::vector<Episode>(1, makeEpisode(1, 2, -20.0f)), &summary).ok());
  assert(summary.total_frames == 6);

  DatasetColumns cols;
  assert(store.loadColumns(cols).ok());
  assert(cols.rows() == 6);
  assert(cols.episode_index[4] == 1);
  assert(cols.action[4 * 2] == -20.0f);

  fs::remove_all(dir);
}

static void testLoadEpisode() {
  const std::string dir = freshDir("load");
  DatasetStore store(dir, "ds");

  std::vector<Episode> eps;
  eps.push_back(makeEpisode(0, 3, 10.0f));
  eps.push_back(makeEpisode(1, 5, 70.0f));
  assert(store.save(eps).ok());

  EpisodeTrack track;
  assert(store.loadEpisode(1, track).ok());
  assert(track.episode_index == 1);
  assert(track.frames.size() == 5);
  assert(track.frames[0].timestamp == 0.0f);
  assert(track.frames[0].action[0] == 70.0f);
  assert(track.frames[4].action[0] == 110.0f);
  assert(track.frames[4].done);
  assert(track.frames[2].frame_index == 2);

  assert(store.loadEpisode(7, track).status == DatasetStatus::NOT_FOUND);
  fs::remove_all(dir);
}

static void testTruncateEpisodes() {
  DatasetColumns cols;
  const Episode a = makeEpisode(0, 2, 1.0f);
  const Episode b = makeEpisode(1, 3, 2.0f);
  for (const Frame& f : a.frames) cols.append(f);
  for (const Frame& f : b.frames) cols.append(f);
  assert(cols.rows() == 5);
  assert(cols.observation.size() == 5 * OBSERVATION_DIM);

  assert(cols.truncateEpisodes(1) == 3);
  assert(cols.rows() == 2);
  assert(cols.action.size() == 2 * ACTION_DIM);
  assert(cols.truncateEpisodes(1) == 0);
}

static void testCrc32() {
  assert(crc32_compute("123456789", 9) == 0xCBF43926u);
}

int main() {
  setLogSink([](LogLevel, const char*) {});

  testCrc32();
  testTruncateEpisodes();
  testNothingToSave();
  testSaveWritesAllFiles();
  testMergeIsAssociative();
  testEpisodeNumberingMustContinue();
  testSchemaMismatch();
  testCorruptDataset();
  testInterruptedSaveLeftoversDropped();
  testLoadEpisode();

  std::cout << "All tests passed\n";
  return 0;
}
