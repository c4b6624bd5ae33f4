#include <gtest/gtest.h>

#include "fake_embedder.h"
#include "json_io.h"
#include "track_artifacts.h"

static const int kRate = 16000;

static SpeakerTurn turn(double s, double e, const std::string& spk) {
  SpeakerTurn t;
  t.start = s;
  t.end = e;
  t.speaker_id = spk;
  return t;
}

TEST(TrackArtifacts, EmptyAudioWritesEmptyIndexes) {
  TempDir tmp("artifacts_empty");
  TrackBuilderOptions opts;
  opts.similarity_merge = false;
  TrackBuilder builder(opts);

  const auto result = builder.build_from_turns({turn(0.0, 1.0, "A"), turn(1.0, 2.0, "B")}, {}, kRate);
  EXPECT_TRUE(result.tracks.empty());

  std::vector<TrackSummary> summaries;
  ASSERT_NO_THROW(summaries = write_track_artifacts(tmp.path, result));
  EXPECT_TRUE(summaries.empty());
  EXPECT_TRUE(std::filesystem::exists(tmp.path / "03_speaker_turns.json"));
  EXPECT_TRUE(std::filesystem::exists(tmp.path / "03_tracks.json"));
  EXPECT_TRUE(read_track_index(tmp.path / "04_speaker_track_index.json").empty());
}

TEST(TrackArtifacts, OneDirectoryPerSpeaker) {
  TempDir tmp("artifacts_tracks");
  TrackBuilderOptions opts;
  opts.similarity_merge = false;
  opts.postprocess = {0, 0, 0};
  TrackBuilder builder(opts);

  std::vector<float> audio(size_t(3 * kRate), 0.1f);
  const auto result = builder.build_from_turns({turn(0.0, 1.0, "A"), turn(1.0, 3.0, "B")}, audio, kRate);
  ASSERT_EQ(result.tracks.size(), 2u);

  const auto summaries = write_track_artifacts(tmp.path, result);
  ASSERT_EQ(summaries.size(), 2u);
  EXPECT_EQ(summaries[0].wav_path.string(), (tmp.path / "speakers" / "A" / "A.wav").string());
  EXPECT_TRUE(std::filesystem::exists(summaries[1].wav_path));
  EXPECT_EQ(read_time_map(summaries[1].map_path).size(), 1u);

  const auto index = read_track_index(tmp.path / "04_speaker_track_index.json");
  ASSERT_EQ(index.size(), 2u);
  EXPECT_DOUBLE_EQ(index.at("B").mapping[0].global_start, 1.0);
  EXPECT_EQ(read_speaker_turns(tmp.path / "03_speaker_turns.json").size(), 2u);
}
