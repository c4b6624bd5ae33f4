#include <gtest/gtest.h>

#include "fake_embedder.h"
#include "track_builder.h"

static SpeakerTurn turn(double s, double e, const std::string& spk) {
  SpeakerTurn t;
  t.start = s;
  t.end = e;
  t.speaker_id = spk;
  return t;
}

static const int kRate = 1000;

static std::vector<float> ramp_audio(double seconds) {
  std::vector<float> audio(size_t(seconds * kRate));
  for (size_t i = 0; i < audio.size(); ++i) audio[i] = float(i % 100) / 100.0f;
  return audio;
}

static const SpeakerTrack* find_track(const std::vector<SpeakerTrack>& tracks, const std::string& id) {
  for (const auto& t : tracks) {
    if (t.speaker_id == id) return &t;
  }
  return nullptr;
}

static void expect_coverage(const SpeakerTrack& track) {
  EXPECT_TRUE(is_valid_time_map(track.time_map));
  double sum = 0.0;
  for (const auto& m : track.time_map) sum += m.compact_end - m.compact_start;
  EXPECT_NEAR(sum, double(track.samples.size()) / track.sample_rate, 1e-9);
  EXPECT_NEAR(compact_length(track.time_map), track.compact_seconds(), 1e-9);
}

TEST(TrackBuilder, CompactTracksAndMaps) {
  const auto audio = ramp_audio(5.0);
  const Timeline tl{turn(0.0, 2.0, "A"), turn(1.5, 3.0, "B"), turn(3.5, 4.5, "A")};

  TrackBuilder builder(TrackBuilderOptions{});
  const auto tracks = builder.build(tl, audio, kRate);
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].speaker_id, "A");
  EXPECT_EQ(tracks[1].speaker_id, "B");

  const auto& a = tracks[0];
  ASSERT_EQ(a.time_map.size(), 2u);
  EXPECT_DOUBLE_EQ(a.time_map[0].compact_start, 0.0);
  EXPECT_DOUBLE_EQ(a.time_map[0].compact_end, 2.0);
  EXPECT_DOUBLE_EQ(a.time_map[1].compact_start, 2.0);
  EXPECT_DOUBLE_EQ(a.time_map[1].compact_end, 3.0);
  EXPECT_DOUBLE_EQ(a.time_map[1].global_start, 3.5);
  EXPECT_DOUBLE_EQ(a.time_map[1].global_end, 4.5);
  EXPECT_EQ(a.samples.size(), 3000u);
  EXPECT_FLOAT_EQ(a.samples[2000], audio[3500]);
  expect_coverage(a);
  expect_coverage(tracks[1]);
}

TEST(TrackBuilder, OverlapStatistics) {
  const auto audio = ramp_audio(5.0);
  const Timeline tl{turn(0.0, 2.0, "A"), turn(1.5, 3.0, "B"), turn(3.5, 4.5, "A")};

  TrackBuilder builder(TrackBuilderOptions{});
  const auto tracks = builder.build(tl, audio, kRate);
  const auto* a = find_track(tracks, "A");
  const auto* b = find_track(tracks, "B");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_DOUBLE_EQ(a->kept_seconds, 3.0);
  EXPECT_DOUBLE_EQ(a->overlapped_seconds, 2.0);
  EXPECT_NEAR(a->overlap_ratio(), 2.0 / 3.0, 1e-12);
  EXPECT_EQ(a->overlapped_turns, 1u);
  EXPECT_DOUBLE_EQ(b->overlap_ratio(), 1.0);
}

TEST(TrackBuilder, TurnsPastTheEndAreClampedOrSkipped) {
  const auto audio = ramp_audio(5.0);
  const Timeline tl{turn(4.5, 6.0, "A"), turn(5.5, 7.0, "B")};

  TrackBuilder builder(TrackBuilderOptions{});
  const auto tracks = builder.build(tl, audio, kRate);
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks[0].speaker_id, "A");
  ASSERT_EQ(tracks[0].time_map.size(), 1u);
  EXPECT_DOUBLE_EQ(tracks[0].time_map[0].global_end, 5.0);
  EXPECT_EQ(tracks[0].samples.size(), 500u);
  expect_coverage(tracks[0]);
}

TEST(TrackBuilder, EmptyInputs) {
  TrackBuilder builder(TrackBuilderOptions{});
  EXPECT_TRUE(builder.build({}, ramp_audio(1.0), kRate).empty());
  EXPECT_TRUE(builder.build({turn(0.0, 1.0, "A")}, {}, kRate).empty());
  EXPECT_THROW(builder.build({turn(0.0, 1.0, "A")}, ramp_audio(1.0), 0), std::runtime_error);
}

TEST(TrackBuilder, NoTurnsDegradesToSingleSpeaker) {
  const auto audio = ramp_audio(3.0);
  TrackBuilder builder(TrackBuilderOptions{});
  const auto result = builder.build_from_turns({}, audio, kRate);
  EXPECT_TRUE(result.degraded);
  EXPECT_TRUE(result.single_speaker());
  ASSERT_EQ(result.tracks.size(), 1u);
  const auto& t = result.tracks[0];
  EXPECT_EQ(t.speaker_id, "speaker_0");
  EXPECT_EQ(t.samples.size(), audio.size());
  ASSERT_EQ(t.time_map.size(), 1u);
  EXPECT_DOUBLE_EQ(t.time_map[0].global_start, 0.0);
  EXPECT_DOUBLE_EQ(t.time_map[0].global_end, 3.0);
}

TEST(TrackBuilder, FullStageMergesShortSpeaker) {
  std::vector<float> audio(size_t(10 * kRate), 0.0f);
  fill_level(audio, kRate, 0.0, 4.0, 0.2f);
  fill_level(audio, kRate, 4.0, 7.0, -0.4f);
  fill_level(audio, kRate, 7.5, 8.5, 0.21f);

  const Timeline raw{turn(0.0, 4.0, "A"), turn(4.0, 7.0, "B"), turn(7.5, 8.5, "C")};
  FakeEmbedder emb;
  TrackBuilder builder(TrackBuilderOptions{});
  builder.set_embedder(&emb);

  const auto result = builder.build_from_turns(raw, audio, kRate);
  EXPECT_FALSE(result.degraded);
  EXPECT_EQ(result.raw_speakers, 3u);
  EXPECT_EQ(count_speakers(result.timeline), 2u);
  ASSERT_EQ(result.tracks.size(), 2u);
  const auto* a = find_track(result.tracks, "A");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->time_map.size(), 2u);
  expect_coverage(*a);
}

TEST(TrackBuilder, MergeDisabledKeepsAllSpeakers) {
  std::vector<float> audio(size_t(10 * kRate), 0.2f);
  const Timeline raw{turn(0.0, 4.0, "A"), turn(4.0, 7.0, "B"), turn(7.5, 8.5, "C")};
  FakeEmbedder emb;
  TrackBuilderOptions opts;
  opts.similarity_merge = false;
  TrackBuilder builder(opts);
  builder.set_embedder(&emb);

  const auto result = builder.build_from_turns(raw, audio, kRate);
  EXPECT_EQ(result.tracks.size(), 3u);
  EXPECT_EQ(emb.calls, 0);
}

TEST(TrackBuilder, EnhancedOverlapsKeepLength) {
  std::vector<float> audio(size_t(5 * kRate), 0.1f);
  const Timeline tl{turn(0.0, 2.0, "A"), turn(1.5, 3.0, "B")};
  FakeEmbedder emb;
  TargetSpeakerEnhancer enhancer(emb, EnhancerOptions{});
  TrackBuilderOptions opts;
  opts.enhance_overlaps = true;
  TrackBuilder builder(opts);
  builder.set_enhancer(&enhancer);

  const auto tracks = builder.build(tl, audio, kRate);
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].enhanced_turns, 1u);
  EXPECT_EQ(tracks[0].samples.size(), 2000u);
  EXPECT_EQ(tracks[1].samples.size(), 1500u);
  expect_coverage(tracks[0]);
  EXPECT_TRUE(enhancer.has_reference("A"));
  EXPECT_TRUE(enhancer.has_reference("B"));
}

TEST(TrackBuilder, EnhancerFailureKeepsOriginalChunk) {
  const auto audio = ramp_audio(5.0);
  const Timeline tl{turn(0.0, 2.0, "A"), turn(1.5, 3.0, "B")};
  FakeEmbedder emb;
  emb.fail = true;
  TargetSpeakerEnhancer enhancer(emb, EnhancerOptions{});
  TrackBuilderOptions opts;
  opts.enhance_overlaps = true;
  TrackBuilder builder(opts);
  builder.set_enhancer(&enhancer);

  const auto tracks = builder.build(tl, audio, kRate);
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].enhanced_turns, 0u);
  ASSERT_EQ(tracks[0].samples.size(), 2000u);
  for (size_t i = 0; i < 2000; i += 137) EXPECT_FLOAT_EQ(tracks[0].samples[i], audio[i]);
}
