#include <gtest/gtest.h>

#include "fake_embedder.h"
#include "speaker_merger.h"

static SpeakerTurn turn(double s, double e, const std::string& spk) {
  SpeakerTurn t;
  t.start = s;
  t.end = e;
  t.speaker_id = spk;
  return t;
}

static const int kRate = 1000;

// A: 6s at level 0.2, B: 2s at level -0.4, C: 1s at level c_level.
static std::vector<float> three_speaker_audio(float c_level) {
  std::vector<float> audio(size_t(10 * kRate), 0.0f);
  fill_level(audio, kRate, 0.0, 3.0, 0.2f);
  fill_level(audio, kRate, 3.0, 5.0, -0.4f);
  fill_level(audio, kRate, 5.0, 8.0, 0.2f);
  fill_level(audio, kRate, 8.0, 9.0, c_level);
  return audio;
}

static Timeline three_speaker_timeline() {
  return {turn(0.0, 3.0, "A"), turn(3.0, 5.0, "B"), turn(5.0, 8.0, "A"), turn(8.0, 9.0, "C")};
}

TEST(SpeakerEmbedding, MeanOfLongestTurnsIsNormalised) {
  FakeEmbedder emb;
  std::vector<float> audio(size_t(4 * kRate), 0.1f);
  const std::vector<SpeakerTurn> turns{turn(0.0, 1.0, "A"), turn(1.0, 3.0, "A")};
  const auto v = speaker_embedding(turns, audio, kRate, emb);
  ASSERT_EQ(v.size(), 2u);
  EXPECT_NEAR(double(v[0]) * v[0] + double(v[1]) * v[1], 1.0, 1e-5);
  EXPECT_EQ(emb.calls, 2);
}

TEST(SpeakerEmbedding, AllFailuresGiveEmpty) {
  FakeEmbedder emb;
  emb.fail = true;
  std::vector<float> audio(size_t(4 * kRate), 0.1f);
  EXPECT_TRUE(speaker_embedding({turn(0.0, 1.0, "A")}, audio, kRate, emb).empty());
}

TEST(SpeakerMerger, ShortSpeakerJoinsMostSimilar) {
  FakeEmbedder emb;
  const auto audio = three_speaker_audio(0.21f);
  const auto in = three_speaker_timeline();

  const auto r = merge_short_turns(in, audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.short_turns, 1u);
  EXPECT_EQ(r.relabeled, 1u);
  EXPECT_EQ(r.below_threshold, 0u);
  ASSERT_EQ(r.timeline.size(), 4u);
  EXPECT_EQ(r.timeline.back().speaker_id, "A");
  EXPECT_EQ(count_speakers(r.timeline), 2u);
}

TEST(SpeakerMerger, BelowThresholdStillMerges) {
  FakeEmbedder emb;
  const auto audio = three_speaker_audio(0.9f);
  const auto r = merge_short_turns(three_speaker_timeline(), audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.relabeled, 1u);
  EXPECT_EQ(r.below_threshold, 1u);
  EXPECT_EQ(r.timeline.back().speaker_id, "A");
}

TEST(SpeakerMerger, NeverIncreasesSpeakerCount) {
  FakeEmbedder emb;
  for (float level : {-0.9f, -0.4f, 0.0f, 0.21f, 0.9f}) {
    const auto in = three_speaker_timeline();
    const auto r = merge_short_turns(in, three_speaker_audio(level), kRate, emb, MergeOptions{});
    EXPECT_LE(count_speakers(r.timeline), count_speakers(in)) << "level " << level;
    EXPECT_EQ(r.timeline.size(), in.size());
  }
}

TEST(SpeakerMerger, NoReferencesLeavesInputUnchanged) {
  FakeEmbedder emb;
  emb.fail = true;
  const auto in = three_speaker_timeline();
  const auto r = merge_short_turns(in, three_speaker_audio(0.21f), kRate, emb, MergeOptions{});
  EXPECT_EQ(r.relabeled, 0u);
  ASSERT_EQ(r.timeline.size(), in.size());
  EXPECT_EQ(r.timeline.back().speaker_id, "C");
}

TEST(SpeakerMerger, UnembeddableShortTurnKeepsLabel) {
  FakeEmbedder emb;
  emb.min_samples = 500;
  std::vector<float> audio(size_t(10 * kRate), 0.2f);
  const Timeline in{turn(0.0, 3.0, "A"), turn(3.0, 3.25, "C"), turn(4.0, 6.0, "A")};
  const auto r = merge_short_turns(in, audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.short_turns, 1u);
  EXPECT_EQ(r.relabeled, 0u);
  ASSERT_EQ(r.timeline.size(), 3u);
  EXPECT_EQ(r.timeline[1].speaker_id, "C");
}

TEST(SpeakerMerger, NothingToDoWithoutShortOrLongSpeakers) {
  FakeEmbedder emb;
  std::vector<float> audio(size_t(10 * kRate), 0.2f);

  const Timeline all_long{turn(0.0, 3.0, "A"), turn(3.0, 6.0, "B")};
  auto r = merge_short_turns(all_long, audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.relabeled, 0u);
  EXPECT_EQ(emb.calls, 0);

  const Timeline all_short{turn(0.0, 1.0, "A"), turn(1.0, 2.0, "B")};
  r = merge_short_turns(all_short, audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.relabeled, 0u);
  EXPECT_EQ(r.timeline[1].speaker_id, "B");

  const Timeline single{turn(0.0, 1.0, "A")};
  r = merge_short_turns(single, audio, kRate, emb, MergeOptions{});
  EXPECT_EQ(r.timeline.size(), 1u);
}

TEST(SpeakerMerger, OutputIsSorted) {
  FakeEmbedder emb;
  const auto r = merge_short_turns(three_speaker_timeline(), three_speaker_audio(0.21f), kRate, emb, MergeOptions{});
  for (size_t i = 1; i < r.timeline.size(); ++i) {
    EXPECT_LE(r.timeline[i - 1].start, r.timeline[i].start);
  }
}
