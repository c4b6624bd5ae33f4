#include <gtest/gtest.h>

#include "turn_postprocess.h"

static SpeakerTurn turn(double s, double e, const std::string& spk, float conf = 1.0f) {
  SpeakerTurn t;
  t.start = s;
  t.end = e;
  t.speaker_id = spk;
  t.confidence = conf;
  return t;
}

static void expect_same(const Timeline& a, const Timeline& b) {
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].speaker_id, b[i].speaker_id) << "turn " << i;
    EXPECT_DOUBLE_EQ(a[i].start, b[i].start) << "turn " << i;
    EXPECT_DOUBLE_EQ(a[i].end, b[i].end) << "turn " << i;
    EXPECT_FLOAT_EQ(a[i].confidence, b[i].confidence) << "turn " << i;
  }
}

TEST(Postprocess, EmptyInput) {
  EXPECT_TRUE(postprocess_turns({}, 250, 400, 120).empty());
}

TEST(Postprocess, MergeGapBoundary) {
  const Timeline in{turn(0.0, 1.0, "A"), turn(1.25, 2.0, "A")};

  const auto merged = postprocess_turns(in, 250, 0, 0);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_DOUBLE_EQ(merged[0].start, 0.0);
  EXPECT_DOUBLE_EQ(merged[0].end, 2.0);

  const auto split = postprocess_turns(in, 100, 0, 0);
  ASSERT_EQ(split.size(), 2u);
}

TEST(Postprocess, TwoHundredMillisecondGap) {
  const Timeline in{turn(0.0, 1.0, "A"), turn(1.2, 2.0, "A")};

  const auto merged = postprocess_turns(in, 250, 0, 0);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_DOUBLE_EQ(merged[0].start, 0.0);
  EXPECT_DOUBLE_EQ(merged[0].end, 2.0);

  const auto split = postprocess_turns(in, 100, 0, 0);
  ASSERT_EQ(split.size(), 2u);
  EXPECT_DOUBLE_EQ(split[1].start, 1.2);
}

TEST(Postprocess, MergeKeepsMinConfidenceAndMaxEnd) {
  const Timeline in{turn(0.0, 3.0, "A", 0.9f), turn(1.0, 2.0, "A", 0.6f)};
  const auto out = postprocess_turns(in, 250, 0, 0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].end, 3.0);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.6f);
}

TEST(Postprocess, DifferentSpeakersNeverMerge) {
  const Timeline in{turn(0.0, 1.0, "A"), turn(1.0, 2.0, "B")};
  EXPECT_EQ(postprocess_turns(in, 1000, 0, 0).size(), 2u);
}

TEST(Postprocess, UnsortedInputIsSorted) {
  const Timeline in{turn(5.0, 6.0, "B"), turn(0.0, 1.0, "A"), turn(2.0, 3.0, "B")};
  const auto out = postprocess_turns(in, 0, 0, 0);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_DOUBLE_EQ(out[0].start, 0.0);
  EXPECT_DOUBLE_EQ(out[1].start, 2.0);
  EXPECT_DOUBLE_EQ(out[2].start, 5.0);
}

TEST(Postprocess, ShortTurnAbsorbedIntoPrevious) {
  const Timeline in{turn(0.0, 2.0, "A"), turn(2.5, 2.75, "B", 0.4f), turn(4.0, 6.0, "C")};
  const auto out = postprocess_turns(in, 250, 400, 0);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].speaker_id, "A");
  EXPECT_DOUBLE_EQ(out[0].end, 2.75);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.4f);
  EXPECT_EQ(out[1].speaker_id, "C");
}

TEST(Postprocess, AbsorptionClosesGapToSameSpeaker) {
  const Timeline in{turn(0.0, 2.0, "A"), turn(2.125, 2.25, "B"), turn(2.5, 4.0, "A")};
  const auto out = postprocess_turns(in, 250, 400, 0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].speaker_id, "A");
  EXPECT_DOUBLE_EQ(out[0].start, 0.0);
  EXPECT_DOUBLE_EQ(out[0].end, 4.0);
}

TEST(Postprocess, ShortFirstTurnIsKept) {
  const Timeline in{turn(0.0, 0.125, "B"), turn(1.0, 3.0, "A")};
  const auto out = postprocess_turns(in, 250, 400, 0);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].speaker_id, "B");
  EXPECT_DOUBLE_EQ(out[0].end, 0.125);
}

TEST(Postprocess, PaddingClampsAtZero) {
  const Timeline in{turn(0.05, 1.0, "A"), turn(2.0, 3.0, "B")};
  const auto out = postprocess_turns(in, 0, 0, 120);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_DOUBLE_EQ(out[0].start, 0.0);
  EXPECT_NEAR(out[0].end, 1.12, 1e-9);
  EXPECT_NEAR(out[1].start, 1.88, 1e-9);
  EXPECT_NEAR(out[1].end, 3.12, 1e-9);
}

TEST(Postprocess, IdempotentWithoutPadding) {
  const Timeline in{
      turn(0.0, 1.5, "A", 0.9f), turn(1.625, 2.0, "A"), turn(2.0, 2.125, "B"), turn(3.0, 5.0, "B", 0.7f),
      turn(4.5, 6.0, "A"),       turn(6.125, 6.25, "C"), turn(8.0, 9.5, "C"),  turn(9.5, 9.75, "A"),
  };
  const auto once = postprocess_turns(in, 250, 400, 0);
  const auto twice = postprocess_turns(once, 250, 400, 0);
  expect_same(once, twice);
}
