#pragma once

#include <string>
#include <vector>

#include "embedder.h"
#include "logger.h"
#include "timeline.h"

struct MergeOptions {
  double short_threshold_s = 2.0;     // speakers with less total speech are "short"
  float similarity_threshold = 0.7f;  // advisory: below-threshold matches are still taken
};

struct MergeResult {
  Timeline timeline;
  size_t short_turns = 0;   // turns belonging to short speakers
  size_t relabeled = 0;     // short turns reassigned to a long speaker
  size_t below_threshold = 0;
};

// Representative embedding for one speaker: up to max(3, n/2) longest turns,
// one embedding per turn, mean, re-normalised. Turns whose extraction fails are
// skipped; returns an empty vector when none succeeds.
std::vector<float> speaker_embedding(
    const std::vector<SpeakerTurn>& turns,
    const std::vector<float>& audio,
    int sample_rate,
    EmbeddingExtractor& embedder,
    Logger* log = nullptr);

// Reassign turns of short speakers to the most similar long speaker.
// The best match is always taken when at least one long-speaker embedding exists.
MergeResult merge_short_turns(
    const Timeline& timeline,
    const std::vector<float>& audio,
    int sample_rate,
    EmbeddingExtractor& embedder,
    const MergeOptions& opts,
    Logger* log = nullptr);
