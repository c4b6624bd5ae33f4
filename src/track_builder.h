#pragma once

#include <string>
#include <vector>

#include "embedder.h"
#include "logger.h"
#include "speaker_enhancer.h"
#include "speaker_merger.h"
#include "time_map.h"
#include "timeline.h"
#include "turn_postprocess.h"

// Compact, speaker-exclusive track: the speaker's turns concatenated
// back-to-back, plus the map from compact to global time.
struct SpeakerTrack {
  std::string speaker_id;
  std::vector<float> samples;
  int sample_rate = 16000;
  TimeMap time_map;
  double kept_seconds = 0.0;        // global seconds kept
  double overlapped_seconds = 0.0;  // global seconds that intersect another speaker
  size_t overlapped_turns = 0;
  size_t enhanced_turns = 0;

  double overlap_ratio() const { return kept_seconds > 0.0 ? overlapped_seconds / kept_seconds : 0.0; }
  double compact_seconds() const { return sample_rate > 0 ? double(samples.size()) / double(sample_rate) : 0.0; }
};

struct TrackBuilderOptions {
  PostprocessOptions postprocess{150, 200, 0};
  bool similarity_merge = true;
  MergeOptions merge;
  bool enhance_overlaps = false;
};

struct BuildResult {
  Timeline timeline;  // refined timeline the tracks were cut from
  std::vector<SpeakerTrack> tracks;
  size_t raw_speakers = 0;
  bool degraded = false;  // no diarization turns: single speaker_0 track

  // One track (or none): the caller should bypass multi-speaker processing.
  bool single_speaker() const { return tracks.size() <= 1; }
};

class TrackBuilder {
 public:
  explicit TrackBuilder(const TrackBuilderOptions& opts, Logger* log = nullptr);

  // Optional collaborators, owned by the caller.
  void set_embedder(EmbeddingExtractor* embedder) { embedder_ = embedder; }
  void set_enhancer(TargetSpeakerEnhancer* enhancer) { enhancer_ = enhancer; }

  // Cut one compact track per speaker from a canonical timeline.
  // Speakers with no usable audio are omitted.
  std::vector<SpeakerTrack> build(const Timeline& timeline, const std::vector<float>& audio, int sample_rate) const;

  // Full stage: postprocess raw turns, similarity-merge short speakers, build.
  // No turns at all degrades to one speaker_0 track over the whole input.
  BuildResult build_from_turns(const Timeline& raw_turns, const std::vector<float>& audio, int sample_rate) const;

 private:
  bool overlaps_other(const std::vector<SpeakerTurns>& groups, size_t self, double s, double e) const;

  TrackBuilderOptions opts_;
  Logger* log_ = nullptr;
  EmbeddingExtractor* embedder_ = nullptr;
  TargetSpeakerEnhancer* enhancer_ = nullptr;
};
