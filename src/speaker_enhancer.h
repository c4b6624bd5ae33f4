#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "embedder.h"

struct EnhancerOptions {
  int frame_ms = 25;
  int hop_ms = 10;
  float temperature = 3.0f;
  float threshold = 0.2f;
  int smoothing_ms = 50;
  float min_gain_db = -18.0f;
};

struct MaskStats {
  float mask_mean = 0.0f;
  float mask_std = 0.0f;
};

// Suppresses non-target speech in overlap regions. A per-frame gain derived
// from the similarity of short windows to the speaker's reference embedding
// is applied to the STFT magnitude (same gain for every bin).
//
// Thread-safe per speaker: the reference embedding is computed at most once.
class TargetSpeakerEnhancer {
 public:
  TargetSpeakerEnhancer(EmbeddingExtractor& embedder, const EnhancerOptions& opts);

  // Returns exactly chunk.size() samples. May throw when the embedder fails.
  std::vector<float> enhance(const std::vector<float>& chunk, int sample_rate, const std::string& speaker_id);

  MaskStats last_mask_stats() const;

  bool has_reference(const std::string& speaker_id) const;

  // Per-hop sigmoid scores, smoothed. Exposed for tests.
  std::vector<float> score_track(const std::vector<float>& chunk, int sample_rate, const std::vector<float>& target);

 private:
  struct Slot {
    std::mutex mu;
    bool ready = false;
    std::vector<float> embedding;
  };

  const std::vector<float>& reference_for(const std::string& speaker_id, const std::vector<float>& chunk,
                                          int sample_rate);
  size_t hop_samples(int sample_rate) const;
  size_t window_samples(int sample_rate) const;
  float score(const float* samples, size_t count, int sample_rate, const std::vector<float>& target);

  EmbeddingExtractor& embedder_;
  EnhancerOptions opts_;

  mutable std::mutex slots_mu_;
  std::map<std::string, std::unique_ptr<Slot>> slots_;

  mutable std::mutex stats_mu_;
  MaskStats last_stats_;
};
