#pragma once

#include <cmath>
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "embedder.h"

// Deterministic 2-d embedding: the angle is 3 * mean(sample). Clips filled
// with close constant levels are therefore similar voices.
class FakeEmbedder : public EmbeddingExtractor {
 public:
  size_t min_samples = 1;
  bool fail = false;
  int calls = 0;

  std::vector<float> extract(const float* samples, size_t count, int sample_rate) override {
    ++calls;
    if (fail) throw std::runtime_error("fake embedder failure");
    if (sample_rate <= 0 || count < min_samples) throw std::runtime_error("clip too short");
    double mean = 0.0;
    for (size_t i = 0; i < count; ++i) mean += samples[i];
    mean /= double(count);
    const double a = 3.0 * mean;
    return {float(std::cos(a)), float(std::sin(a))};
  }
  using EmbeddingExtractor::extract;
};

// Fill [start, end) seconds of audio with a constant level.
inline void fill_level(std::vector<float>& audio, int sample_rate, double start, double end, float level) {
  const size_t s = size_t(start * sample_rate);
  const size_t e = std::min(audio.size(), size_t(end * sample_rate));
  for (size_t i = s; i < e; ++i) audio[i] = level;
}

// Scratch directory removed on scope exit.
struct TempDir {
  std::filesystem::path path;

  explicit TempDir(const std::string& tag) {
    std::random_device rd;
    path = std::filesystem::temp_directory_path() / ("speaker_tracks_" + tag + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};
