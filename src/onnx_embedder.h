#pragma once

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "embedder.h"
#include "model_config.h"

// ONNX Runtime speaker-embedding extractor.
// Clips are resampled to the model rate; clips shorter than min_seconds throw.
class OrtEmbeddingExtractor : public EmbeddingExtractor {
 public:
  struct Options {
    int threads = 0;            // 0 means auto
    float min_seconds = 0.02f;  // shorter clips are rejected
    float max_seconds = 10.0f;  // longer clips are centre-cropped
  };

  OrtEmbeddingExtractor(const EmbedderModelConfig& config, const Options& opts);

  OrtEmbeddingExtractor(const OrtEmbeddingExtractor&) = delete;
  OrtEmbeddingExtractor& operator=(const OrtEmbeddingExtractor&) = delete;

  std::vector<float> extract(const float* samples, size_t count, int sample_rate) override;
  using EmbeddingExtractor::extract;

  int64_t embedding_dim() const { return embedding_dim_; }
  const EmbedderModelConfig& config() const { return config_; }

 private:
  std::vector<float> run_waveform(std::vector<float>& wav);
  std::vector<float> run_fbank(const std::vector<float>& wav);
  std::vector<float> run_session(Ort::Value& input);

  EmbedderModelConfig config_;
  Options opts_;
  Ort::Env env_;
  Ort::SessionOptions session_options_;
  std::unique_ptr<Ort::Session> session_;
  Ort::MemoryInfo mem_;
  std::string input_name_;
  std::string output_name_;
  int64_t embedding_dim_ = 0;
};

// Load the embedder from a model directory. Returns nullptr and sets error
// when the model is missing or fails to load.
std::unique_ptr<OrtEmbeddingExtractor> try_load_embedder(
    const std::string& model_dir, const OrtEmbeddingExtractor::Options& opts, std::string& error);
