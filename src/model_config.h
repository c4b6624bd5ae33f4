#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

enum class EmbedderType {
  WAVEFORM,  // input [1, samples] float waveform (pyannote/wespeaker-style export)
  FBANK,     // input [1, frames, 80] log-mel filterbank
  UNKNOWN
};

struct EmbedderModelConfig {
  EmbedderType type = EmbedderType::UNKNOWN;
  std::filesystem::path model_path;  // embedding.onnx or embedding.int8.onnx
  int sample_rate = 16000;
  int64_t embedding_dim = 0;         // 0 = read from the model output shape
  std::string description;
};

// Auto-detect the embedding model inside a model directory.
// Prefers embedding.int8.onnx over embedding.onnx; an optional
// embedding.json ({"input": "waveform"|"fbank", "sample_rate": N}) overrides defaults.
EmbedderModelConfig detect_embedder_config(const std::filesystem::path& model_dir);

std::string embedder_type_to_string(EmbedderType type);
