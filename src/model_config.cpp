#include "model_config.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string embedder_type_to_string(EmbedderType type) {
  switch (type) {
    case EmbedderType::WAVEFORM:
      return "waveform speaker embedder ([1, samples] input)";
    case EmbedderType::FBANK:
      return "fbank speaker embedder ([1, frames, 80] input)";
    case EmbedderType::UNKNOWN:
    default:
      return "Unknown";
  }
}

EmbedderModelConfig detect_embedder_config(const fs::path& model_dir) {
  EmbedderModelConfig config;

  const fs::path model_onnx = model_dir / "embedding.onnx";
  const fs::path model_int8_onnx = model_dir / "embedding.int8.onnx";
  const fs::path meta_json = model_dir / "embedding.json";

  if (fs::exists(model_int8_onnx)) {
    config.model_path = model_int8_onnx;
  } else if (fs::exists(model_onnx)) {
    config.model_path = model_onnx;
  } else {
    throw std::runtime_error(
        "No embedding model found in " + model_dir.string() +
        " (expected embedding.onnx or embedding.int8.onnx)");
  }

  config.type = EmbedderType::WAVEFORM;
  if (fs::exists(meta_json)) {
    std::ifstream f(meta_json, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open: " + meta_json.string());
    const auto j = nlohmann::json::parse(f);
    const std::string input = j.value("input", std::string("waveform"));
    if (input == "waveform") {
      config.type = EmbedderType::WAVEFORM;
    } else if (input == "fbank") {
      config.type = EmbedderType::FBANK;
    } else {
      throw std::runtime_error("Unsupported embedder input kind '" + input + "' in " + meta_json.string());
    }
    config.sample_rate = j.value("sample_rate", config.sample_rate);
    config.embedding_dim = j.value("embedding_dim", config.embedding_dim);
  }
  config.description = embedder_type_to_string(config.type);
  return config;
}
