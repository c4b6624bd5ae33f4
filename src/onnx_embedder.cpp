#include "onnx_embedder.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

#include "audio_io.h"
#include "stft.h"

namespace {

int default_threads() {
  int n = static_cast<int>(std::thread::hardware_concurrency());
  if (n <= 0) n = 4;
  return std::max(1, (n + 1) / 2);
}

}  // namespace

OrtEmbeddingExtractor::OrtEmbeddingExtractor(const EmbedderModelConfig& config, const Options& opts)
    : config_(config),
      opts_(opts),
      env_(ORT_LOGGING_LEVEL_WARNING, "speaker-tracks-embedder"),
      mem_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
  const int threads = opts_.threads > 0 ? opts_.threads : default_threads();
  session_options_.SetIntraOpNumThreads(threads);
  session_options_.SetInterOpNumThreads(1);
  session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
  session_ = std::make_unique<Ort::Session>(env_, config_.model_path.wstring().c_str(), session_options_);
#else
  session_ = std::make_unique<Ort::Session>(env_, config_.model_path.string().c_str(), session_options_);
#endif

  Ort::AllocatorWithDefaultOptions allocator;
  input_name_ = session_->GetInputNameAllocated(0, allocator).get();
  output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

  embedding_dim_ = config_.embedding_dim;
  if (embedding_dim_ <= 0) {
    const auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    int64_t dim = 1;
    for (size_t i = 1; i < shape.size(); ++i) dim *= shape[i];
    embedding_dim_ = dim > 0 ? dim : 0;  // dynamic dims resolve on first run
  }
}

std::vector<float> OrtEmbeddingExtractor::extract(const float* samples, size_t count, int sample_rate) {
  if (samples == nullptr || sample_rate <= 0) throw std::runtime_error("invalid embedder input");
  const double seconds = double(count) / double(sample_rate);
  if (seconds < opts_.min_seconds) {
    throw std::runtime_error("clip too short for embedding (" + std::to_string(seconds) + "s)");
  }

  std::vector<float> wav(samples, samples + count);
  if (sample_rate != config_.sample_rate) {
    wav = resample_mono(wav, sample_rate, config_.sample_rate);
  }
  const size_t max_len = size_t(opts_.max_seconds * float(config_.sample_rate));
  if (max_len > 0 && wav.size() > max_len) {
    const size_t off = (wav.size() - max_len) / 2;
    wav = std::vector<float>(wav.begin() + off, wav.begin() + off + max_len);
  }

  auto emb = config_.type == EmbedderType::FBANK ? run_fbank(wav) : run_waveform(wav);
  if (!normalize_embedding(emb)) throw std::runtime_error("embedder returned a zero vector");
  return emb;
}

std::vector<float> OrtEmbeddingExtractor::run_waveform(std::vector<float>& wav) {
  std::vector<int64_t> shape{1, int64_t(wav.size())};
  Ort::Value input = Ort::Value::CreateTensor<float>(mem_, wav.data(), wav.size(), shape.data(), shape.size());
  return run_session(input);
}

std::vector<float> OrtEmbeddingExtractor::run_fbank(const std::vector<float>& wav) {
  int frames = 0;
  auto feats = log_mel_fbank(wav.data(), wav.size(), config_.sample_rate, /*n_mels=*/80, frames);
  if (frames <= 0) throw std::runtime_error("clip too short for fbank features");
  std::vector<int64_t> shape{1, int64_t(frames), 80};
  Ort::Value input = Ort::Value::CreateTensor<float>(mem_, feats.data(), feats.size(), shape.data(), shape.size());
  return run_session(input);
}

std::vector<float> OrtEmbeddingExtractor::run_session(Ort::Value& input) {
  const char* input_names[] = {input_name_.c_str()};
  const char* output_names[] = {output_name_.c_str()};
  auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names, &input, 1, output_names, 1);
  if (outputs.empty()) throw std::runtime_error("ORT returned no outputs");

  auto& out0 = outputs[0];
  const auto shape = out0.GetTensorTypeAndShapeInfo().GetShape();
  int64_t dim = 1;
  for (size_t i = 1; i < shape.size(); ++i) dim *= shape[i];
  if (shape.size() == 1) dim = shape[0];
  if (dim <= 0) throw std::runtime_error("Unexpected embedding shape");
  if (embedding_dim_ <= 0) embedding_dim_ = dim;
  if (dim != embedding_dim_) throw std::runtime_error("Inconsistent embedding dim across calls");

  const float* data = out0.GetTensorData<float>();
  return std::vector<float>(data, data + size_t(dim));
}

std::unique_ptr<OrtEmbeddingExtractor> try_load_embedder(
    const std::string& model_dir, const OrtEmbeddingExtractor::Options& opts, std::string& error) {
  error.clear();
  if (model_dir.empty()) {
    error = "no embedder model directory configured";
    return nullptr;
  }
  try {
    const auto config = detect_embedder_config(model_dir);
    return std::make_unique<OrtEmbeddingExtractor>(config, opts);
  } catch (const Ort::Exception& e) {
    error = std::string("ONNX Runtime error: ") + e.what();
  } catch (const std::exception& e) {
    error = e.what();
  }
  return nullptr;
}
