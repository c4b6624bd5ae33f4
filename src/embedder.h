#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

// Voice-similarity embedding extractor. Implementations return a fixed-length
// vector per clip and may throw std::exception when a clip cannot be embedded.
class EmbeddingExtractor {
 public:
  virtual ~EmbeddingExtractor() = default;

  virtual std::vector<float> extract(const float* samples, size_t count, int sample_rate) = 0;

  std::vector<float> extract(const std::vector<float>& samples, int sample_rate) {
    return extract(samples.data(), samples.size(), sample_rate);
  }
};

// L2-normalise in place. Returns false for a zero vector (left untouched).
inline bool normalize_embedding(std::vector<float>& emb) {
  double norm = 0.0;
  for (float v : emb) norm += double(v) * double(v);
  norm = std::sqrt(norm);
  if (norm <= 1e-9) return false;
  for (float& v : emb) v = float(double(v) / norm);
  return true;
}

// Cosine similarity; 0 when either vector is zero or the sizes differ.
inline float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0f;
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += double(a[i]) * double(b[i]);
    na += double(a[i]) * double(a[i]);
    nb += double(b[i]) * double(b[i]);
  }
  if (na <= 0.0 || nb <= 0.0) return 0.0f;
  return float(dot / (std::sqrt(na) * std::sqrt(nb)));
}
