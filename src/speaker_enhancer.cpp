#include "speaker_enhancer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "stft.h"

namespace {

// numpy.convolve(x, ones(k)/k, mode="same")
std::vector<float> moving_average_same(const std::vector<float>& x, int k) {
  if (k <= 1 || x.empty()) return x;
  const int m = int(x.size());
  const int full_len = m + k - 1;
  const int out_len = std::max(m, k);
  const int offset = (full_len - out_len) / 2;
  std::vector<float> out(size_t(out_len), 0.0f);
  for (int n = 0; n < out_len; ++n) {
    const int fn = n + offset;
    double acc = 0.0;
    for (int j = 0; j < k; ++j) {
      const int xi = fn - j;
      if (xi >= 0 && xi < m) acc += x[size_t(xi)];
    }
    out[size_t(n)] = float(acc / double(k));
  }
  return out;
}

// numpy.interp onto linspace(0,1,n_new) from linspace(0,1,len(values)).
std::vector<float> interp_linspace(const std::vector<float>& values, int n_new) {
  std::vector<float> out(size_t(std::max(0, n_new)));
  if (out.empty() || values.empty()) return out;
  const int m = int(values.size());
  if (m == 1) {
    std::fill(out.begin(), out.end(), values[0]);
    return out;
  }
  for (int i = 0; i < n_new; ++i) {
    const double x = n_new == 1 ? 0.0 : double(i) / double(n_new - 1);
    const double pos = x * double(m - 1);
    const int lo = std::min(m - 2, int(std::floor(pos)));
    const double frac = pos - double(lo);
    out[size_t(i)] = float(double(values[size_t(lo)]) * (1.0 - frac) + double(values[size_t(lo) + 1]) * frac);
  }
  return out;
}

// Zero-padded copy of at least min_count samples.
std::vector<float> padded_clip(const float* samples, size_t count, size_t min_count) {
  std::vector<float> out(std::max(count, min_count), 0.0f);
  std::copy(samples, samples + count, out.begin());
  return out;
}

}  // namespace

TargetSpeakerEnhancer::TargetSpeakerEnhancer(EmbeddingExtractor& embedder, const EnhancerOptions& opts)
    : embedder_(embedder), opts_(opts) {
  if (opts_.hop_ms <= 0 || opts_.frame_ms <= 0) throw std::runtime_error("enhancer: frame_ms and hop_ms must be positive");
}

MaskStats TargetSpeakerEnhancer::last_mask_stats() const {
  std::lock_guard<std::mutex> lock(stats_mu_);
  return last_stats_;
}

bool TargetSpeakerEnhancer::has_reference(const std::string& speaker_id) const {
  std::lock_guard<std::mutex> lock(slots_mu_);
  auto it = slots_.find(speaker_id);
  if (it == slots_.end()) return false;
  std::lock_guard<std::mutex> slot_lock(it->second->mu);
  return it->second->ready;
}

const std::vector<float>& TargetSpeakerEnhancer::reference_for(
    const std::string& speaker_id, const std::vector<float>& chunk, int sample_rate) {
  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lock(slots_mu_);
    auto& entry = slots_[speaker_id];
    if (!entry) entry = std::make_unique<Slot>();
    slot = entry.get();
  }

  std::lock_guard<std::mutex> lock(slot->mu);
  if (slot->ready) return slot->embedding;

  // Centre 1-3 seconds of the first chunk seen for this speaker.
  const size_t total = chunk.size();
  const double dur = double(total) / double(std::max(sample_rate, 1));
  const double want = std::min(3.0, std::max(1.0, dur));
  const size_t center = total / 2;
  const size_t half = size_t(want * double(sample_rate) / 2.0);
  const size_t s = center > half ? center - half : 0;
  const size_t e = std::min(total, center + half);

  auto emb = embedder_.extract(padded_clip(chunk.data() + s, e - s, window_samples(sample_rate)), sample_rate);
  if (!normalize_embedding(emb)) throw std::runtime_error("reference embedding for " + speaker_id + " is zero");
  slot->embedding = std::move(emb);
  slot->ready = true;
  return slot->embedding;
}

size_t TargetSpeakerEnhancer::hop_samples(int sample_rate) const {
  return size_t(std::max(1, opts_.hop_ms * sample_rate / 1000));
}

size_t TargetSpeakerEnhancer::window_samples(int sample_rate) const {
  return std::max(hop_samples(sample_rate), size_t(std::max(0, opts_.frame_ms * sample_rate / 1000)));
}

// Windows shorter than one frame are zero-padded to a full frame.
float TargetSpeakerEnhancer::score(const float* samples, size_t count, int sample_rate,
                                   const std::vector<float>& target) {
  const auto emb = embedder_.extract(padded_clip(samples, count, window_samples(sample_rate)), sample_rate);
  const float sim = cosine_similarity(emb, target);
  return float(1.0 / (1.0 + std::exp(-double(opts_.temperature) * double(sim - opts_.threshold))));
}

std::vector<float> TargetSpeakerEnhancer::score_track(
    const std::vector<float>& chunk, int sample_rate, const std::vector<float>& target) {
  const size_t hop = hop_samples(sample_rate);
  const size_t win = window_samples(sample_rate);

  if (chunk.size() < win) return {score(chunk.data(), chunk.size(), sample_rate, target)};

  std::vector<float> scores;
  const size_t min_len = size_t(0.4 * double(win));
  for (size_t pos = 0; pos < chunk.size(); pos += hop) {
    const size_t len = std::min(win, chunk.size() - pos);
    if (len < min_len) break;
    scores.push_back(score(chunk.data() + pos, len, sample_rate, target));
  }
  if (scores.empty()) scores.push_back(0.5f);

  const int smooth_hops = std::max(1, opts_.smoothing_ms / std::max(opts_.hop_ms, 1));
  return moving_average_same(scores, smooth_hops);
}

std::vector<float> TargetSpeakerEnhancer::enhance(
    const std::vector<float>& chunk, int sample_rate, const std::string& speaker_id) {
  if (chunk.empty()) return chunk;
  if (sample_rate <= 0) throw std::runtime_error("enhancer: invalid sample rate");

  const auto& target = reference_for(speaker_id, chunk, sample_rate);

  const int nperseg = std::max(256, opts_.frame_ms * sample_rate / 1000);
  const int noverlap = std::max(0, (opts_.frame_ms - opts_.hop_ms) * sample_rate / 1000);
  Spectrogram sg = stft(chunk, nperseg, noverlap);

  const auto track = score_track(chunk, sample_rate, target);
  const auto mask = interp_linspace(track, sg.frames);

  double mean = 0.0;
  for (float v : mask) mean += v;
  mean /= double(mask.size());
  double var = 0.0;
  for (float v : mask) var += (double(v) - mean) * (double(v) - mean);
  var /= double(mask.size());

  const float min_gain = float(std::pow(10.0, double(opts_.min_gain_db) / 20.0));
  for (int f = 0; f < sg.frames; ++f) {
    const float gain = std::max(min_gain, std::min(1.0f, mask[size_t(f)]));
    for (int k = 0; k < sg.bins; ++k) sg.at(f, k) *= gain;
  }

  auto out = istft(sg);
  out.resize(chunk.size(), 0.0f);

  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    last_stats_.mask_mean = float(mean);
    last_stats_.mask_std = float(std::sqrt(var));
  }
  return out;
}
