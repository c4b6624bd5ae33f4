#include "speaker_merger.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace {

// Samples [int(start*sr), int(end*sr)) clamped to the buffer; empty when degenerate.
bool turn_sample_range(const SpeakerTurn& t, size_t total, int sample_rate, size_t& begin, size_t& end) {
  const double sr = double(sample_rate);
  const long long s = static_cast<long long>(t.start * sr);
  const long long e = static_cast<long long>(t.end * sr);
  const long long n = static_cast<long long>(total);
  const long long s_c = std::max(0LL, std::min(s, n));
  const long long e_c = std::max(s_c, std::min(e, n));
  begin = size_t(s_c);
  end = size_t(e_c);
  return end > begin;
}

bool try_embed(const SpeakerTurn& t, const std::vector<float>& audio, int sample_rate,
               EmbeddingExtractor& embedder, Logger* log, std::vector<float>& out) {
  size_t b = 0, e = 0;
  if (!turn_sample_range(t, audio.size(), sample_rate, b, e)) return false;
  try {
    out = embedder.extract(audio.data() + b, e - b, sample_rate);
  } catch (const std::exception& ex) {
    log_debug(log, std::string("embedding failed for ") + t.speaker_id + ": " + ex.what());
    return false;
  }
  return normalize_embedding(out);
}

std::string span_str(const SpeakerTurn& t) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2fs-%.2fs", t.start, t.end);
  return buf;
}

}  // namespace

std::vector<float> speaker_embedding(
    const std::vector<SpeakerTurn>& turns,
    const std::vector<float>& audio,
    int sample_rate,
    EmbeddingExtractor& embedder,
    Logger* log) {
  if (turns.empty()) return {};

  std::vector<SpeakerTurn> by_length = turns;
  std::stable_sort(by_length.begin(), by_length.end(), [](const SpeakerTurn& a, const SpeakerTurn& b) {
    return a.duration() > b.duration();
  });
  const size_t n = by_length.size();
  const size_t take = std::min(n, std::max<size_t>(3, n / 2));

  std::vector<double> sum;
  size_t used = 0;
  for (size_t i = 0; i < take; ++i) {
    std::vector<float> emb;
    if (!try_embed(by_length[i], audio, sample_rate, embedder, log, emb)) continue;
    if (sum.empty()) sum.assign(emb.size(), 0.0);
    if (emb.size() != sum.size()) continue;
    for (size_t k = 0; k < emb.size(); ++k) sum[k] += emb[k];
    ++used;
  }
  if (used == 0) return {};

  std::vector<float> mean(sum.size());
  for (size_t k = 0; k < sum.size(); ++k) mean[k] = float(sum[k] / double(used));
  if (!normalize_embedding(mean)) return {};
  return mean;
}

MergeResult merge_short_turns(
    const Timeline& timeline,
    const std::vector<float>& audio,
    int sample_rate,
    EmbeddingExtractor& embedder,
    const MergeOptions& opts,
    Logger* log) {
  MergeResult result;
  result.timeline = timeline;
  if (timeline.size() < 2) return result;

  const auto groups = group_by_speaker(timeline);
  const auto durations = speaker_durations(timeline);

  std::vector<const SpeakerTurns*> long_speakers;
  std::vector<SpeakerTurn> short_turns;
  for (size_t i = 0; i < groups.size(); ++i) {
    if (durations[i].second < opts.short_threshold_s) {
      short_turns.insert(short_turns.end(), groups[i].turns.begin(), groups[i].turns.end());
    } else {
      long_speakers.push_back(&groups[i]);
    }
  }
  result.short_turns = short_turns.size();

  if (short_turns.empty() || long_speakers.empty()) {
    std::ostringstream ss;
    ss << "no short turns to merge (short turns: " << short_turns.size()
       << ", long speakers: " << long_speakers.size() << ")";
    log_info(log, ss.str());
    return result;
  }

  {
    std::ostringstream ss;
    ss << "found " << short_turns.size() << " short turns and " << long_speakers.size() << " long speakers";
    log_info(log, ss.str());
  }

  std::vector<std::pair<std::string, std::vector<float>>> references;
  for (const auto* g : long_speakers) {
    auto emb = speaker_embedding(g->turns, audio, sample_rate, embedder, log);
    if (emb.empty()) {
      log_warn(log, "no usable embedding for speaker " + g->speaker_id + ", excluded from matching");
      continue;
    }
    references.emplace_back(g->speaker_id, std::move(emb));
  }

  if (references.empty()) {
    log_warn(log, "could not extract any speaker embedding, skipping similarity merge");
    return result;
  }

  Timeline merged;
  merged.reserve(timeline.size());
  for (const auto* g : long_speakers) merged.insert(merged.end(), g->turns.begin(), g->turns.end());

  for (const auto& t : short_turns) {
    std::vector<float> emb;
    if (!try_embed(t, audio, sample_rate, embedder, log, emb)) {
      log_warn(log, "short turn " + span_str(t) + " (" + t.speaker_id + ") could not be embedded, label kept");
      merged.push_back(t);
      continue;
    }

    const std::string* best_id = nullptr;
    float best_sim = -2.0f;
    for (const auto& ref : references) {
      const float sim = cosine_similarity(emb, ref.second);
      if (sim > best_sim) {
        best_sim = sim;
        best_id = &ref.first;
      }
    }

    SpeakerTurn relabeled = t;
    relabeled.speaker_id = *best_id;
    merged.push_back(relabeled);
    ++result.relabeled;

    char sim_buf[32];
    std::snprintf(sim_buf, sizeof(sim_buf), "%.3f", best_sim);
    const std::string msg = "short turn " + span_str(t) + " (" + t.speaker_id + ") -> " + *best_id +
                            " (similarity " + sim_buf + ")";
    if (best_sim < opts.similarity_threshold) {
      ++result.below_threshold;
      log_warn(log, msg + " below threshold");
    } else {
      log_info(log, msg);
    }
  }

  sort_turns(merged);
  result.timeline = std::move(merged);

  std::ostringstream ss;
  ss << "similarity merge done: " << result.relabeled << "/" << result.short_turns << " short turns reassigned";
  log_info(log, ss.str());
  return result;
}
