#include "turn_postprocess.h"

#include <algorithm>

namespace {

bool within_gap(const SpeakerTurn& prev, const SpeakerTurn& next, double max_gap_s) {
  if (prev.speaker_id != next.speaker_id) return false;
  const double gap = std::max(0.0, next.start - prev.end);
  return gap <= max_gap_s;
}

void absorb(SpeakerTurn& into, const SpeakerTurn& from) {
  into.end = std::max(into.end, from.end);
  into.confidence = std::min(into.confidence, from.confidence);
}

}  // namespace

Timeline postprocess_turns(const Timeline& turns, int merge_gap_ms, int min_duration_ms, int pad_ms) {
  if (turns.empty()) return {};

  Timeline sorted = turns;
  sort_turns(sorted);

  // Compare in seconds; gap * 1000 <= merge_gap_ms loses ulps at exact boundaries.
  const double max_gap_s = double(merge_gap_ms) / 1000.0 + 1e-9;
  const double min_dur_s = double(min_duration_ms) / 1000.0 - 1e-9;

  Timeline merged;
  merged.reserve(sorted.size());
  for (const auto& t : sorted) {
    if (!merged.empty() && within_gap(merged.back(), t, max_gap_s)) {
      absorb(merged.back(), t);
      continue;
    }
    merged.push_back(t);
  }

  Timeline kept;
  kept.reserve(merged.size());
  for (const auto& t : merged) {
    if (t.duration() < min_dur_s && !kept.empty()) {
      absorb(kept.back(), t);
      continue;
    }
    // An absorption above can close the gap to the next same-speaker turn.
    if (!kept.empty() && within_gap(kept.back(), t, max_gap_s)) {
      absorb(kept.back(), t);
      continue;
    }
    kept.push_back(t);
  }

  if (pad_ms > 0) {
    const double pad_s = double(pad_ms) / 1000.0;
    for (auto& t : kept) {
      t.start = std::max(0.0, t.start - pad_s);
      t.end = std::max(t.start, t.end + pad_s);
    }
  }

  return kept;
}
