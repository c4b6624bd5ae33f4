#pragma once

#include "timeline.h"

struct PostprocessOptions {
  int merge_gap_ms = 250;
  int min_duration_ms = 400;
  int pad_ms = 120;
};

// Canonicalise raw diarization turns:
// - sort by (start, end)
// - merge adjacent same-speaker turns whose gap <= merge_gap_ms (confidence = min)
// - absorb turns shorter than min_duration_ms into the preceding kept turn;
//   a short first turn is kept as-is
// - pad every turn outward by pad_ms (start clamped at 0); padding never re-merges
Timeline postprocess_turns(const Timeline& turns, int merge_gap_ms, int min_duration_ms, int pad_ms);

inline Timeline postprocess_turns(const Timeline& turns, const PostprocessOptions& opts) {
  return postprocess_turns(turns, opts.merge_gap_ms, opts.min_duration_ms, opts.pad_ms);
}
