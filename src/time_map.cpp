#include "time_map.h"

#include <algorithm>
#include <cmath>

namespace {

double rescale(double t, double from_start, double from_end, double to_start, double to_end) {
  const double ratio = (t - from_start) / (from_end - from_start);
  return to_start + ratio * (to_end - to_start);
}

}  // namespace

std::vector<RemappedPiece> split_and_remap(
    double compact_start, double compact_end, const std::vector<TranscriptWord>& words, const TimeMap& time_map) {
  std::vector<RemappedPiece> pieces;
  for (const auto& m : time_map) {
    const double ms = m.compact_start;
    const double me = m.compact_end;
    if (me <= ms) continue;

    const double sub_s = std::max(compact_start, ms);
    const double sub_e = std::min(compact_end, me);
    if (sub_e <= sub_s) continue;

    RemappedPiece piece;
    piece.start = rescale(sub_s, ms, me, m.global_start, m.global_end);
    piece.end = rescale(sub_e, ms, me, m.global_start, m.global_end);

    for (const auto& w : words) {
      if (!(w.end > sub_s && w.start < sub_e)) continue;
      TranscriptWord mapped = w;
      mapped.start = rescale(std::max(w.start, sub_s), ms, me, m.global_start, m.global_end);
      mapped.end = rescale(std::min(w.end, sub_e), ms, me, m.global_start, m.global_end);
      piece.words.push_back(std::move(mapped));
    }

    pieces.push_back(std::move(piece));
  }
  return pieces;
}

std::optional<CompactSpan> global_to_compact(double global_start, double global_end, const TimeMap& time_map) {
  for (const auto& m : time_map) {
    const double gms = m.global_start;
    const double gme = m.global_end;
    if (global_end <= gms || global_start >= gme) continue;

    const double sub_s = std::max(global_start, gms);
    const double sub_e = std::min(global_end, gme);
    if (sub_e <= sub_s || gme <= gms) continue;

    CompactSpan span;
    span.start = rescale(sub_s, gms, gme, m.compact_start, m.compact_end);
    span.end = rescale(sub_e, gms, gme, m.compact_start, m.compact_end);
    return span;
  }
  return std::nullopt;
}

std::optional<double> compact_to_global(double compact_time, const TimeMap& time_map) {
  for (size_t i = 0; i < time_map.size(); ++i) {
    const auto& m = time_map[i];
    if (m.compact_end <= m.compact_start) continue;
    const bool last = i + 1 == time_map.size();
    if (compact_time >= m.compact_start && (compact_time < m.compact_end || (last && compact_time == m.compact_end))) {
      return rescale(compact_time, m.compact_start, m.compact_end, m.global_start, m.global_end);
    }
  }
  return std::nullopt;
}

double compact_length(const TimeMap& time_map) {
  return time_map.empty() ? 0.0 : time_map.back().compact_end;
}

bool is_valid_time_map(const TimeMap& time_map, double tolerance) {
  double cursor = 0.0;
  double prev_global_start = -1.0;
  for (const auto& m : time_map) {
    if (std::fabs(m.compact_start - cursor) > tolerance) return false;
    if (m.compact_end <= m.compact_start) return false;
    if (m.global_end < m.global_start) return false;
    if (m.global_start <= prev_global_start) return false;
    prev_global_start = m.global_start;
    cursor = m.compact_end;
  }
  return true;
}
