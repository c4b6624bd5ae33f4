#pragma once

#include <optional>
#include <string>
#include <vector>

// One compact <-> global correspondence for a speaker track.
struct TimeMapEntry {
  double compact_start = 0.0;
  double compact_end = 0.0;
  double global_start = 0.0;
  double global_end = 0.0;
};

// Contiguous in compact time starting at 0; ordered in global time.
using TimeMap = std::vector<TimeMapEntry>;

struct TranscriptWord {
  std::string text;
  double start = 0.0;
  double end = 0.0;
  float probability = 0.0f;
};

struct RemappedPiece {
  double start = 0.0;  // global time
  double end = 0.0;
  std::vector<TranscriptWord> words;
};

struct CompactSpan {
  double start = 0.0;
  double end = 0.0;
};

// Project a compact-time span onto global time, one piece per intersecting
// map entry, so a span crossing a diarization gap is split instead of
// stretched across it. Words are clipped to each piece and rescaled by the
// same rule; words overlapping no entry are dropped.
std::vector<RemappedPiece> split_and_remap(
    double compact_start, double compact_end, const std::vector<TranscriptWord>& words, const TimeMap& time_map);

// Inverse lookup through the first entry intersecting [global_start, global_end].
// std::nullopt when no entry does; callers fall back to raw sample offsets.
std::optional<CompactSpan> global_to_compact(double global_start, double global_end, const TimeMap& time_map);

// Forward point mapping; std::nullopt outside the map.
std::optional<double> compact_to_global(double compact_time, const TimeMap& time_map);

// Total compact seconds covered by the map.
double compact_length(const TimeMap& time_map);

// True when entries are contiguous from 0 in compact time, have positive
// compact length, and are ordered in global time.
bool is_valid_time_map(const TimeMap& time_map, double tolerance = 1e-6);
