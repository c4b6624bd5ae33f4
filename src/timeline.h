#pragma once

#include <string>
#include <utility>
#include <vector>

// One contiguous interval attributed to one speaker (seconds, global time).
struct SpeakerTurn {
  double start = 0.0;
  double end = 0.0;
  std::string speaker_id;
  float confidence = 1.0f;

  double duration() const { return end - start; }
};

// Sorted by (start, end).
using Timeline = std::vector<SpeakerTurn>;

// Turns of one speaker, in time order.
struct SpeakerTurns {
  std::string speaker_id;
  std::vector<SpeakerTurn> turns;
};

// Length of [a_start, a_end) ∩ [b_start, b_end), never negative.
double interval_overlap(double a_start, double a_end, double b_start, double b_end);

// Clamp [start, end] into [lo, hi] keeping end >= start.
std::pair<double, double> clip_interval(double start, double end, double lo, double hi);

// Stable sort by (start, end).
void sort_turns(Timeline& turns);

// Speakers in first-appearance order; each speaker's turns sorted by (start, end).
std::vector<SpeakerTurns> group_by_speaker(const Timeline& turns);

// Total spoken seconds per speaker, first-appearance order.
std::vector<std::pair<std::string, double>> speaker_durations(const Timeline& turns);

size_t count_speakers(const Timeline& turns);

// Timeline used when diarization is unavailable: one "speaker_0" turn.
Timeline single_speaker_timeline(double start, double end, float confidence = 0.5f);

// Speaker id usable as a single path component: slashes, backslashes and NUL become
// '_', and "", "." or ".." become "_".
std::string sanitize_speaker_id(const std::string& speaker_id);
