#pragma once

#include <string>
#include <vector>

#include "time_map.h"

// One transcript segment. Produced in compact time by ASR, rewritten to global
// time with a resolved speaker by remap_transcript() and bind_segments().
struct TranscriptSegment {
  int index = 0;
  double start = 0.0;
  double end = 0.0;
  std::string text;
  std::vector<TranscriptWord> words;
  std::string speaker_id;
  float speaker_confidence = 1.0f;
  std::string audio_path;            // per-segment clip, when a later stage cut one
  std::string reference_audio_path;  // stable reference clip for the speaker

  double duration() const { return end - start; }
};

// Map one speaker's compact-time ASR segments to global time. Each segment
// becomes one output segment per intersecting map entry; its text is rebuilt
// from the words of that piece (or the source text when the piece has none).
std::vector<TranscriptSegment> remap_transcript(
    const std::string& speaker_id, const std::vector<TranscriptSegment>& compact_segments, const TimeMap& time_map);

// Concatenate per-speaker results and sort by (start, end). Indices are renumbered from 1.
std::vector<TranscriptSegment> merge_speaker_transcripts(std::vector<std::vector<TranscriptSegment>> per_speaker);
