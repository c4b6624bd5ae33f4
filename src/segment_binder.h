#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "logger.h"
#include "time_map.h"
#include "timeline.h"
#include "transcript.h"

// Assign each segment (global time) the speaker and confidence of the turn it
// overlaps most. Segments overlapping no turn take the first turn. With an
// empty timeline the segments are returned unchanged.
std::vector<TranscriptSegment> bind_segments(const Timeline& timeline, const std::vector<TranscriptSegment>& segments);

// bind_segments() against the diarized timeline, or, when it is empty
// (diarization unavailable), against one speaker_0 turn spanning the segments
// with confidence 0.5.
std::vector<TranscriptSegment> bind_with_fallback(
    const Timeline& timeline, const std::vector<TranscriptSegment>& segments, Logger* log = nullptr);

using PathExists = std::function<bool(const std::string&)>;

// Per speaker: the audio_path of the longest bound segment whose clip exists.
std::map<std::string, std::string> select_reference_audio(
    const std::vector<TranscriptSegment>& bound, const PathExists& exists);

// Fill reference_audio_path from select_reference_audio(); a speaker without a
// reference keeps the segment's own audio_path (if any).
void assign_reference_audio(std::vector<TranscriptSegment>& bound, const PathExists& exists);

// Samples for a reference clip of [global_start, global_end). Cut from the
// speaker's compact track through global_to_compact(); when the map has no
// entry (or the track is empty) cut the full-mix audio at raw sample offsets.
// A non-empty source always yields at least one sample.
std::vector<float> extract_reference_clip(
    const std::vector<float>& track,
    const TimeMap& time_map,
    const std::vector<float>& full_audio,
    int sample_rate,
    double global_start,
    double global_end,
    bool* used_track = nullptr);
