#pragma once

#include "time_map.h"
#include "timeline.h"
#include "transcript.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Speaker turns from an external diarizer.
// Supports: {"segments": [...]} or direct array [...]
// Fields: start, end, speaker_id (or speaker), confidence (optional, default 1.0)
Timeline read_speaker_turns(const std::filesystem::path& path);
Timeline parse_speaker_turns(const std::string& content);

// Flat array [{start, end, speaker_id, confidence}]
std::string format_speaker_turns(const Timeline& timeline);
void write_speaker_turns(const std::filesystem::path& path, const Timeline& timeline);

// Array of {compact_start, compact_end, global_start, global_end}, insertion order.
std::string format_time_map(const TimeMap& time_map);
void write_time_map(const std::filesystem::path& path, const TimeMap& time_map);
TimeMap parse_time_map(const std::string& content);
TimeMap read_time_map(const std::filesystem::path& path);

struct TrackSummary {
    std::string speaker_id;
    std::filesystem::path wav_path;
    std::filesystem::path map_path;
    double kept_seconds = 0.0;
    double overlapped_seconds = 0.0;
    double overlap_ratio = 0.0;
};

// 03_tracks.json: [{speaker_id, wav_path, map_path, kept_seconds, overlapped_seconds, overlap_ratio}]
void write_tracks_summary(const std::filesystem::path& path, const std::vector<TrackSummary>& tracks);

struct TrackIndexEntry {
    std::filesystem::path wav_path;
    TimeMap mapping;
};

// speaker_id -> entry
using TrackIndex = std::map<std::string, TrackIndexEntry>;

// 04_speaker_track_index.json: {speaker_id: {wav_path, mapping: [...]}}
std::string format_track_index(const TrackIndex& index);
void write_track_index(const std::filesystem::path& path, const TrackIndex& index);
TrackIndex parse_track_index(const std::string& content);
TrackIndex read_track_index(const std::filesystem::path& path);

// Transcript segments (ASR output or an earlier stage's segments).
// Supports: {"segments": [...]} or direct array [...]
// Times: start|start_time, end|end_time. A missing end becomes start and
// end < start is clamped to start. Words: {word|text, start, end, probability}.
std::vector<TranscriptSegment> parse_transcript_segments(const std::string& content);
std::vector<TranscriptSegment> read_transcript_segments(const std::filesystem::path& path);

// Format: {"segments": [...], "metadata": {"count": N, "speakers": K, "processing_time": T}}
std::string format_transcript_output(const std::vector<TranscriptSegment>& segments, double processing_time = 0.0);
void write_transcript_output(
    const std::filesystem::path& path,
    const std::vector<TranscriptSegment>& segments,
    double processing_time = 0.0);
