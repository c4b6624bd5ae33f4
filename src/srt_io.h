#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "transcript.h"

// "HH:MM:SS,mmm", milliseconds truncated.
std::string format_srt_time(double sec);

// One cue per segment; the text line is prefixed with "[speaker_id] " when a
// speaker is bound.
std::string format_srt(const std::vector<TranscriptSegment>& segs);
void write_srt_utf8(const std::filesystem::path& path, const std::vector<TranscriptSegment>& segs);
