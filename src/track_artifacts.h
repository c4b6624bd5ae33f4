#pragma once

#include <filesystem>
#include <vector>

#include "json_io.h"
#include "logger.h"
#include "track_builder.h"

// Writes the build stage's artifacts under out_dir:
//   speakers/<id>/<id>.wav and speakers/<id>/<id>.json per track,
//   03_speaker_turns.json, 03_tracks.json, 04_speaker_track_index.json.
// A result without tracks still produces the three index files (empty).
std::vector<TrackSummary> write_track_artifacts(
    const std::filesystem::path& out_dir, const BuildResult& result, Logger* log = nullptr);
