#pragma once

#include <filesystem>
#include <string>

#include "speaker_enhancer.h"
#include "speaker_merger.h"
#include "track_builder.h"
#include "turn_postprocess.h"

// Settings for every stage, loaded from an optional JSON file.
// Missing keys keep the defaults below.
//
// {
//   "diarization_post": {"merge_gap_ms": 250, "min_duration_ms": 400, "pad_ms": 120},
//   "speaker_tracks": {
//     "enabled": true, "min_gap_merge_ms": 150, "min_duration_ms": 200, "pad_ms": 0,
//     "similarity_merge": {"enabled": true, "short_segment_threshold": 2.0, "similarity_threshold": 0.7},
//     "tse": {"enabled": false, "frame_ms": 25, "hop_ms": 10, "temperature": 3.0,
//             "threshold": 0.2, "smoothing_ms": 50, "min_gain_db": -18.0}
//   },
//   "embedder": {"model_dir": "", "threads": 0, "target_seconds": 10.0}
// }
struct PipelineConfig {
  PostprocessOptions diarization_post{250, 400, 120};

  bool tracks_enabled = true;
  PostprocessOptions track_post{150, 200, 0};
  bool similarity_merge = true;
  MergeOptions merge;
  bool tse_enabled = false;
  EnhancerOptions tse;

  std::filesystem::path embedder_model_dir;
  int embedder_threads = 0;
  float embedder_target_seconds = 10.0f;

  TrackBuilderOptions track_builder_options() const;
};

// Throws std::runtime_error when the file cannot be read or parsed.
PipelineConfig load_pipeline_config(const std::filesystem::path& path);

PipelineConfig parse_pipeline_config(const std::string& content);
