#include "pipeline_config.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const json& section(const json& parent, const char* key) {
  static const json empty = json::object();
  if (!parent.is_object()) return empty;
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_object()) return empty;
  return *it;
}

void read_postprocess(const json& j, PostprocessOptions& p, const char* gap_key) {
  p.merge_gap_ms = j.value(gap_key, p.merge_gap_ms);
  p.min_duration_ms = j.value("min_duration_ms", p.min_duration_ms);
  p.pad_ms = j.value("pad_ms", p.pad_ms);
}

}  // namespace

TrackBuilderOptions PipelineConfig::track_builder_options() const {
  TrackBuilderOptions o;
  o.postprocess = track_post;
  o.similarity_merge = similarity_merge;
  o.merge = merge;
  o.enhance_overlaps = tse_enabled;
  return o;
}

PipelineConfig parse_pipeline_config(const std::string& content) {
  json j;
  try {
    j = json::parse(content);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("Invalid config JSON: expected an object");

  PipelineConfig cfg;
  try {
    read_postprocess(section(j, "diarization_post"), cfg.diarization_post, "merge_gap_ms");

    const json& tracks = section(j, "speaker_tracks");
    cfg.tracks_enabled = tracks.value("enabled", cfg.tracks_enabled);
    read_postprocess(tracks, cfg.track_post, "min_gap_merge_ms");

    const json& sm = section(tracks, "similarity_merge");
    cfg.similarity_merge = sm.value("enabled", cfg.similarity_merge);
    cfg.merge.short_threshold_s = sm.value("short_segment_threshold", cfg.merge.short_threshold_s);
    cfg.merge.similarity_threshold = sm.value("similarity_threshold", cfg.merge.similarity_threshold);

    const json& tse = section(tracks, "tse");
    cfg.tse_enabled = tse.value("enabled", cfg.tse_enabled);
    cfg.tse.frame_ms = tse.value("frame_ms", cfg.tse.frame_ms);
    cfg.tse.hop_ms = tse.value("hop_ms", cfg.tse.hop_ms);
    cfg.tse.temperature = tse.value("temperature", cfg.tse.temperature);
    cfg.tse.threshold = tse.value("threshold", cfg.tse.threshold);
    cfg.tse.smoothing_ms = tse.value("smoothing_ms", cfg.tse.smoothing_ms);
    cfg.tse.min_gain_db = tse.value("min_gain_db", cfg.tse.min_gain_db);

    const json& emb = section(j, "embedder");
    cfg.embedder_model_dir = emb.value("model_dir", std::string());
    cfg.embedder_threads = emb.value("threads", cfg.embedder_threads);
    cfg.embedder_target_seconds = emb.value("target_seconds", cfg.embedder_target_seconds);
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("Invalid config value: ") + e.what());
  }

  if (cfg.tse.frame_ms <= 0 || cfg.tse.hop_ms <= 0) {
    throw std::runtime_error("Invalid config: speaker_tracks.tse frame_ms and hop_ms must be positive");
  }
  if (cfg.merge.short_threshold_s < 0.0) {
    throw std::runtime_error("Invalid config: similarity_merge.short_segment_threshold must be >= 0");
  }
  return cfg;
}

PipelineConfig load_pipeline_config(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open config: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_pipeline_config(ss.str());
}
