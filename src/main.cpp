#include <onnxruntime_cxx_api.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
#include "audio_io.h"
#include "cli_args.h"
#include "json_io.h"
#include "logger.h"
#include "onnx_embedder.h"
#include "pipeline_config.h"
#include "segment_binder.h"
#include "speaker_enhancer.h"
#include "srt_io.h"
#include "track_artifacts.h"
#include "track_builder.h"
#include "transcript.h"
#include "turn_postprocess.h"

static int run(int argc, char** argv);

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const Ort::Exception& e) {
    std::cerr << "\n[ERROR] ONNX Runtime error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "\n[ERROR] " << e.what() << "\n";
    return 1;
  }
}

static double seconds_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

static bool path_exists(const std::string& p) {
  std::error_code ec;
  return fs::exists(fs::path(p), ec);
}

// Missing or unreadable diarization degrades to an empty turn list.
static Timeline load_turns_or_empty(const fs::path& path, Logger& log) {
  if (path.empty()) {
    log.warn("no diarization turns supplied, continuing as a single speaker");
    return {};
  }
  try {
    auto turns = read_speaker_turns(path);
    std::ostringstream ss;
    ss << "Read " << turns.size() << " diarization turns (" << count_speakers(turns) << " speakers) from "
       << path.string();
    log.info(ss.str());
    return turns;
  } catch (const std::exception& e) {
    log.warn(std::string("diarization unavailable, continuing as a single speaker: ") + e.what());
    return {};
  }
}

static std::vector<TranscriptSegment> read_segments_arg(const fs::path& p) {
  if (p.string() == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return parse_transcript_segments(ss.str());
  }
  return read_transcript_segments(p);
}

static void write_segments_arg(const fs::path& p, const std::vector<TranscriptSegment>& segs, double elapsed,
                               Logger& log) {
  if (p.string() == "-") {
    std::cout << format_transcript_output(segs, elapsed);
  } else {
    write_transcript_output(p, segs, elapsed);
    log.info(std::string("Wrote segments JSON: ") + p.string());
  }
}

static int run_build(const CliArgs& args, const PipelineConfig& cfg, Logger& log) {
  const auto t0 = std::chrono::steady_clock::now();

  const int sample_rate = args.sample_rate > 0 ? args.sample_rate : probe_sample_rate(args.audio);
  const auto audio = decode_audio_mono(args.audio, sample_rate);
  {
    std::ostringstream ss;
    ss << "Loaded audio: " << audio.size() << " samples (" << (double(audio.size()) / sample_rate) << " seconds @ "
       << sample_rate << " Hz)";
    log.info(ss.str());
  }
  if (audio.empty()) log.warn("decoded audio is empty, no speaker tracks will be written: " + args.audio.string());

  Timeline raw_turns;
  if (cfg.tracks_enabled) {
    raw_turns = load_turns_or_empty(args.diarization, log);
  } else {
    log.info("speaker tracks disabled, building a single speaker_0 track");
  }

  // Optional voice-similarity collaborator.
  std::unique_ptr<OrtEmbeddingExtractor> embedder;
  const bool wants_embedder = cfg.similarity_merge || cfg.tse_enabled;
  if (wants_embedder && !raw_turns.empty() && !audio.empty()) {
    if (cfg.embedder_model_dir.empty()) {
      log.info("no embedding model configured, similarity merge and enhancement disabled");
    } else {
      OrtEmbeddingExtractor::Options eopts;
      eopts.threads = cfg.embedder_threads;
      eopts.max_seconds = cfg.embedder_target_seconds;
      std::string error;
      embedder = try_load_embedder(cfg.embedder_model_dir.string(), eopts, error);
      if (!embedder) {
        log.warn("embedding model unavailable, similarity merge and enhancement disabled: " + error);
      } else {
        log.info(std::string("Loaded embedder: ") + embedder->config().description + " from " +
                 embedder->config().model_path.string());
      }
    }
  }

  std::unique_ptr<TargetSpeakerEnhancer> enhancer;
  if (embedder && cfg.tse_enabled) enhancer = std::make_unique<TargetSpeakerEnhancer>(*embedder, cfg.tse);

  TrackBuilder builder(cfg.track_builder_options(), &log);
  builder.set_embedder(embedder.get());
  builder.set_enhancer(enhancer.get());

  const auto result = builder.build_from_turns(raw_turns, audio, sample_rate);
  {
    std::ostringstream ss;
    ss << "Timeline: " << result.timeline.size() << " turns, " << count_speakers(result.timeline)
       << " speakers (raw " << result.raw_speakers << ")";
    log.info(ss.str());
  }
  if (result.single_speaker()) log.info("single speaker result, multi-speaker processing can be bypassed");

  // Artifacts are written only after every track is built.
  const auto summaries = write_track_artifacts(args.out_dir, result, &log);

  std::ostringstream ss;
  ss << "Built " << summaries.size() << " tracks in " << seconds_since(t0) << "s -> " << args.out_dir.string();
  log.info(ss.str());
  return 0;
}

static int run_remap(const CliArgs& args, Logger& log) {
  const auto t0 = std::chrono::steady_clock::now();
  const auto index = read_track_index(args.track_index);
  if (index.empty()) log.warn("track index is empty: " + args.track_index.string());

  std::vector<std::vector<TranscriptSegment>> per_speaker;
  for (const auto& kv : index) {
    const std::string& speaker = kv.first;
    if (!is_valid_time_map(kv.second.mapping)) log.warn("time map of " + speaker + " is not contiguous");

    const fs::path asr_path = args.asr_dir / (speaker + ".json");
    if (!fs::exists(asr_path)) {
      log.warn("no ASR result for " + speaker + " at " + asr_path.string() + ", skipped");
      continue;
    }
    const auto compact = read_transcript_segments(asr_path);
    auto global = remap_transcript(speaker, compact, kv.second.mapping);

    std::ostringstream ss;
    ss << "Remapped " << speaker << ": " << compact.size() << " compact segments -> " << global.size() << " pieces";
    log.info(ss.str());
    per_speaker.push_back(std::move(global));
  }

  const auto merged = merge_speaker_transcripts(std::move(per_speaker));
  write_segments_arg(args.json_output, merged, seconds_since(t0), log);
  if (!args.srt_output.empty()) {
    write_srt_utf8(args.srt_output, merged);
    log.info(std::string("Wrote SRT: ") + args.srt_output.string());
  }
  return 0;
}

static int run_bind(const CliArgs& args, const PipelineConfig& cfg, Logger& log) {
  const auto t0 = std::chrono::steady_clock::now();
  const auto segments = read_segments_arg(args.json_input);
  {
    std::ostringstream ss;
    ss << "Read " << segments.size() << " segments from JSON input";
    log.info(ss.str());
  }

  const auto raw = load_turns_or_empty(args.diarization, log);
  const auto timeline = postprocess_turns(raw, cfg.diarization_post);

  auto bound = bind_with_fallback(timeline, segments, &log);
  assign_reference_audio(bound, path_exists);

  {
    std::ostringstream ss;
    ss << "Bound " << bound.size() << " segments to " << count_speakers(timeline) << " diarized speakers";
    log.info(ss.str());
  }
  write_segments_arg(args.json_output, bound, seconds_since(t0), log);
  return 0;
}

static int run_clip(const CliArgs& args, Logger& log) {
  const int sample_rate = args.sample_rate > 0 ? args.sample_rate : probe_sample_rate(args.audio);
  const auto full = decode_audio_mono(args.audio, sample_rate);

  std::vector<float> track;
  TimeMap time_map;
  if (!args.track_index.empty()) {
    const auto index = read_track_index(args.track_index);
    auto it = index.find(args.speaker);
    if (it == index.end()) {
      log.warn("speaker " + args.speaker + " not in track index, cutting the full mix");
    } else if (!fs::exists(it->second.wav_path)) {
      log.warn("track audio missing: " + it->second.wav_path.string() + ", cutting the full mix");
    } else {
      track = decode_audio_mono(it->second.wav_path, sample_rate);
      time_map = it->second.mapping;
    }
  }

  bool used_track = false;
  const auto clip =
      extract_reference_clip(track, time_map, full, sample_rate, *args.start, *args.end, &used_track);
  if (clip.empty()) throw std::runtime_error("No audio to cut for " + args.speaker);
  if (!track.empty() && !used_track) log.warn("span not covered by the speaker's time map, cut the full mix");

  write_wav_mono(args.output, clip, sample_rate);
  std::ostringstream ss;
  ss << "Wrote clip " << args.output.string() << " (" << (double(clip.size()) / sample_rate) << "s, "
     << (used_track ? "compact track" : "full mix") << ")";
  log.info(ss.str());
  return 0;
}

static int run(int argc, char** argv) {
  CliArgs args;
  int exit_code = 0;
  if (!parse_cli_args(argc, argv, args, exit_code)) {
    return exit_code;
  }

  Logger log(command_name(args.command));
  log.set_debug(args.debug);
  if (!args.log_file.empty()) {
    if (args.log_file.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(args.log_file.parent_path(), ec);
    }
    log.enable_file(args.log_file);
  }

  PipelineConfig cfg;
  if (!args.config.empty()) {
    cfg = load_pipeline_config(args.config);
    log.info(std::string("Loaded config: ") + args.config.string());
  }
  if (!args.model_dir.empty()) cfg.embedder_model_dir = args.model_dir;
  if (args.threads) cfg.embedder_threads = *args.threads;
  if (args.enhance) cfg.tse_enabled = *args.enhance;
  if (args.similarity_merge) cfg.similarity_merge = *args.similarity_merge;

  try {
    switch (args.command) {
      case Command::BUILD:
        return run_build(args, cfg, log);
      case Command::REMAP:
        return run_remap(args, log);
      case Command::BIND:
        return run_bind(args, cfg, log);
      case Command::CLIP:
        return run_clip(args, log);
    }
  } catch (const std::exception& e) {
    log.error(std::string(command_name(args.command)) + " failed: " + e.what());
    throw;
  }
  return 0;
}
