#pragma once

#include <filesystem>
#include <optional>
#include <string>

enum class Command {
  BUILD,  // diarization turns + audio -> per-speaker compact tracks and maps
  REMAP,  // per-speaker compact-time ASR -> global-time transcript
  BIND,   // global-time segments -> speaker labels + reference audio
  CLIP    // reference clip of one speaker over a global span
};

struct CliArgs {
  Command command = Command::BUILD;

  std::filesystem::path audio;
  std::filesystem::path diarization;  // external diarizer output (JSON turns)
  std::filesystem::path out_dir;
  std::filesystem::path model_dir;    // speaker-embedding model directory
  std::filesystem::path config;

  std::filesystem::path track_index;
  std::filesystem::path asr_dir;
  std::filesystem::path json_input;
  std::filesystem::path json_output;
  std::filesystem::path srt_output;
  std::filesystem::path output;

  std::string speaker;
  std::optional<double> start;
  std::optional<double> end;

  int sample_rate = 0;  // 0 means the file's own rate
  std::optional<int> threads;
  std::optional<bool> enhance;
  std::optional<bool> similarity_merge;

  bool debug = false;
  std::filesystem::path log_file;
};

// Parse "<command> [options]".
// Returns true on success; on failure writes usage to stderr and returns false (and sets exit_code).
bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code);

const char* command_name(Command c);

void print_usage();
