#include "cli_args.h"

#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

static bool is_flag(const std::string& s) { return !s.empty() && s[0] == '-'; }

const char* command_name(Command c) {
  switch (c) {
    case Command::BUILD:
      return "build";
    case Command::REMAP:
      return "remap";
    case Command::BIND:
      return "bind";
    case Command::CLIP:
      return "clip";
  }
  return "build";
}

void print_usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  cpp-speaker-tracks build --audio <path> --out-dir <dir> [--diarization <turns.json>] [options]\n";
  std::cerr << "  cpp-speaker-tracks remap --track-index <file> --asr-dir <dir> --json-output <path> [--srt-output <path>]\n";
  std::cerr << "  cpp-speaker-tracks bind --json-input <path> [--diarization <turns.json>] --json-output <path>\n";
  std::cerr << "  cpp-speaker-tracks clip --audio <path> --speaker <id> --start <s> --end <s> --output <wav>"
               " [--track-index <file>]\n";
  std::cerr << "\nInput/Output:\n";
  std::cerr << "  --audio, -a           Audio file path (full mix or vocals)\n";
  std::cerr << "  --diarization         Speaker turns JSON from the diarizer\n";
  std::cerr << "  --out-dir, -o         Output directory for tracks and maps (build)\n";
  std::cerr << "  --track-index         04_speaker_track_index.json (remap, clip)\n";
  std::cerr << "  --asr-dir             Directory with <speaker_id>.json ASR results (remap)\n";
  std::cerr << "  --json-input, -ji     Segments JSON (bind)\n";
  std::cerr << "  --json-output, -jo    Segments JSON output (remap, bind)\n";
  std::cerr << "  --srt-output          Readable SRT with speaker labels (remap)\n";
  std::cerr << "  --output              Clip WAV path (clip)\n";
  std::cerr << "  --speaker, --start, --end   Clip speaker and global span in seconds (clip)\n";
  std::cerr << "\nTrack options:\n";
  std::cerr << "  --config, -c          Pipeline config JSON\n";
  std::cerr << "  --model, -m           Speaker-embedding model directory (embedding.onnx)\n";
  std::cerr << "  --threads             ORT intra-op threads (default: auto)\n";
  std::cerr << "  --sample-rate         Decode rate (default: the file's own rate)\n";
  std::cerr << "  --enhance / --no-enhance   Toggle overlap enhancement\n";
  std::cerr << "  --merge / --no-merge       Toggle similarity merge of short speakers\n";
  std::cerr << "\nDebug:\n";
  std::cerr << "  --debug, -d           Enable debug logging\n";
  std::cerr << "  --log-file            Also write the log to this file\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static bool fail(const std::string& msg, int& exit_code) {
  std::cerr << "ERROR: " << msg << "\n\n";
  print_usage();
  exit_code = 2;
  return false;
}

bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code) {
  exit_code = 0;
  if (argc <= 1) {
    print_usage();
    exit_code = 2;
    return false;
  }

  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h") {
    print_usage();
    exit_code = 0;
    return false;
  }
  if (cmd == "build") {
    out.command = Command::BUILD;
  } else if (cmd == "remap") {
    out.command = Command::REMAP;
  } else if (cmd == "bind") {
    out.command = Command::BIND;
  } else if (cmd == "clip") {
    out.command = Command::CLIP;
  } else {
    return fail("Unknown command: " + cmd, exit_code);
  }

  try {
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--audio" || a == "-a") {
        out.audio = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--diarization") {
        out.diarization = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--out-dir" || a == "-o") {
        out.out_dir = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--model" || a == "-m") {
        out.model_dir = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--config" || a == "-c") {
        out.config = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--track-index") {
        out.track_index = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--asr-dir") {
        out.asr_dir = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--json-input" || a == "-ji") {
        out.json_input = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--json-output" || a == "-jo") {
        out.json_output = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--srt-output") {
        out.srt_output = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--output") {
        out.output = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--speaker") {
        out.speaker = require_value(i, argc, argv, a);
      } else if (a == "--start") {
        out.start = std::stod(require_value(i, argc, argv, a));
      } else if (a == "--end") {
        out.end = std::stod(require_value(i, argc, argv, a));
      } else if (a == "--sample-rate") {
        out.sample_rate = std::stoi(require_value(i, argc, argv, a));
      } else if (a == "--threads") {
        out.threads = std::stoi(require_value(i, argc, argv, a));
      } else if (a == "--enhance") {
        out.enhance = true;
      } else if (a == "--no-enhance") {
        out.enhance = false;
      } else if (a == "--merge") {
        out.similarity_merge = true;
      } else if (a == "--no-merge") {
        out.similarity_merge = false;
      } else if (a == "--debug" || a == "-d") {
        out.debug = true;
      } else if (a == "--log-file") {
        out.log_file = fs::path(require_value(i, argc, argv, a));
      } else if (is_flag(a)) {
        return fail("Unknown arg: " + a, exit_code);
      } else {
        return fail("Unexpected positional arg: " + a, exit_code);
      }
    }
  } catch (const std::invalid_argument&) {
    return fail("Invalid numeric value", exit_code);
  } catch (const std::out_of_range&) {
    return fail("Numeric value out of range", exit_code);
  }

  if (out.sample_rate < 0) return fail("--sample-rate must be positive", exit_code);

  // Validate required
  switch (out.command) {
    case Command::BUILD:
      if (out.audio.empty()) return fail("--audio is required", exit_code);
      if (out.out_dir.empty()) return fail("--out-dir is required", exit_code);
      break;
    case Command::REMAP:
      if (out.track_index.empty()) return fail("--track-index is required", exit_code);
      if (out.asr_dir.empty()) return fail("--asr-dir is required", exit_code);
      if (out.json_output.empty()) return fail("--json-output is required", exit_code);
      break;
    case Command::BIND:
      if (out.json_input.empty()) return fail("--json-input is required", exit_code);
      if (out.json_output.empty()) return fail("--json-output is required", exit_code);
      break;
    case Command::CLIP:
      if (out.audio.empty()) return fail("--audio is required", exit_code);
      if (out.speaker.empty()) return fail("--speaker is required", exit_code);
      if (!out.start || !out.end) return fail("--start and --end are required", exit_code);
      if (*out.end < *out.start) return fail("--end must not precede --start", exit_code);
      if (out.output.empty()) return fail("--output is required", exit_code);
      break;
  }
  return true;
}
