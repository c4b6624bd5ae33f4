#include "track_artifacts.h"

#include <sstream>

#include "audio_io.h"

namespace fs = std::filesystem;

std::vector<TrackSummary> write_track_artifacts(const fs::path& out_dir, const BuildResult& result, Logger* log) {
  const fs::path speakers_dir = out_dir / "speakers";
  fs::create_directories(speakers_dir);

  std::vector<TrackSummary> summaries;
  TrackIndex index;
  for (const auto& track : result.tracks) {
    const fs::path dir = speakers_dir / track.speaker_id;
    fs::create_directories(dir);
    const fs::path wav_path = dir / (track.speaker_id + ".wav");
    const fs::path map_path = dir / (track.speaker_id + ".json");
    write_wav_mono(wav_path, track.samples, track.sample_rate);
    write_time_map(map_path, track.time_map);

    summaries.push_back({track.speaker_id, wav_path, map_path, track.kept_seconds, track.overlapped_seconds,
                         track.overlap_ratio()});
    index[track.speaker_id] = {wav_path, track.time_map};

    std::ostringstream ss;
    ss << "Wrote track " << track.speaker_id << ": " << track.compact_seconds() << "s compact, "
       << track.time_map.size() << " map entries";
    log_info(log, ss.str());
  }

  write_speaker_turns(out_dir / "03_speaker_turns.json", result.timeline);
  write_tracks_summary(out_dir / "03_tracks.json", summaries);
  write_track_index(out_dir / "04_speaker_track_index.json", index);
  return summaries;
}
