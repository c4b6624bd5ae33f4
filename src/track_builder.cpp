#include "track_builder.h"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace {

std::string fmt_span(double s, double e) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f-%.2f", s, e);
  return buf;
}

}  // namespace

TrackBuilder::TrackBuilder(const TrackBuilderOptions& opts, Logger* log) : opts_(opts), log_(log) {}

bool TrackBuilder::overlaps_other(const std::vector<SpeakerTurns>& groups, size_t self, double s, double e) const {
  for (size_t g = 0; g < groups.size(); ++g) {
    if (g == self) continue;
    for (const auto& o : groups[g].turns) {
      if (o.end > s && o.start < e) return true;
    }
  }
  return false;
}

std::vector<SpeakerTrack> TrackBuilder::build(
    const Timeline& timeline, const std::vector<float>& audio, int sample_rate) const {
  if (sample_rate <= 0) throw std::runtime_error("track builder: invalid sample rate");

  std::vector<SpeakerTrack> tracks;
  if (timeline.empty() || audio.empty()) return tracks;

  const auto groups = group_by_speaker(timeline);
  if (groups.size() == 1) log_info(log_, "single speaker detected, multi-speaker processing can be bypassed");

  const double sr = double(sample_rate);
  const long long total = static_cast<long long>(audio.size());

  for (size_t g = 0; g < groups.size(); ++g) {
    SpeakerTrack track;
    track.speaker_id = groups[g].speaker_id;
    track.sample_rate = sample_rate;

    double cursor = 0.0;
    for (const auto& turn : groups[g].turns) {
      const double s = std::max(0.0, turn.start);
      double e = std::max(s, turn.end);
      const long long s_i = static_cast<long long>(s * sr);
      long long e_i = static_cast<long long>(e * sr);
      if (e_i <= s_i || s_i >= total) continue;
      if (e_i > total) {
        e_i = total;
        e = double(total) / sr;
      }

      std::vector<float> chunk(audio.begin() + s_i, audio.begin() + e_i);

      const bool overlapped = overlaps_other(groups, g, s, e);
      if (overlapped && opts_.enhance_overlaps && enhancer_ != nullptr) {
        try {
          auto enhanced = enhancer_->enhance(chunk, sample_rate, track.speaker_id);
          if (enhanced.size() != chunk.size()) {
            log_warn(log_, "enhancement changed chunk length for " + track.speaker_id + " " + fmt_span(s, e) +
                               ", keeping original");
          } else {
            chunk = std::move(enhanced);
            ++track.enhanced_turns;
            const auto stats = enhancer_->last_mask_stats();
            char buf[96];
            std::snprintf(buf, sizeof(buf), " mask_mean=%.3f std=%.3f", stats.mask_mean, stats.mask_std);
            log_info(log_, "enhanced " + track.speaker_id + " overlap " + fmt_span(s, e) + buf);
          }
        } catch (const std::exception& ex) {
          log_warn(log_, "enhancement failed for " + track.speaker_id + " " + fmt_span(s, e) + ": " + ex.what());
        }
      }

      track.kept_seconds += e - s;
      if (overlapped) {
        track.overlapped_seconds += e - s;
        ++track.overlapped_turns;
      }

      const double dur = double(chunk.size()) / sr;
      track.time_map.push_back({cursor, cursor + dur, s, e});
      cursor += dur;
      track.samples.insert(track.samples.end(), chunk.begin(), chunk.end());
    }

    if (track.time_map.empty()) {
      log_debug(log_, "speaker " + track.speaker_id + " has no usable audio, omitted");
      continue;
    }

    if (track.kept_seconds > 0.0) {
      char buf[128];
      std::snprintf(buf, sizeof(buf), "speaker %s overlap %.2f%% (%.2fs/%.2fs)", track.speaker_id.c_str(),
                    track.overlap_ratio() * 100.0, track.overlapped_seconds, track.kept_seconds);
      log_info(log_, buf);
    }
    tracks.push_back(std::move(track));
  }

  std::ostringstream ss;
  ss << "built " << tracks.size() << " speaker tracks";
  log_info(log_, ss.str());
  return tracks;
}

BuildResult TrackBuilder::build_from_turns(
    const Timeline& raw_turns, const std::vector<float>& audio, int sample_rate) const {
  if (sample_rate <= 0) throw std::runtime_error("track builder: invalid sample rate");

  BuildResult result;
  result.raw_speakers = count_speakers(raw_turns);

  Timeline timeline = postprocess_turns(raw_turns, opts_.postprocess);
  if (timeline.empty()) {
    log_warn(log_, "no speaker turns, falling back to a single speaker track");
    result.degraded = true;
    timeline = single_speaker_timeline(0.0, double(audio.size()) / double(sample_rate));
  } else if (opts_.similarity_merge && embedder_ != nullptr) {
    try {
      const size_t before = count_speakers(timeline);
      auto merged = merge_short_turns(timeline, audio, sample_rate, *embedder_, opts_.merge, log_);
      timeline = std::move(merged.timeline);
      const size_t after = count_speakers(timeline);
      if (after < before) {
        std::ostringstream ss;
        ss << "similarity merge reduced speakers from " << before << " to " << after;
        log_info(log_, ss.str());
      }
    } catch (const std::exception& ex) {
      log_warn(log_, std::string("similarity merge failed, keeping postprocessed turns: ") + ex.what());
    }
  }

  result.tracks = build(timeline, audio, sample_rate);
  result.timeline = std::move(timeline);
  return result;
}
