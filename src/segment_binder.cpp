#include "segment_binder.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

std::vector<TranscriptSegment> bind_segments(const Timeline& timeline, const std::vector<TranscriptSegment>& segments) {
  std::vector<TranscriptSegment> bound = segments;
  if (timeline.empty()) return bound;

  for (auto& seg : bound) {
    const SpeakerTurn* best = nullptr;
    double best_ov = 0.0;
    for (const auto& turn : timeline) {
      const double ov = interval_overlap(seg.start, seg.end, turn.start, turn.end);
      if (ov > best_ov) {
        best_ov = ov;
        best = &turn;
      }
    }
    if (best == nullptr) best = &timeline.front();
    seg.speaker_id = best->speaker_id;
    seg.speaker_confidence = best->confidence;
  }
  return bound;
}

std::vector<TranscriptSegment> bind_with_fallback(
    const Timeline& timeline, const std::vector<TranscriptSegment>& segments, Logger* log) {
  if (segments.empty()) return segments;
  if (!timeline.empty()) return bind_segments(timeline, segments);

  double lo = segments.front().start;
  double hi = segments.front().end;
  for (const auto& s : segments) {
    lo = std::min(lo, std::min(s.start, s.end));
    hi = std::max(hi, std::max(s.start, s.end));
  }
  log_warn(log, "speaker timeline unavailable, binding all segments to speaker_0");
  return bind_segments(single_speaker_timeline(lo, hi, 0.5f), segments);
}

std::map<std::string, std::string> select_reference_audio(
    const std::vector<TranscriptSegment>& bound, const PathExists& exists) {
  std::map<std::string, std::pair<double, std::string>> best;
  for (const auto& seg : bound) {
    if (seg.audio_path.empty() || !exists(seg.audio_path)) continue;
    const std::string spk = seg.speaker_id.empty() ? "speaker_0" : seg.speaker_id;
    const double dur = std::max(0.0, seg.end - seg.start);
    auto it = best.find(spk);
    if (it == best.end() || dur > it->second.first) best[spk] = {dur, seg.audio_path};
  }

  std::map<std::string, std::string> out;
  for (const auto& kv : best) out[kv.first] = kv.second.second;
  return out;
}

void assign_reference_audio(std::vector<TranscriptSegment>& bound, const PathExists& exists) {
  const auto refs = select_reference_audio(bound, exists);
  for (auto& seg : bound) {
    const std::string spk = seg.speaker_id.empty() ? "speaker_0" : seg.speaker_id;
    auto it = refs.find(spk);
    const std::string& ref = it != refs.end() ? it->second : seg.audio_path;
    if (!ref.empty()) seg.reference_audio_path = ref;
  }
}

namespace {

std::vector<float> slice_at_least_one(const std::vector<float>& src, long long s_i, long long e_i) {
  const long long n = static_cast<long long>(src.size());
  if (n == 0) return {};
  s_i = std::max(0LL, std::min(s_i, n - 1));
  e_i = std::max(0LL, std::min(e_i, n));
  if (e_i <= s_i) e_i = std::min(n, s_i + 1);
  return std::vector<float>(src.begin() + s_i, src.begin() + e_i);
}

}  // namespace

std::vector<float> extract_reference_clip(
    const std::vector<float>& track,
    const TimeMap& time_map,
    const std::vector<float>& full_audio,
    int sample_rate,
    double global_start,
    double global_end,
    bool* used_track) {
  if (sample_rate <= 0) throw std::runtime_error("reference clip: invalid sample rate");
  const double sr = double(sample_rate);

  if (!track.empty()) {
    if (const auto span = global_to_compact(global_start, global_end, time_map)) {
      if (used_track) *used_track = true;
      return slice_at_least_one(
          track, static_cast<long long>(span->start * sr), static_cast<long long>(span->end * sr));
    }
  }
  if (used_track) *used_track = false;
  return slice_at_least_one(
      full_audio, static_cast<long long>(global_start * sr), static_cast<long long>(global_end * sr));
}
