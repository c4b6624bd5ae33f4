#include "timeline.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

double interval_overlap(double a_start, double a_end, double b_start, double b_end) {
  return std::max(0.0, std::min(a_end, b_end) - std::max(a_start, b_start));
}

std::pair<double, double> clip_interval(double start, double end, double lo, double hi) {
  const double s = std::max(lo, std::min(start, hi));
  const double e = std::max(s, std::min(end, hi));
  return {s, e};
}

void sort_turns(Timeline& turns) {
  std::stable_sort(turns.begin(), turns.end(), [](const SpeakerTurn& a, const SpeakerTurn& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
  });
}

std::vector<SpeakerTurns> group_by_speaker(const Timeline& turns) {
  std::vector<SpeakerTurns> groups;
  std::unordered_map<std::string, size_t> index;
  for (const auto& t : turns) {
    auto it = index.find(t.speaker_id);
    if (it == index.end()) {
      it = index.emplace(t.speaker_id, groups.size()).first;
      groups.push_back({t.speaker_id, {}});
    }
    groups[it->second].turns.push_back(t);
  }
  for (auto& g : groups) sort_turns(g.turns);
  return groups;
}

std::vector<std::pair<std::string, double>> speaker_durations(const Timeline& turns) {
  std::vector<std::pair<std::string, double>> out;
  std::unordered_map<std::string, size_t> index;
  for (const auto& t : turns) {
    auto it = index.find(t.speaker_id);
    if (it == index.end()) {
      it = index.emplace(t.speaker_id, out.size()).first;
      out.emplace_back(t.speaker_id, 0.0);
    }
    out[it->second].second += t.duration();
  }
  return out;
}

size_t count_speakers(const Timeline& turns) {
  std::unordered_set<std::string> ids;
  for (const auto& t : turns) ids.insert(t.speaker_id);
  return ids.size();
}

Timeline single_speaker_timeline(double start, double end, float confidence) {
  SpeakerTurn t;
  t.start = std::max(0.0, std::min(start, end));
  t.end = std::max(t.start, std::max(start, end));
  t.speaker_id = "speaker_0";
  t.confidence = confidence;
  return {t};
}

std::string sanitize_speaker_id(const std::string& speaker_id) {
  if (speaker_id.empty() || speaker_id == "." || speaker_id == "..") return "_";
  std::string out = speaker_id;
  for (auto& c : out) {
    if (c == '/' || c == '\\' || c == '\0') c = '_';
  }
  return out;
}
