#include "transcript.h"

#include <algorithm>
#include <cctype>

namespace {

std::string trim(const std::string& s) {
  size_t l = 0;
  while (l < s.size() && std::isspace(static_cast<unsigned char>(s[l]))) l++;
  size_t r = s.size();
  while (r > l && std::isspace(static_cast<unsigned char>(s[r - 1]))) r--;
  return s.substr(l, r - l);
}

}  // namespace

std::vector<TranscriptSegment> remap_transcript(
    const std::string& speaker_id, const std::vector<TranscriptSegment>& compact_segments, const TimeMap& time_map) {
  std::vector<TranscriptSegment> out;
  for (const auto& seg : compact_segments) {
    const auto pieces = split_and_remap(seg.start, seg.end, seg.words, time_map);
    for (const auto& p : pieces) {
      TranscriptSegment g;
      g.start = p.start;
      g.end = p.end;
      g.speaker_id = speaker_id;
      g.speaker_confidence = seg.speaker_confidence;
      if (!p.words.empty()) {
        std::string joined;
        for (const auto& w : p.words) joined += w.text;
        g.text = trim(joined);
        g.words = p.words;
      } else {
        // Compact-time words of other pieces are not carried over.
        g.text = trim(seg.text);
      }
      out.push_back(std::move(g));
    }
  }
  return out;
}

std::vector<TranscriptSegment> merge_speaker_transcripts(std::vector<std::vector<TranscriptSegment>> per_speaker) {
  std::vector<TranscriptSegment> all;
  for (auto& v : per_speaker) {
    for (auto& s : v) all.push_back(std::move(s));
  }
  std::stable_sort(all.begin(), all.end(), [](const TranscriptSegment& a, const TranscriptSegment& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
  });
  for (size_t i = 0; i < all.size(); ++i) all[i].index = int(i + 1);
  return all;
}
