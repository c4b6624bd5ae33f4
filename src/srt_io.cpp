#include "srt_io.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string format_srt_time(double sec) {
  if (sec < 0) sec = 0;
  const int hh = int(sec / 3600.0);
  sec -= double(hh) * 3600.0;
  const int mm = int(sec / 60.0);
  sec -= double(mm) * 60.0;
  const int ss = int(sec);
  const int ms = int((sec - double(ss)) * 1000.0);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d,%03d", hh, mm, ss, ms);
  return std::string(buf);
}

std::string format_srt(const std::vector<TranscriptSegment>& segs) {
  std::ostringstream f;
  for (size_t i = 0; i < segs.size(); ++i) {
    const auto& s = segs[i];
    f << (s.index ? s.index : int(i + 1)) << "\n";
    f << format_srt_time(s.start) << " --> " << format_srt_time(s.end) << "\n";
    if (!s.speaker_id.empty()) f << "[" << s.speaker_id << "] ";
    f << s.text << "\n\n";
  }
  return f.str();
}

void write_srt_utf8(const std::filesystem::path& path, const std::vector<TranscriptSegment>& segs) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to write " + path.string());
  f << format_srt(segs);
}
