#include "json_io.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string read_all_text(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open: " + path.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_all_text(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for writing: " + path.string());
    f << content;
    if (!f) throw std::runtime_error("Failed to write: " + path.string());
}

json parse_document(const std::string& content, const char* what) {
    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid ") + what + " JSON: " + e.what());
    }
}

// Numbers may arrive as JSON numbers or numeric strings; null counts as missing.
bool read_number(const json& obj, const char* key, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_number()) {
        out = it->get<double>();
        return true;
    }
    if (it->is_string()) {
        try {
            out = std::stod(it->get<std::string>());
            return true;
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Non-numeric value for '") + key + "'");
        }
    }
    throw std::runtime_error(std::string("Non-numeric value for '") + key + "'");
}

// start|start_time, end|end_time; missing end -> start; end < start -> start.
void read_times(const json& obj, double& start, double& end) {
    start = 0.0;
    if (!read_number(obj, "start", start)) read_number(obj, "start_time", start);
    end = start;
    if (!read_number(obj, "end", end)) {
        if (!read_number(obj, "end_time", end)) end = start;
    }
    if (end < start) end = start;
}

const json& records_of(const json& j, const char* what) {
    if (j.is_array()) return j;
    if (j.is_object()) {
        if (!j.contains("segments")) {
            throw std::runtime_error(std::string(what) + " JSON object missing 'segments' field");
        }
        const json& segs = j["segments"];
        if (!segs.is_array()) throw std::runtime_error(std::string(what) + " 'segments' is not an array");
        return segs;
    }
    throw std::runtime_error(std::string("Invalid ") + what + " JSON: expected array or object");
}

SpeakerTurn parse_turn_object(const json& obj, size_t index) {
    if (!obj.is_object()) throw std::runtime_error("Speaker turn " + std::to_string(index) + " is not an object");
    SpeakerTurn t;
    read_times(obj, t.start, t.end);
    if (t.start < 0.0) {
        t.start = 0.0;
        t.end = std::max(t.end, 0.0);
    }
    if (obj.contains("speaker_id") && obj["speaker_id"].is_string()) {
        t.speaker_id = obj["speaker_id"].get<std::string>();
    } else if (obj.contains("speaker") && obj["speaker"].is_string()) {
        t.speaker_id = obj["speaker"].get<std::string>();
    } else {
        throw std::runtime_error("Speaker turn missing required 'speaker_id' field at index " + std::to_string(index));
    }
    // Speaker ids name per-speaker directories and files.
    t.speaker_id = sanitize_speaker_id(t.speaker_id);
    double conf = 1.0;
    read_number(obj, "confidence", conf);
    t.confidence = static_cast<float>(std::max(0.0, std::min(1.0, conf)));
    return t;
}

TranscriptWord parse_word_object(const json& obj) {
    TranscriptWord w;
    if (obj.contains("word") && obj["word"].is_string()) {
        w.text = obj["word"].get<std::string>();
    } else if (obj.contains("text") && obj["text"].is_string()) {
        w.text = obj["text"].get<std::string>();
    }
    read_times(obj, w.start, w.end);
    double p = 0.0;
    if (read_number(obj, "probability", p)) w.probability = static_cast<float>(p);
    return w;
}

TranscriptSegment parse_segment_object(const json& obj, int default_index) {
    if (!obj.is_object()) {
        throw std::runtime_error("Segment " + std::to_string(default_index) + " is not an object");
    }
    TranscriptSegment seg;
    seg.index = obj.value("index", default_index);
    read_times(obj, seg.start, seg.end);
    if (obj.contains("text") && obj["text"].is_string()) seg.text = obj["text"].get<std::string>();
    if (obj.contains("words") && obj["words"].is_array()) {
        for (const auto& w : obj["words"]) {
            if (w.is_object()) seg.words.push_back(parse_word_object(w));
        }
    }
    if (obj.contains("speaker_id") && obj["speaker_id"].is_string()) seg.speaker_id = obj["speaker_id"].get<std::string>();
    double conf = 1.0;
    if (read_number(obj, "speaker_confidence", conf)) seg.speaker_confidence = static_cast<float>(conf);
    seg.audio_path = obj.value("audio_path", std::string());
    seg.reference_audio_path = obj.value("reference_audio_path", std::string());
    return seg;
}

json time_map_to_json(const TimeMap& time_map) {
    json j = json::array();
    for (const auto& m : time_map) {
        j.push_back({
            {"compact_start", m.compact_start},
            {"compact_end", m.compact_end},
            {"global_start", m.global_start},
            {"global_end", m.global_end},
        });
    }
    return j;
}

TimeMap time_map_from_json(const json& j) {
    if (!j.is_array()) throw std::runtime_error("Time map must be an array");
    TimeMap out;
    out.reserve(j.size());
    for (const auto& item : j) {
        TimeMapEntry m;
        if (!read_number(item, "compact_start", m.compact_start) || !read_number(item, "compact_end", m.compact_end) ||
            !read_number(item, "global_start", m.global_start) || !read_number(item, "global_end", m.global_end)) {
            throw std::runtime_error("Time map entry missing a compact/global bound");
        }
        out.push_back(m);
    }
    return out;
}

} // namespace

Timeline parse_speaker_turns(const std::string& content) {
    const json j = parse_document(content, "speaker turns");
    Timeline turns;
    size_t index = 0;
    for (const auto& item : records_of(j, "Speaker turns")) {
        turns.push_back(parse_turn_object(item, index++));
    }
    return turns;
}

Timeline read_speaker_turns(const std::filesystem::path& path) {
    return parse_speaker_turns(read_all_text(path));
}

std::string format_speaker_turns(const Timeline& timeline) {
    json j = json::array();
    for (const auto& t : timeline) {
        j.push_back({
            {"start", t.start},
            {"end", t.end},
            {"speaker_id", t.speaker_id},
            {"confidence", t.confidence},
        });
    }
    return j.dump(2) + "\n";
}

void write_speaker_turns(const std::filesystem::path& path, const Timeline& timeline) {
    write_all_text(path, format_speaker_turns(timeline));
}

std::string format_time_map(const TimeMap& time_map) {
    return time_map_to_json(time_map).dump(2) + "\n";
}

void write_time_map(const std::filesystem::path& path, const TimeMap& time_map) {
    write_all_text(path, format_time_map(time_map));
}

TimeMap parse_time_map(const std::string& content) {
    return time_map_from_json(parse_document(content, "time map"));
}

TimeMap read_time_map(const std::filesystem::path& path) {
    return parse_time_map(read_all_text(path));
}

void write_tracks_summary(const std::filesystem::path& path, const std::vector<TrackSummary>& tracks) {
    json j = json::array();
    for (const auto& t : tracks) {
        j.push_back({
            {"speaker_id", t.speaker_id},
            {"wav_path", t.wav_path.string()},
            {"map_path", t.map_path.string()},
            {"kept_seconds", t.kept_seconds},
            {"overlapped_seconds", t.overlapped_seconds},
            {"overlap_ratio", t.overlap_ratio},
        });
    }
    write_all_text(path, j.dump(2) + "\n");
}

std::string format_track_index(const TrackIndex& index) {
    json j = json::object();
    for (const auto& kv : index) {
        j[kv.first] = {
            {"wav_path", kv.second.wav_path.string()},
            {"mapping", time_map_to_json(kv.second.mapping)},
        };
    }
    return j.dump(2) + "\n";
}

void write_track_index(const std::filesystem::path& path, const TrackIndex& index) {
    write_all_text(path, format_track_index(index));
}

TrackIndex parse_track_index(const std::string& content) {
    const json j = parse_document(content, "track index");
    if (!j.is_object()) throw std::runtime_error("Invalid track index JSON: expected an object");
    TrackIndex index;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& entry = it.value();
        if (!entry.is_object() || !entry.contains("mapping")) {
            throw std::runtime_error("Track index entry for '" + it.key() + "' missing 'mapping'");
        }
        if (sanitize_speaker_id(it.key()) != it.key()) {
            throw std::runtime_error("Track index speaker id is not a plain name: '" + it.key() + "'");
        }
        TrackIndexEntry e;
        e.wav_path = entry.value("wav_path", std::string());
        e.mapping = time_map_from_json(entry["mapping"]);
        index[it.key()] = std::move(e);
    }
    return index;
}

TrackIndex read_track_index(const std::filesystem::path& path) {
    return parse_track_index(read_all_text(path));
}

std::vector<TranscriptSegment> parse_transcript_segments(const std::string& content) {
    const json j = parse_document(content, "transcript");
    std::vector<TranscriptSegment> segments;
    int index = 1;
    for (const auto& item : records_of(j, "Transcript")) {
        segments.push_back(parse_segment_object(item, index++));
    }
    return segments;
}

std::vector<TranscriptSegment> read_transcript_segments(const std::filesystem::path& path) {
    return parse_transcript_segments(read_all_text(path));
}

std::string format_transcript_output(const std::vector<TranscriptSegment>& segments, double processing_time) {
    json j;
    j["segments"] = json::array();

    std::set<std::string> speakers;
    for (const auto& seg : segments) {
        json seg_obj;
        seg_obj["index"] = seg.index;
        seg_obj["start"] = seg.start;
        seg_obj["end"] = seg.end;
        seg_obj["start_time"] = seg.start;
        seg_obj["end_time"] = seg.end;
        seg_obj["text"] = seg.text;
        if (!seg.speaker_id.empty()) {
            seg_obj["speaker_id"] = seg.speaker_id;
            seg_obj["speaker_confidence"] = seg.speaker_confidence;
            speakers.insert(seg.speaker_id);
        }
        json words = json::array();
        for (const auto& w : seg.words) {
            words.push_back({{"word", w.text}, {"start", w.start}, {"end", w.end}, {"probability", w.probability}});
        }
        seg_obj["words"] = words;
        if (!seg.audio_path.empty()) seg_obj["audio_path"] = seg.audio_path;
        if (!seg.reference_audio_path.empty()) seg_obj["reference_audio_path"] = seg.reference_audio_path;
        j["segments"].push_back(seg_obj);
    }

    j["metadata"]["count"] = segments.size();
    j["metadata"]["speakers"] = speakers.size();
    j["metadata"]["processing_time"] = processing_time;

    return j.dump(2) + "\n";
}

void write_transcript_output(
    const std::filesystem::path& path,
    const std::vector<TranscriptSegment>& segments,
    double processing_time) {
    write_all_text(path, format_transcript_output(segments, processing_time));
}
