#pragma once

#include <filesystem>
#include <vector>

// Decode any supported audio file (MP3, WAV, FLAC, etc.) to mono float samples
// at sample_rate. Returns samples in range [-1.0, 1.0]. Throws on decode failure.
std::vector<float> decode_audio_mono(const std::filesystem::path& audio_path, int sample_rate = 16000);

// Sample rate of the file as stored (no decode of the payload).
int probe_sample_rate(const std::filesystem::path& audio_path);

// Write mono float samples as 16-bit PCM WAV. Throws on failure.
void write_wav_mono(const std::filesystem::path& path, const std::vector<float>& samples, int sample_rate);

// Linear resampling of a mono buffer.
std::vector<float> resample_mono(const std::vector<float>& samples, int from_rate, int to_rate);
