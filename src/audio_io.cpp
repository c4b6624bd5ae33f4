#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"
#include "audio_io.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

std::vector<float> decode_audio_mono(const std::filesystem::path& audio_path, int sample_rate) {
    if (sample_rate <= 0) throw std::runtime_error("Invalid target sample rate: " + std::to_string(sample_rate));
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 1, ma_uint32(sample_rate));
    ma_decoder decoder;

    ma_result result = ma_decoder_init_file(audio_path.string().c_str(), &config, &decoder);
    if (result != MA_SUCCESS) {
        throw std::runtime_error("Failed to open audio file: " + audio_path.string() +
                                 " (error: " + std::to_string(result) + ")");
    }

    ma_uint64 total_frames;
    result = ma_decoder_get_length_in_pcm_frames(&decoder, &total_frames);
    if (result != MA_SUCCESS) {
        // Unknown length: decode in chunks without reserving
        total_frames = 0;
    }

    std::vector<float> samples;
    if (total_frames > 0) {
        samples.reserve(static_cast<size_t>(total_frames));
    }

    const size_t chunk_size = static_cast<size_t>(sample_rate);  // 1 second
    std::vector<float> chunk(chunk_size);

    while (true) {
        ma_uint64 frames_read;
        result = ma_decoder_read_pcm_frames(&decoder, chunk.data(), chunk_size, &frames_read);
        if (frames_read == 0) break;

        samples.insert(samples.end(), chunk.begin(), chunk.begin() + frames_read);

        if (result != MA_SUCCESS) break;
    }

    ma_decoder_uninit(&decoder);
    return samples;
}

int probe_sample_rate(const std::filesystem::path& audio_path) {
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 0, 0);
    ma_decoder decoder;
    ma_result result = ma_decoder_init_file(audio_path.string().c_str(), &config, &decoder);
    if (result != MA_SUCCESS) {
        throw std::runtime_error("Failed to open audio file: " + audio_path.string() +
                                 " (error: " + std::to_string(result) + ")");
    }
    ma_format format;
    ma_uint32 channels = 0;
    ma_uint32 rate = 0;
    result = ma_decoder_get_data_format(&decoder, &format, &channels, &rate, nullptr, 0);
    ma_decoder_uninit(&decoder);
    if (result != MA_SUCCESS || rate == 0) {
        throw std::runtime_error("Failed to read sample rate of: " + audio_path.string());
    }
    return static_cast<int>(rate);
}

void write_wav_mono(const std::filesystem::path& path, const std::vector<float>& samples, int sample_rate) {
    if (sample_rate <= 0) throw std::runtime_error("Invalid sample rate for " + path.string());
    ma_encoder_config config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, 1, ma_uint32(sample_rate));
    ma_encoder encoder;
    ma_result result = ma_encoder_init_file(path.string().c_str(), &config, &encoder);
    if (result != MA_SUCCESS) {
        throw std::runtime_error("Failed to open for writing: " + path.string() +
                                 " (error: " + std::to_string(result) + ")");
    }

    std::vector<int16_t> pcm(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        const float v = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }

    ma_uint64 written = 0;
    result = ma_encoder_write_pcm_frames(&encoder, pcm.data(), pcm.size(), &written);
    ma_encoder_uninit(&encoder);
    if (result != MA_SUCCESS || written != pcm.size()) {
        throw std::runtime_error("Failed to write audio: " + path.string());
    }
}

std::vector<float> resample_mono(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (from_rate <= 0 || to_rate <= 0) throw std::runtime_error("Invalid resample rates");
    if (from_rate == to_rate || samples.empty()) return samples;

    ma_resampler_config config = ma_resampler_config_init(
        ma_format_f32, 1, ma_uint32(from_rate), ma_uint32(to_rate), ma_resample_algorithm_linear);
    ma_resampler resampler;
    ma_result result = ma_resampler_init(&config, nullptr, &resampler);
    if (result != MA_SUCCESS) {
        throw std::runtime_error("Failed to init resampler (error: " + std::to_string(result) + ")");
    }

    ma_uint64 frames_in = samples.size();
    ma_uint64 frames_out = static_cast<ma_uint64>(
        std::ceil(double(samples.size()) * double(to_rate) / double(from_rate))) + 1;
    std::vector<float> out(static_cast<size_t>(frames_out));
    result = ma_resampler_process_pcm_frames(&resampler, samples.data(), &frames_in, out.data(), &frames_out);
    ma_resampler_uninit(&resampler, nullptr);
    if (result != MA_SUCCESS) {
        throw std::runtime_error("Resampling failed (error: " + std::to_string(result) + ")");
    }
    out.resize(static_cast<size_t>(frames_out));
    return out;
}
