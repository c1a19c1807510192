#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct audio_file_info {
    int sample_rate = 0;
    int channels = 0;
    uint64_t n_frames = 0;
    double duration_sec = 0.0;
};

// Opens the file with the decoder and reads its native format and length.
bool audio_probe_file(const std::string & path, audio_file_info & info, std::string & err);

// Decodes to mono f32 at target_sample_rate. max_frames == 0 means no limit.
bool audio_decode_file_f32_mono(
        const std::string & path,
        int target_sample_rate,
        size_t max_frames,
        std::vector<float> & out,
        std::string & err);

// 16-bit PCM mono RIFF/WAVE.
bool audio_save_wav16(
        const std::string & path,
        const float * audio,
        size_t n_samples,
        int sample_rate,
        std::string & err);
