#pragma once

#include <functional>
#include <string>
#include <vector>

struct fbank_params {
    int sample_rate = 16000;
    int n_mels = 80;
    float frame_length_ms = 25.0f;
    float frame_shift_ms = 10.0f;
    float preemph = 0.97f;
    float low_freq = 20.0f;
    float high_freq = 0.0f; // <= 0 means nyquist + high_freq
    float input_scale = 32768.0f;
    bool subtract_mean = true;
};

// Log-mel filterbank features, output is [n_mels, n_frames] contiguous float data.
// should_abort is polled between frames; when it returns true the call fails.
bool fbank_compute(
        const std::vector<float> & wav,
        const fbank_params & params,
        std::vector<float> & feats_out,
        int & n_frames,
        std::string & err,
        const std::function<bool()> & should_abort = nullptr);
