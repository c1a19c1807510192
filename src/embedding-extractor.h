#pragma once

#include "spkv-error.h"

#include <chrono>
#include <string>
#include <vector>

using speaker_embedding = std::vector<float>;

struct extract_options {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    int n_threads = 0;

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

// A loaded speaker model. Implementations must allow concurrent extract() calls
// on the same instance and return L2-normalized vectors of embedding_dim().
class embedding_extractor {
public:
    virtual ~embedding_extractor() = default;

    virtual int embedding_dim() const = 0;
    virtual const std::string & model_id() const = 0;

    // Errors: SPKV_ERR_EXTRACTION for unreadable audio or compute failure,
    // SPKV_ERR_TIMEOUT once options.deadline has passed.
    virtual bool extract(
            const std::string & audio_path,
            const extract_options & options,
            speaker_embedding & out,
            spkv_error & err) const = 0;
};

// In-place L2 normalization; returns false for a zero or non-finite vector.
bool l2_normalize(speaker_embedding & v);
