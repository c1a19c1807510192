#pragma once

#include "audio-source.h"
#include "embedding-extractor.h"
#include "model-coordinator.h"
#include "spkv-error.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

enum threshold_mode {
    THRESHOLD_STRICT = 0, // same speaker when score >  threshold
    THRESHOLD_INCLUSIVE,  // same speaker when score >= threshold
};

const char * threshold_mode_to_cstr(threshold_mode mode);
bool parse_threshold_mode(const char * s, threshold_mode & out);

struct verification_result {
    float score = 0.0f;
    float threshold = 0.0f;
    bool is_same = false;
    const char * confidence = "medium";
};

// "high" when |score - threshold| > 0.2, "medium" otherwise.
const char * confidence_band(float score, float threshold);

// Re-normalizes both inputs, the result is clamped to [-1, 1].
bool cosine_similarity(const float * a, const float * b, size_t n, float & out, std::string & err);

bool compare_embeddings(
        const speaker_embedding & a,
        const speaker_embedding & b,
        float threshold,
        threshold_mode mode,
        verification_result & out,
        spkv_error & err);

struct batch_item {
    size_t index = 0;
    std::string candidate;
    bool ok = false;
    verification_result result;
    spkv_error error;
};

struct verification_engine_config {
    int max_load_attempts = 3;
    backoff_policy backoff;
    std::chrono::milliseconds extract_timeout {60000};
    int n_threads = 0;
};

class verification_engine {
public:
    verification_engine(audio_source_resolver & resolver, model_coordinator & models, verification_engine_config cfg);

    bool extract(const audio_source & src, speaker_embedding & out, std::string & model_id, spkv_error & err);

    bool verify(
            const audio_source & a,
            const audio_source & b,
            float threshold,
            threshold_mode mode,
            verification_result & out,
            spkv_error & err);

    // Fails as a whole only when the reference or the model is unusable;
    // candidate failures are reported per item, in input order.
    bool verify_batch(
            const audio_source & reference,
            const std::vector<audio_source> & candidates,
            float threshold,
            threshold_mode mode,
            std::vector<batch_item> & out,
            spkv_error & err);

    model_handle acquire_model(spkv_error & err);

private:
    audio_source_resolver & resolver_;
    model_coordinator & models_;
    verification_engine_config cfg_;

    bool embed(const model_handle & model, const resolved_audio & audio, speaker_embedding & out, spkv_error & err) const;
};
