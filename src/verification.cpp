#include "verification.h"

#include "spkv-common.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

const char * threshold_mode_to_cstr(threshold_mode mode) {
    return mode == THRESHOLD_INCLUSIVE ? "inclusive" : "strict";
}

bool parse_threshold_mode(const char * s, threshold_mode & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = to_lower_ascii(s);
    if (v == "strict" || v == ">") {
        out = THRESHOLD_STRICT;
        return true;
    }
    if (v == "inclusive" || v == ">=") {
        out = THRESHOLD_INCLUSIVE;
        return true;
    }
    return false;
}

const char * confidence_band(float score, float threshold) {
    return std::fabs(score - threshold) > 0.2f ? "high" : "medium";
}

bool cosine_similarity(const float * a, const float * b, size_t n, float & out, std::string & err) {
    if (n == 0) {
        err = "embeddings are empty";
        return false;
    }

    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dot += (double) a[i] * (double) b[i];
        na += (double) a[i] * (double) a[i];
        nb += (double) b[i] * (double) b[i];
    }
    if (!(na > 0.0) || !(nb > 0.0) || !std::isfinite(na) || !std::isfinite(nb) || !std::isfinite(dot)) {
        err = "embedding has zero or non-finite norm";
        return false;
    }

    const double score = dot / (std::sqrt(na) * std::sqrt(nb));
    out = (float) std::clamp(score, -1.0, 1.0);
    return true;
}

bool compare_embeddings(
        const speaker_embedding & a,
        const speaker_embedding & b,
        float threshold,
        threshold_mode mode,
        verification_result & out,
        spkv_error & err) {
    if (a.size() != b.size()) {
        err.set(SPKV_ERR_INVALID_SOURCE, "embedding dimensions differ: " + std::to_string(a.size()) +
                " vs " + std::to_string(b.size()));
        return false;
    }

    float score = 0.0f;
    std::string cerr;
    if (!cosine_similarity(a.data(), b.data(), a.size(), score, cerr)) {
        err.set(SPKV_ERR_INVALID_SOURCE, cerr);
        return false;
    }

    out.score = score;
    out.threshold = threshold;
    out.is_same = mode == THRESHOLD_INCLUSIVE ? score >= threshold : score > threshold;
    out.confidence = confidence_band(score, threshold);
    return true;
}

verification_engine::verification_engine(audio_source_resolver & resolver, model_coordinator & models, verification_engine_config cfg)
    : resolver_(resolver), models_(models), cfg_(std::move(cfg)) {
}

model_handle verification_engine::acquire_model(spkv_error & err) {
    return models_.ensure_ready(cfg_.max_load_attempts, cfg_.backoff, err);
}

bool verification_engine::embed(const model_handle & model, const resolved_audio & audio, speaker_embedding & out, spkv_error & err) const {
    extract_options opts;
    opts.deadline = std::chrono::steady_clock::now() + cfg_.extract_timeout;
    opts.n_threads = resolve_threads(cfg_.n_threads);

    if (!model->extract(audio.path(), opts, out, err)) {
        if (err.ok()) {
            err.set(SPKV_ERR_EXTRACTION, "extractor failed without detail");
        }
        return false;
    }
    if ((int) out.size() != model->embedding_dim()) {
        err.set(SPKV_ERR_EXTRACTION, "extractor returned " + std::to_string(out.size()) +
                " values, expected " + std::to_string(model->embedding_dim()));
        return false;
    }
    return true;
}

bool verification_engine::extract(const audio_source & src, speaker_embedding & out, std::string & model_id, spkv_error & err) {
    resolved_audio audio;
    if (!resolver_.resolve(src, audio, err)) {
        return false;
    }
    model_handle model = acquire_model(err);
    if (!model) {
        return false;
    }
    model_id = model->model_id();
    return embed(model, audio, out, err);
}

bool verification_engine::verify(
        const audio_source & a,
        const audio_source & b,
        float threshold,
        threshold_mode mode,
        verification_result & out,
        spkv_error & err) {
    resolved_audio audio_a;
    resolved_audio audio_b;
    if (!resolver_.resolve(a, audio_a, err) || !resolver_.resolve(b, audio_b, err)) {
        return false;
    }

    model_handle model = acquire_model(err);
    if (!model) {
        return false;
    }

    speaker_embedding emb_a;
    speaker_embedding emb_b;
    if (!embed(model, audio_a, emb_a, err) || !embed(model, audio_b, emb_b, err)) {
        return false;
    }
    return compare_embeddings(emb_a, emb_b, threshold, mode, out, err);
}

bool verification_engine::verify_batch(
        const audio_source & reference,
        const std::vector<audio_source> & candidates,
        float threshold,
        threshold_mode mode,
        std::vector<batch_item> & out,
        spkv_error & err) {
    out.clear();

    speaker_embedding ref_emb;
    model_handle model;
    {
        resolved_audio ref_audio;
        if (!resolver_.resolve(reference, ref_audio, err)) {
            err.message = "reference: " + err.message;
            return false;
        }
        model = acquire_model(err);
        if (!model) {
            return false;
        }
        if (!embed(model, ref_audio, ref_emb, err)) {
            err.message = "reference: " + err.message;
            return false;
        }
    }

    out.reserve(candidates.size());
    size_t n_ok = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        batch_item item;
        item.index = i;
        item.candidate = candidates[i].describe();

        // released at the end of each iteration
        resolved_audio audio;
        speaker_embedding emb;
        if (resolver_.resolve(candidates[i], audio, item.error) &&
            embed(model, audio, emb, item.error) &&
            compare_embeddings(ref_emb, emb, threshold, mode, item.result, item.error)) {
            item.ok = true;
            ++n_ok;
        }
        out.push_back(std::move(item));
    }

    std::fprintf(stderr, "request: verify_batch candidates=%zu ok=%zu failed=%zu\n",
            candidates.size(), n_ok, candidates.size() - n_ok);
    return true;
}
