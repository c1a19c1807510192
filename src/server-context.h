#pragma once

#include "audio-source.h"
#include "content-cache.h"
#include "http-fetch.h"
#include "model-coordinator.h"
#include "request-stats.h"
#include "server-config.h"
#include "temp-janitor.h"
#include "verification.h"

#include <memory>
#include <mutex>
#include <string>

// Process-wide state shared by all request handlers. Members are created in
// dependency order by init_server_context and torn down in reverse.
struct server_context {
    server_config cfg;

    std::unique_ptr<request_stats> stats;
    std::unique_ptr<temp_janitor> janitor;
    std::unique_ptr<content_cache> cache;
    std::unique_ptr<audio_source_resolver> resolver;
    std::unique_ptr<model_coordinator> models;
    std::unique_ptr<verification_engine> engine;

    // Settings changeable through POST /config.
    mutable std::mutex settings_mtx;
    float threshold = 0.5f;
    threshold_mode mode = THRESHOLD_STRICT;

    void get_decision(float & threshold_out, threshold_mode & mode_out) const {
        std::lock_guard<std::mutex> lock(settings_mtx);
        threshold_out = threshold;
        mode_out = mode;
    }
};

model_config make_model_config(const server_config & cfg, const std::string & model_id, const std::string & model_path);

// Loader that opens a speaker_encoder GGUF for model_config.
model_loader make_speaker_encoder_loader(float max_audio_seconds);

bool init_server_context(
        server_context & ctx,
        const server_config & cfg,
        model_loader loader,
        url_fetcher fetcher,
        sleep_fn sleeper,
        std::string & err);
