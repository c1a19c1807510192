#pragma once

#include "embedding-extractor.h"
#include "spkv-error.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

enum model_state {
    MODEL_STATE_UNLOADED = 0,
    MODEL_STATE_LOADING,
    MODEL_STATE_READY,
    MODEL_STATE_FAILED,
};

const char * model_state_to_cstr(model_state state);

enum backoff_kind {
    BACKOFF_LINEAR = 0,
    BACKOFF_EXPONENTIAL,
};

const char * backoff_kind_to_cstr(backoff_kind kind);
bool parse_backoff_kind(const char * s, backoff_kind & out);

struct backoff_policy {
    backoff_kind kind = BACKOFF_EXPONENTIAL;
    std::chrono::milliseconds base {500};
    std::chrono::milliseconds max {8000};

    // Wait after the attempt-th failure (1-based). Non-decreasing in attempt, capped at max.
    std::chrono::milliseconds delay(int attempt) const;
};

struct model_config {
    std::string model_path;
    std::string model_id;
    std::string device = "auto";
    int n_threads = 0;
};

using model_handle = std::shared_ptr<const embedding_extractor>;
using model_loader = std::function<model_handle(const model_config & cfg, spkv_error & err)>;
using sleep_fn = std::function<void(std::chrono::milliseconds)>;

struct model_status {
    model_state state = MODEL_STATE_UNLOADED;
    int attempts = 0;
    std::string last_error;
    std::string model_id;
    uint64_t generation = 0;
    uint64_t load_count = 0;
    int64_t ready_at_ms = 0;
};

// The single owner of the shared extractor handle. One caller loads while
// concurrent callers wait for its outcome.
class model_coordinator {
public:
    model_coordinator(model_config cfg, model_loader loader, sleep_fn sleeper = nullptr);

    model_coordinator(const model_coordinator &) = delete;
    model_coordinator & operator=(const model_coordinator &) = delete;

    // Returns the ready handle, loading it first if needed. On exhausted
    // retries returns nullptr with SPKV_ERR_MODEL_UNAVAILABLE.
    model_handle ensure_ready(int max_attempts, const backoff_policy & backoff, spkv_error & err);

    // Switches to new_cfg and loads it. Handles already given out stay valid.
    bool reload(const model_config & new_cfg, int max_attempts, const backoff_policy & backoff, spkv_error & err);

    // Ready handle or nullptr; never loads.
    model_handle current() const;

    model_status status() const;
    model_config config() const;

    void shutdown();

private:
    model_config cfg_;
    model_loader loader_;
    sleep_fn sleeper_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;

    model_state state_ = MODEL_STATE_UNLOADED;
    model_handle handle_;
    int attempts_ = 0;
    std::string last_error_;
    uint64_t generation_ = 0;
    uint64_t load_seq_ = 0;
    uint64_t failed_seq_ = 0;
    uint64_t load_count_ = 0;
    int64_t ready_at_ms_ = 0;
};
