#include "model-coordinator.h"

#include "spkv-common.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <thread>
#include <utility>

const char * model_state_to_cstr(model_state state) {
    switch (state) {
        case MODEL_STATE_UNLOADED: return "unloaded";
        case MODEL_STATE_LOADING:  return "loading";
        case MODEL_STATE_READY:    return "ready";
        case MODEL_STATE_FAILED:   return "failed";
    }
    return "unknown";
}

const char * backoff_kind_to_cstr(backoff_kind kind) {
    return kind == BACKOFF_LINEAR ? "linear" : "exponential";
}

bool parse_backoff_kind(const char * s, backoff_kind & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = to_lower_ascii(s);
    if (v == "linear") {
        out = BACKOFF_LINEAR;
        return true;
    }
    if (v == "exponential" || v == "exp") {
        out = BACKOFF_EXPONENTIAL;
        return true;
    }
    return false;
}

std::chrono::milliseconds backoff_policy::delay(int attempt) const {
    const int64_t base_ms = std::max<int64_t>(0, base.count());
    const int64_t max_ms = std::max<int64_t>(base_ms, max.count());
    const int64_t n = std::max(1, attempt);

    int64_t ms = base_ms;
    if (kind == BACKOFF_LINEAR) {
        ms = base_ms * n;
    } else {
        // base * 2^(n-1), saturating before the shift can overflow
        const int64_t shift = std::min<int64_t>(n - 1, 30);
        ms = base_ms << shift;
        if (base_ms > 0 && (ms >> shift) != base_ms) {
            ms = max_ms;
        }
    }
    return std::chrono::milliseconds(std::min(ms, max_ms));
}

model_coordinator::model_coordinator(model_config cfg, model_loader loader, sleep_fn sleeper)
    : cfg_(std::move(cfg)), loader_(std::move(loader)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

model_handle model_coordinator::ensure_ready(int max_attempts, const backoff_policy & backoff, spkv_error & err) {
    max_attempts = std::max(1, max_attempts);

    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        if (state_ == MODEL_STATE_READY && handle_) {
            return handle_;
        }

        if (state_ == MODEL_STATE_LOADING) {
            const uint64_t waited_seq = load_seq_;
            cv_.wait(lock, [&]() { return state_ != MODEL_STATE_LOADING || load_seq_ != waited_seq; });
            if (state_ == MODEL_STATE_FAILED && failed_seq_ >= waited_seq) {
                err.set(SPKV_ERR_MODEL_UNAVAILABLE, "model load failed after " + std::to_string(attempts_) +
                        " attempt(s): " + last_error_);
                return nullptr;
            }
            continue;
        }

        // Unloaded or Failed: this caller becomes the loader.
        state_ = MODEL_STATE_LOADING;
        const uint64_t seq = ++load_seq_;
        const uint64_t gen = generation_;
        const model_config cfg = cfg_;
        attempts_ = 0;
        lock.unlock();

        model_handle loaded;
        spkv_error load_err;
        int attempt = 0;
        for (attempt = 1; attempt <= max_attempts; ++attempt) {
            load_err.clear();
            const int64_t t0 = steady_now_ms();
            try {
                loaded = loader_(cfg, load_err);
            } catch (const std::exception & e) {
                loaded.reset();
                load_err.set(SPKV_ERR_INTERNAL, std::string("loader threw: ") + e.what());
            } catch (...) {
                loaded.reset();
                load_err.set(SPKV_ERR_INTERNAL, "loader threw a non-standard exception");
            }
            const int64_t t1 = steady_now_ms();
            if (loaded && load_err.ok()) {
                std::fprintf(stderr, "model: load attempt=%d/%d ok=true ms=%lld id=%s\n",
                        attempt, max_attempts, (long long) (t1 - t0), cfg.model_id.c_str());
                break;
            }
            loaded.reset();
            if (load_err.ok()) {
                load_err.set(SPKV_ERR_INTERNAL, "loader returned no model");
            }
            std::fprintf(stderr, "model: load attempt=%d/%d ok=false ms=%lld err=%s\n",
                    attempt, max_attempts, (long long) (t1 - t0), load_err.message.c_str());
            {
                std::lock_guard<std::mutex> g(mtx_);
                attempts_ = attempt;
                last_error_ = load_err.message;
            }
            if (attempt < max_attempts) {
                sleeper_(backoff.delay(attempt));
            }
        }

        lock.lock();
        ++load_count_;
        if (generation_ != gen) {
            // reload() changed the config mid-load; this result is stale
            std::fprintf(stderr, "model: discarding stale load generation=%llu current=%llu\n",
                    (unsigned long long) gen, (unsigned long long) generation_);
            state_ = MODEL_STATE_UNLOADED;
            cv_.notify_all();
            continue;
        }

        if (loaded) {
            state_ = MODEL_STATE_READY;
            handle_ = loaded;
            attempts_ = std::min(attempt, max_attempts);
            last_error_.clear();
            ready_at_ms_ = now_ms();
            cv_.notify_all();
            return handle_;
        }

        state_ = MODEL_STATE_FAILED;
        failed_seq_ = seq;
        attempts_ = max_attempts;
        last_error_ = load_err.message;
        cv_.notify_all();
        err.set(SPKV_ERR_MODEL_UNAVAILABLE, "model load failed after " + std::to_string(max_attempts) +
                " attempt(s): " + last_error_);
        return nullptr;
    }
}

bool model_coordinator::reload(const model_config & new_cfg, int max_attempts, const backoff_policy & backoff, spkv_error & err) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cfg_ = new_cfg;
        ++generation_;
        handle_.reset();
        if (state_ != MODEL_STATE_LOADING) {
            state_ = MODEL_STATE_UNLOADED;
        }
        std::fprintf(stderr, "model: reload requested id=%s generation=%llu\n",
                cfg_.model_id.c_str(), (unsigned long long) generation_);
    }
    return ensure_ready(max_attempts, backoff, err) != nullptr;
}

model_handle model_coordinator::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_ == MODEL_STATE_READY ? handle_ : nullptr;
}

model_status model_coordinator::status() const {
    std::lock_guard<std::mutex> lock(mtx_);
    model_status s;
    s.state = state_;
    s.attempts = attempts_;
    s.last_error = last_error_;
    s.model_id = handle_ ? handle_->model_id() : cfg_.model_id;
    s.generation = generation_;
    s.load_count = load_count_;
    s.ready_at_ms = ready_at_ms_;
    return s;
}

model_config model_coordinator::config() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cfg_;
}

void model_coordinator::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    handle_.reset();
    if (state_ != MODEL_STATE_LOADING) {
        state_ = MODEL_STATE_UNLOADED;
    }
}
