#include "request-stats.h"

#include "spkv-common.h"

#include <algorithm>
#include <cstdio>
#include <new>
#include <utility>

request_stats::request_stats(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)), started_(std::chrono::steady_clock::now()) {
}

void request_stats::record(bool success, double duration_ms) noexcept {
    total_.fetch_add(1, std::memory_order_relaxed);
    if (success) {
        success_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }
    const double us = std::max(0.0, duration_ms * 1000.0);
    total_us_.fetch_add((uint64_t) us, std::memory_order_relaxed);
}

void request_stats::record(request_record rec) noexcept {
    record(rec.success, rec.duration_ms);

    std::unique_lock<std::mutex> lock(ring_mtx_, std::try_to_lock);
    if (!lock.owns_lock()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    try {
        if (ring_.size() < capacity_) {
            ring_.push_back(std::move(rec));
        } else {
            ring_[ring_next_] = std::move(rec);
        }
        ring_next_ = (ring_next_ + 1) % capacity_;
    } catch (const std::bad_alloc &) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

request_stats_snapshot request_stats::snapshot() const {
    request_stats_snapshot s;
    s.total = total_.load();
    s.success = success_.load();
    s.failed = failed_.load();
    s.inflight = inflight_.load();
    s.dropped_records = dropped_.load();
    s.total_duration_ms = (double) total_us_.load() / 1000.0;
    s.avg_duration_ms = s.total > 0 ? s.total_duration_ms / (double) s.total : 0.0;
    s.success_rate = s.total > 0 ? (double) s.success / (double) s.total : 0.0;
    s.uptime_sec = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count();
    return s;
}

std::vector<request_record> request_stats::recent(size_t max_n) const {
    std::lock_guard<std::mutex> lock(ring_mtx_);
    std::vector<request_record> out;
    const size_t n = std::min(max_n, ring_.size());
    out.reserve(n);
    // oldest slot is ring_next_ once the ring has wrapped
    const size_t start = ring_.size() < capacity_ ? 0 : ring_next_;
    for (size_t i = ring_.size() - n; i < ring_.size(); ++i) {
        out.push_back(ring_[(start + i) % ring_.size()]);
    }
    return out;
}

request_scope::request_scope(request_stats & stats, std::string endpoint, std::string client)
    : stats_(stats), endpoint_(std::move(endpoint)), client_(std::move(client)), t0_(std::chrono::steady_clock::now()) {
    stats_.begin_request();
}

request_scope::~request_scope() {
    stats_.end_request();

    request_record rec;
    rec.timestamp_ms = now_ms();
    rec.duration_ms = elapsed_ms();
    rec.success = success_;
    try {
        rec.endpoint = endpoint_;
        rec.error = error_;
        rec.client = client_;
    } catch (const std::bad_alloc &) {
        rec.endpoint.clear();
    }
    std::fprintf(stderr, "request: endpoint=%s client=%s ok=%s ms=%.2f err=%s\n",
            endpoint_.c_str(), client_.c_str(), success_ ? "true" : "false", rec.duration_ms, error_.c_str());
    stats_.record(std::move(rec));
}

void request_scope::set_error(const spkv_error & err) {
    success_ = false;
    error_ = spkv_error_kind_to_cstr(err.kind);
}

double request_scope::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0_).count();
}
