#pragma once

#include "spkv-error.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct request_record {
    int64_t timestamp_ms = 0;
    std::string endpoint;
    double duration_ms = 0.0;
    bool success = false;
    std::string error;
    std::string client;
};

struct request_stats_snapshot {
    uint64_t total = 0;
    uint64_t success = 0;
    uint64_t failed = 0;
    int64_t inflight = 0;
    uint64_t dropped_records = 0;
    double total_duration_ms = 0.0;
    double avg_duration_ms = 0.0;
    double success_rate = 0.0;
    int64_t uptime_sec = 0;
};

// Counters are lock-free. The recent-request ring is guarded by a mutex that
// is only ever try_lock'ed, a contended write is dropped and counted.
class request_stats {
public:
    explicit request_stats(size_t capacity = 256);

    void record(bool success, double duration_ms) noexcept;
    void record(request_record rec) noexcept;

    void begin_request() noexcept { inflight_.fetch_add(1); }
    void end_request() noexcept { inflight_.fetch_sub(1); }

    request_stats_snapshot snapshot() const;

    // Newest last, at most max_n records.
    std::vector<request_record> recent(size_t max_n) const;

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    const std::chrono::steady_clock::time_point started_;

    std::atomic<uint64_t> total_ {0};
    std::atomic<uint64_t> success_ {0};
    std::atomic<uint64_t> failed_ {0};
    std::atomic<int64_t> inflight_ {0};
    std::atomic<uint64_t> dropped_ {0};
    std::atomic<uint64_t> total_us_ {0};

    mutable std::mutex ring_mtx_;
    std::vector<request_record> ring_;
    size_t ring_next_ = 0;
};

// Records one request when it goes out of scope, whatever the exit path.
class request_scope {
public:
    request_scope(request_stats & stats, std::string endpoint, std::string client);
    ~request_scope();

    request_scope(const request_scope &) = delete;
    request_scope & operator=(const request_scope &) = delete;

    void set_ok() { success_ = true; error_.clear(); }
    void set_error(const spkv_error & err);
    void set_error(const std::string & type) { success_ = false; error_ = type; }

    double elapsed_ms() const;

private:
    request_stats & stats_;
    std::string endpoint_;
    std::string client_;
    bool success_ = false;
    std::string error_ = "unfinished";
    std::chrono::steady_clock::time_point t0_;
};
