#pragma once

#include "http-fetch.h"
#include "spkv-error.h"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct content_cache_config {
    std::string dir;
    int64_t ttl_sec = 0;    // 0 disables TTL eviction
    uint64_t max_bytes = 0; // 0 disables size-bound eviction
};

struct content_cache_stats {
    size_t entries = 0;
    uint64_t bytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t fetches = 0;
    uint64_t fetch_failures = 0;
    uint64_t evictions = 0;
    size_t pinned = 0;
};

class content_cache;

// Pins a cache entry so eviction and clear() leave its file alone.
class cache_lease {
public:
    cache_lease() = default;
    ~cache_lease();

    cache_lease(cache_lease && other) noexcept;
    cache_lease & operator=(cache_lease && other) noexcept;

    cache_lease(const cache_lease &) = delete;
    cache_lease & operator=(const cache_lease &) = delete;

    const std::string & path() const { return path_; }
    bool valid() const { return cache_ != nullptr; }

    void release();

private:
    friend class content_cache;

    content_cache * cache_ = nullptr;
    std::string key_;
    std::string path_;
};

// URL-keyed download cache with single-flight fetching. The lock only guards
// the bookkeeping, transfers for different keys run in parallel.
class content_cache {
public:
    content_cache(content_cache_config cfg, url_fetcher fetcher);

    content_cache(const content_cache &) = delete;
    content_cache & operator=(const content_cache &) = delete;

    // Creates the directory, drops partial downloads and adopts finished entries.
    bool init(std::string & err);

    bool get_or_fetch(const std::string & url, cache_lease & lease, spkv_error & err);

    bool contains(const std::string & url) const;

    // Returns the number of entries removed; pinned entries are kept.
    size_t evict_expired();
    size_t clear();

    content_cache_stats stats() const;

    const content_cache_config & config() const { return cfg_; }

    static std::string make_key(const std::string & url);
    std::string path_for_key(const std::string & key) const;

private:
    friend class cache_lease;

    struct entry {
        std::string path;
        int64_t created_at_ms = 0;
        int64_t last_used_ms = 0;
        uint64_t size = 0;
        int pins = 0;
    };

    struct inflight_fetch {
        bool done = false;
        bool ok = false;
        spkv_error err;
    };

    content_cache_config cfg_;
    url_fetcher fetcher_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::string, entry> entries_;
    std::unordered_map<std::string, std::shared_ptr<inflight_fetch>> inflight_;
    uint64_t total_bytes_ = 0;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t fetches_ = 0;
    uint64_t fetch_failures_ = 0;
    uint64_t evictions_ = 0;
    uint64_t part_counter_ = 0;

    void unpin(const std::string & key);
    void unpin_locked(const std::string & key);
    void pin_locked(const std::string & key, entry & e, cache_lease & lease);
    bool remove_locked(std::unordered_map<std::string, entry>::iterator it);
    size_t evict_locked(int64_t now);
};
