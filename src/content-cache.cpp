#include "content-cache.h"

#include "spkv-common.h"

#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char * k_entry_suffix = ".audio";
const char * k_part_marker = ".part-";

static bool is_hex_key(const std::string & s) {
    if (s.size() != 64) {
        return false;
    }
    for (char c : s) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!ok) {
            return false;
        }
    }
    return true;
}

static int64_t file_mtime_ms(const fs::path & p) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(p, ec);
    if (ec) {
        return now_ms();
    }
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(fs::file_time_type::clock::now() - mtime).count();
    return now_ms() - std::max<int64_t>(0, (int64_t) age);
}

} // namespace

cache_lease::~cache_lease() {
    release();
}

cache_lease::cache_lease(cache_lease && other) noexcept
    : cache_(other.cache_), key_(std::move(other.key_)), path_(std::move(other.path_)) {
    other.cache_ = nullptr;
    other.key_.clear();
    other.path_.clear();
}

cache_lease & cache_lease::operator=(cache_lease && other) noexcept {
    if (this != &other) {
        release();
        cache_ = other.cache_;
        key_ = std::move(other.key_);
        path_ = std::move(other.path_);
        other.cache_ = nullptr;
        other.key_.clear();
        other.path_.clear();
    }
    return *this;
}

void cache_lease::release() {
    if (cache_ != nullptr) {
        cache_->unpin(key_);
    }
    cache_ = nullptr;
    key_.clear();
    path_.clear();
}

content_cache::content_cache(content_cache_config cfg, url_fetcher fetcher)
    : cfg_(std::move(cfg)), fetcher_(std::move(fetcher)) {
}

std::string content_cache::make_key(const std::string & url) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(url.data(), url.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return std::string();
    }

    static const char * hex = "0123456789abcdef";
    std::string out;
    out.reserve((size_t) digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

std::string content_cache::path_for_key(const std::string & key) const {
    return (fs::path(cfg_.dir) / (key + k_entry_suffix)).string();
}

bool content_cache::init(std::string & err) {
    std::error_code ec;
    fs::create_directories(cfg_.dir, ec);
    if (ec || !fs::is_directory(cfg_.dir, ec)) {
        err = "failed to create cache directory: " + cfg_.dir;
        return false;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    size_t adopted = 0;
    size_t dropped = 0;
    for (const auto & de : fs::directory_iterator(cfg_.dir, ec)) {
        if (!de.is_regular_file(ec)) {
            continue;
        }
        const std::string name = de.path().filename().string();
        if (name.find(k_part_marker) != std::string::npos) {
            fs::remove(de.path(), ec);
            ++dropped;
            continue;
        }
        const std::string suffix = k_entry_suffix;
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        const std::string key = name.substr(0, name.size() - suffix.size());
        if (!is_hex_key(key)) {
            continue;
        }
        const uint64_t size = (uint64_t) de.file_size(ec);
        if (ec || size == 0) {
            fs::remove(de.path(), ec);
            ++dropped;
            continue;
        }
        entry e;
        e.path = de.path().string();
        e.created_at_ms = file_mtime_ms(de.path());
        e.last_used_ms = e.created_at_ms;
        e.size = size;
        total_bytes_ += size;
        entries_[key] = std::move(e);
        ++adopted;
    }

    std::fprintf(stderr, "cache: dir=%s adopted=%zu dropped=%zu bytes=%llu\n",
            cfg_.dir.c_str(), adopted, dropped, (unsigned long long) total_bytes_);
    return true;
}

void content_cache::pin_locked(const std::string & key, entry & e, cache_lease & lease) {
    if (lease.cache_ != nullptr) {
        // drop the previous pin without re-entering the lock
        if (lease.cache_ == this) {
            unpin_locked(lease.key_);
        } else {
            lease.release();
        }
    }
    e.pins += 1;
    e.last_used_ms = now_ms();
    lease.cache_ = this;
    lease.key_ = key;
    lease.path_ = e.path;
}

void content_cache::unpin(const std::string & key) {
    std::lock_guard<std::mutex> lock(mtx_);
    unpin_locked(key);
}

void content_cache::unpin_locked(const std::string & key) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.pins > 0) {
        it->second.pins -= 1;
        it->second.last_used_ms = now_ms();
    }
}

bool content_cache::remove_locked(std::unordered_map<std::string, entry>::iterator it) {
    if (it->second.pins > 0) {
        return false;
    }
    std::error_code ec;
    fs::remove(it->second.path, ec);
    total_bytes_ -= std::min(total_bytes_, it->second.size);
    entries_.erase(it);
    return true;
}

size_t content_cache::evict_locked(int64_t now) {
    size_t removed = 0;
    if (cfg_.ttl_sec > 0) {
        const int64_t ttl_ms = cfg_.ttl_sec * 1000;
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto cur = it++;
            if (cur->second.pins == 0 && now - cur->second.created_at_ms >= ttl_ms) {
                removed += remove_locked(cur) ? 1 : 0;
            }
        }
    }

    if (cfg_.max_bytes > 0 && total_bytes_ > cfg_.max_bytes) {
        std::vector<std::pair<int64_t, std::string>> lru;
        for (const auto & kv : entries_) {
            if (kv.second.pins == 0) {
                lru.emplace_back(kv.second.last_used_ms, kv.first);
            }
        }
        std::sort(lru.begin(), lru.end());
        for (const auto & item : lru) {
            if (total_bytes_ <= cfg_.max_bytes) {
                break;
            }
            auto it = entries_.find(item.second);
            if (it != entries_.end()) {
                removed += remove_locked(it) ? 1 : 0;
            }
        }
    }

    evictions_ += removed;
    return removed;
}

bool content_cache::get_or_fetch(const std::string & url, cache_lease & lease, spkv_error & err) {
    const std::string key = make_key(url);
    if (key.empty()) {
        err.set(SPKV_ERR_INTERNAL, "failed to compute cache key");
        return false;
    }
    const std::string path = path_for_key(key);

    std::unique_lock<std::mutex> lock(mtx_);
    if (cfg_.ttl_sec > 0 || cfg_.max_bytes > 0) {
        evict_locked(now_ms());
    }

    for (;;) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            std::error_code ec;
            const auto size = fs::file_size(it->second.path, ec);
            if (!ec && size > 0) {
                ++hits_;
                pin_locked(key, it->second, lease);
                return true;
            }
            // file vanished underneath us
            if (it->second.pins == 0) {
                total_bytes_ -= std::min(total_bytes_, it->second.size);
                entries_.erase(it);
            }
        }

        auto fit = inflight_.find(key);
        if (fit != inflight_.end()) {
            std::shared_ptr<inflight_fetch> fl = fit->second;
            cv_.wait(lock, [&]() { return fl->done; });
            if (!fl->ok) {
                err = fl->err;
                return false;
            }
            continue;
        }

        {
            std::error_code ec;
            const auto size = fs::file_size(path, ec);
            if (!ec && size > 0) {
                entry e;
                e.path = path;
                e.created_at_ms = file_mtime_ms(path);
                e.last_used_ms = e.created_at_ms;
                e.size = (uint64_t) size;
                total_bytes_ += e.size;
                entries_[key] = std::move(e);
                continue;
            }
        }
        break;
    }

    // this caller performs the fetch, the others wait on inflight_
    auto fl = std::make_shared<inflight_fetch>();
    inflight_[key] = fl;
    ++misses_;
    const std::string part_path = path + k_part_marker + std::to_string(now_ms()) + "-" + std::to_string(++part_counter_);
    lock.unlock();

    spkv_error fetch_err;
    bool ok = false;
    uint64_t size = 0;
    try {
        ok = fetcher_(url, part_path, fetch_err);
    } catch (const std::exception & e) {
        ok = false;
        fetch_err.set(SPKV_ERR_INTERNAL, std::string("fetcher threw: ") + e.what());
    } catch (...) {
        ok = false;
        fetch_err.set(SPKV_ERR_INTERNAL, "fetcher threw a non-standard exception");
    }

    std::error_code ec;
    if (ok) {
        size = (uint64_t) fs::file_size(part_path, ec);
        if (ec || size == 0) {
            ok = false;
            fetch_err.set(SPKV_ERR_DOWNLOAD_FAILED, "download produced an empty file: " + url);
        }
    } else if (fetch_err.ok()) {
        fetch_err.set(SPKV_ERR_DOWNLOAD_FAILED, "download failed: " + url);
    }
    if (ok) {
        fs::rename(part_path, path, ec);
        if (ec) {
            ok = false;
            fetch_err.set(SPKV_ERR_INTERNAL, "failed to publish cache entry: " + ec.message());
        }
    }
    if (!ok) {
        fs::remove(part_path, ec);
    }

    lock.lock();
    ++fetches_;
    inflight_.erase(key);
    fl->done = true;
    fl->ok = ok;
    fl->err = fetch_err;

    if (ok) {
        entry e;
        e.path = path;
        e.created_at_ms = now_ms();
        e.last_used_ms = e.created_at_ms;
        e.size = size;
        auto & slot = entries_[key];
        total_bytes_ -= std::min(total_bytes_, slot.size);
        total_bytes_ += size;
        e.pins = slot.pins;
        slot = std::move(e);
        pin_locked(key, slot, lease);
    } else {
        ++fetch_failures_;
        err = fetch_err;
    }
    cv_.notify_all();

    std::fprintf(stderr, "cache: fetch key=%.12s ok=%s bytes=%llu err=%s\n",
            key.c_str(), ok ? "true" : "false", (unsigned long long) size, ok ? "" : fetch_err.message.c_str());
    return ok;
}

bool content_cache::contains(const std::string & url) const {
    const std::string key = make_key(url);
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.find(key) != entries_.end();
}

size_t content_cache::evict_expired() {
    std::lock_guard<std::mutex> lock(mtx_);
    return evict_locked(now_ms());
}

size_t content_cache::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto cur = it++;
        removed += remove_locked(cur) ? 1 : 0;
    }
    evictions_ += removed;
    return removed;
}

content_cache_stats content_cache::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    content_cache_stats s;
    s.entries = entries_.size();
    s.bytes = total_bytes_;
    s.hits = hits_;
    s.misses = misses_;
    s.fetches = fetches_;
    s.fetch_failures = fetch_failures_;
    s.evictions = evictions_;
    for (const auto & kv : entries_) {
        if (kv.second.pins > 0) {
            ++s.pinned;
        }
    }
    return s;
}
