#include "temp-janitor.h"

#include "spkv-common.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <utility>
#include <unistd.h>

namespace fs = std::filesystem;

temp_janitor::temp_janitor(std::string scratch_dir, std::string prefix)
    : dir_(std::move(scratch_dir)), prefix_(std::move(prefix)), rng_(std::random_device{}()) {
}

bool temp_janitor::init(int64_t stale_age_sec, std::string & err) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_, ec)) {
        err = "failed to create scratch directory: " + dir_;
        return false;
    }
    const size_t removed = sweep_stale(stale_age_sec);
    std::fprintf(stderr, "janitor: scratch=%s swept=%zu\n", dir_.c_str(), removed);
    return true;
}

std::string temp_janitor::make_path(const std::string & ext) {
    uint64_t rnd = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mtx_);
        rnd = rng_();
    }
    char rnd_hex[17];
    std::snprintf(rnd_hex, sizeof(rnd_hex), "%016llx", (unsigned long long) rnd);

    std::string name = prefix_ + std::to_string(now_ms()) + "-" + std::to_string((long long) ::getpid()) + "-" +
            std::to_string(counter_.fetch_add(1)) + "-" + rnd_hex;
    if (!ext.empty()) {
        name += "." + ext;
    }
    return (fs::path(dir_) / name).string();
}

size_t temp_janitor::sweep_stale(int64_t stale_age_sec) {
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        return 0;
    }

    const auto now = fs::file_time_type::clock::now();
    size_t removed = 0;
    for (const auto & entry : it) {
        const std::string name = entry.path().filename().string();
        if (name.compare(0, prefix_.size(), prefix_) != 0 || !entry.is_regular_file(ec)) {
            continue;
        }
        const auto mtime = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - mtime).count();
        if (age < stale_age_sec) {
            continue;
        }
        if (fs::remove(entry.path(), ec)) {
            ++removed;
        }
    }
    return removed;
}

scoped_temp_file::scoped_temp_file(temp_janitor * janitor, std::string path)
    : janitor_(janitor), path_(std::move(path)) {
    if (janitor_ != nullptr && !path_.empty()) {
        janitor_->outstanding_.fetch_add(1);
    }
}

scoped_temp_file::~scoped_temp_file() {
    reset();
}

scoped_temp_file::scoped_temp_file(scoped_temp_file && other) noexcept
    : janitor_(other.janitor_), path_(std::move(other.path_)) {
    other.janitor_ = nullptr;
    other.path_.clear();
}

scoped_temp_file & scoped_temp_file::operator=(scoped_temp_file && other) noexcept {
    if (this != &other) {
        reset();
        janitor_ = other.janitor_;
        path_ = std::move(other.path_);
        other.janitor_ = nullptr;
        other.path_.clear();
    }
    return *this;
}

void scoped_temp_file::reset() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::fprintf(stderr, "janitor: remove failed path=%s err=%s\n", path_.c_str(), ec.message().c_str());
    }
    if (janitor_ != nullptr) {
        janitor_->outstanding_.fetch_sub(1);
    }
    path_.clear();
    janitor_ = nullptr;
}
