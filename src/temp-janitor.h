#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

// Owns the scratch directory for request-scoped files.
class temp_janitor {
public:
    explicit temp_janitor(std::string scratch_dir, std::string prefix = "spkv-upload-");

    // Creates the directory and removes leftovers older than stale_age_sec.
    bool init(int64_t stale_age_sec, std::string & err);

    // Fresh, collision-resistant path; nothing is created on disk.
    std::string make_path(const std::string & ext);

    size_t sweep_stale(int64_t stale_age_sec);

    size_t outstanding() const { return outstanding_.load(); }
    const std::string & dir() const { return dir_; }
    const std::string & prefix() const { return prefix_; }

private:
    friend class scoped_temp_file;

    std::string dir_;
    std::string prefix_;
    std::atomic<uint64_t> counter_ {0};
    std::atomic<size_t> outstanding_ {0};
    std::mutex rng_mtx_;
    std::mt19937_64 rng_;
};

// Deletes the file it guards when it goes out of scope, on every exit path.
class scoped_temp_file {
public:
    scoped_temp_file() = default;
    scoped_temp_file(temp_janitor * janitor, std::string path);
    ~scoped_temp_file();

    scoped_temp_file(scoped_temp_file && other) noexcept;
    scoped_temp_file & operator=(scoped_temp_file && other) noexcept;

    scoped_temp_file(const scoped_temp_file &) = delete;
    scoped_temp_file & operator=(const scoped_temp_file &) = delete;

    const std::string & path() const { return path_; }
    bool active() const { return !path_.empty(); }

    void reset();

private:
    temp_janitor * janitor_ = nullptr;
    std::string path_;
};
