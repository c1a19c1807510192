#pragma once

#include "content-cache.h"
#include "spkv-error.h"
#include "temp-janitor.h"

#include <cstdint>
#include <string>
#include <vector>

enum audio_source_kind {
    AUDIO_SOURCE_UPLOAD = 0,
    AUDIO_SOURCE_URL,
    AUDIO_SOURCE_PATH,
};

const char * audio_source_kind_to_cstr(audio_source_kind kind);

struct audio_source {
    audio_source_kind kind = AUDIO_SOURCE_PATH;
    std::string filename; // upload only
    std::string content;  // upload only
    std::string location; // url or local path

    static audio_source from_upload(std::string filename, std::string content);
    static audio_source from_url(std::string url);
    static audio_source from_path(std::string path);

    // Strings starting with http:// or https:// are URLs, anything else a path.
    static audio_source from_string(const std::string & s);

    // Label used in batch results and logs.
    std::string describe() const;
};

// A validated local file. owned == true means the file was created for this
// request and is deleted when the object is destroyed.
class resolved_audio {
public:
    resolved_audio() = default;
    resolved_audio(resolved_audio &&) = default;
    resolved_audio & operator=(resolved_audio &&) = default;

    const std::string & path() const { return path_; }
    bool owned() const { return temp_.active(); }

    void reset();

private:
    friend class audio_source_resolver;

    std::string path_;
    scoped_temp_file temp_;
    cache_lease lease_;
};

struct resolver_config {
    std::vector<std::string> allowed_extensions = {"wav", "mp3", "flac"};
    uint64_t max_upload_bytes = 50ull * 1024 * 1024;
    bool allow_local_paths = true;
    bool validate_audio = true;
    double min_duration_sec = 0.5;
    double max_duration_sec = 30.0;
};

class audio_source_resolver {
public:
    audio_source_resolver(resolver_config cfg, content_cache & cache, temp_janitor & janitor);

    // Errors: SPKV_ERR_INVALID_SOURCE, SPKV_ERR_DOWNLOAD_FAILED, SPKV_ERR_TIMEOUT,
    // SPKV_ERR_VALIDATION_FAILED. Nothing owned is left on disk on failure.
    bool resolve(const audio_source & src, resolved_audio & out, spkv_error & err);

    bool validate(const std::string & path, spkv_error & err) const;

    bool is_allowed_extension(const std::string & filename) const;

    const resolver_config & config() const { return cfg_; }

private:
    resolver_config cfg_;
    content_cache & cache_;
    temp_janitor & janitor_;
};
