#include "audio-source.h"

#include "audio-io.h"
#include "spkv-common.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

const char * audio_source_kind_to_cstr(audio_source_kind kind) {
    switch (kind) {
        case AUDIO_SOURCE_UPLOAD: return "upload";
        case AUDIO_SOURCE_URL:    return "url";
        case AUDIO_SOURCE_PATH:   return "path";
    }
    return "unknown";
}

audio_source audio_source::from_upload(std::string filename, std::string content) {
    audio_source s;
    s.kind = AUDIO_SOURCE_UPLOAD;
    s.filename = std::move(filename);
    s.content = std::move(content);
    return s;
}

audio_source audio_source::from_url(std::string url) {
    audio_source s;
    s.kind = AUDIO_SOURCE_URL;
    s.location = std::move(url);
    return s;
}

audio_source audio_source::from_path(std::string path) {
    audio_source s;
    s.kind = AUDIO_SOURCE_PATH;
    s.location = std::move(path);
    return s;
}

audio_source audio_source::from_string(const std::string & s) {
    const std::string lower = to_lower_ascii(s.substr(0, 8));
    if (lower.compare(0, 7, "http://") == 0 || lower.compare(0, 8, "https://") == 0) {
        return from_url(s);
    }
    return from_path(s);
}

std::string audio_source::describe() const {
    return kind == AUDIO_SOURCE_UPLOAD ? filename : location;
}

void resolved_audio::reset() {
    temp_.reset();
    lease_.release();
    path_.clear();
}

audio_source_resolver::audio_source_resolver(resolver_config cfg, content_cache & cache, temp_janitor & janitor)
    : cfg_(std::move(cfg)), cache_(cache), janitor_(janitor) {
    for (auto & ext : cfg_.allowed_extensions) {
        ext = to_lower_ascii(ext);
        if (!ext.empty() && ext[0] == '.') {
            ext.erase(0, 1);
        }
    }
}

bool audio_source_resolver::is_allowed_extension(const std::string & filename) const {
    const std::string ext = file_extension_lower(filename);
    if (ext.empty()) {
        return false;
    }
    return std::find(cfg_.allowed_extensions.begin(), cfg_.allowed_extensions.end(), ext) != cfg_.allowed_extensions.end();
}

bool audio_source_resolver::validate(const std::string & path, spkv_error & err) const {
    if (!cfg_.validate_audio) {
        return true;
    }

    audio_file_info info;
    std::string perr;
    if (!audio_probe_file(path, info, perr)) {
        err.set(SPKV_ERR_VALIDATION_FAILED, perr);
        return false;
    }

    char buf[160];
    if (cfg_.min_duration_sec > 0.0 && info.duration_sec < cfg_.min_duration_sec) {
        std::snprintf(buf, sizeof(buf), "audio too short: %.2fs (minimum %.2fs)", info.duration_sec, cfg_.min_duration_sec);
        err.set(SPKV_ERR_VALIDATION_FAILED, buf);
        return false;
    }
    if (cfg_.max_duration_sec > 0.0 && info.duration_sec > cfg_.max_duration_sec) {
        std::snprintf(buf, sizeof(buf), "audio too long: %.2fs (maximum %.2fs)", info.duration_sec, cfg_.max_duration_sec);
        err.set(SPKV_ERR_VALIDATION_FAILED, buf);
        return false;
    }
    return true;
}

bool audio_source_resolver::resolve(const audio_source & src, resolved_audio & out, spkv_error & err) {
    out.reset();

    switch (src.kind) {
        case AUDIO_SOURCE_UPLOAD: {
            if (src.content.empty()) {
                err.set(SPKV_ERR_INVALID_SOURCE, "uploaded file is empty");
                return false;
            }
            if (!is_allowed_extension(src.filename)) {
                err.set(SPKV_ERR_INVALID_SOURCE, "unsupported file type: '" + src.filename + "'");
                return false;
            }
            if (cfg_.max_upload_bytes > 0 && src.content.size() > cfg_.max_upload_bytes) {
                err.set(SPKV_ERR_INVALID_SOURCE, "uploaded file exceeds " + std::to_string(cfg_.max_upload_bytes) + " bytes");
                return false;
            }

            // guard first so a failed write is cleaned up too
            scoped_temp_file temp(&janitor_, janitor_.make_path(file_extension_lower(src.filename)));
            std::string io_err;
            if (!save_binary_file(temp.path(), src.content, io_err)) {
                err.set(SPKV_ERR_INTERNAL, io_err);
                return false;
            }
            if (!validate(temp.path(), err)) {
                return false;
            }
            out.path_ = temp.path();
            out.temp_ = std::move(temp);
            return true;
        }
        case AUDIO_SOURCE_URL: {
            parsed_http_url parsed;
            std::string perr;
            if (!parse_http_url(src.location, parsed, perr)) {
                err.set(SPKV_ERR_INVALID_SOURCE, perr);
                return false;
            }
            cache_lease lease;
            if (!cache_.get_or_fetch(src.location, lease, err)) {
                return false;
            }
            if (!validate(lease.path(), err)) {
                return false;
            }
            out.path_ = lease.path();
            out.lease_ = std::move(lease);
            return true;
        }
        case AUDIO_SOURCE_PATH: {
            if (!cfg_.allow_local_paths) {
                err.set(SPKV_ERR_INVALID_SOURCE, "local path sources are disabled");
                return false;
            }
            if (src.location.empty()) {
                err.set(SPKV_ERR_INVALID_SOURCE, "audio path is empty");
                return false;
            }
            std::error_code ec;
            if (!fs::is_regular_file(src.location, ec)) {
                err.set(SPKV_ERR_INVALID_SOURCE, "audio file not found: " + src.location);
                return false;
            }
            std::ifstream probe(src.location, std::ios::binary);
            if (!probe) {
                err.set(SPKV_ERR_INVALID_SOURCE, "audio file is not readable: " + src.location);
                return false;
            }
            if (!validate(src.location, err)) {
                return false;
            }
            out.path_ = src.location;
            return true;
        }
    }

    err.set(SPKV_ERR_INVALID_SOURCE, "unknown audio source kind");
    return false;
}
