#pragma once

#include "model-coordinator.h"
#include "verification.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

struct server_config {
    struct model_file_config {
        std::string id;
        std::string path;
    };

    std::string host = "0.0.0.0";
    int32_t port = 5002;
    int32_t n_http_threads = 8;

    std::string model_path;
    std::string model_id;
    std::string device = "auto";
    int32_t n_threads = 0;
    std::vector<model_file_config> model_files;

    float threshold = 0.5f;
    threshold_mode threshold_mode_value = THRESHOLD_STRICT;

    std::string cache_dir;
    std::string scratch_dir;
    int64_t cache_ttl_sec = 0;
    int64_t cache_max_mb = 0;

    int64_t max_upload_mb = 50;
    std::vector<std::string> allowed_extensions = {"wav", "mp3", "flac"};
    bool allow_local_paths = true;
    float min_duration_sec = 0.5f;
    float max_duration_sec = 30.0f;

    int32_t download_timeout_sec = 30;
    int32_t extract_timeout_sec = 60;

    int32_t load_attempts = 3;
    backoff_kind backoff = BACKOFF_EXPONENTIAL;
    int32_t backoff_base_ms = 500;
    int32_t backoff_max_ms = 8000;
    bool lazy_load = false;

    int32_t stats_capacity = 256;
    bool verbose = false;

    uint64_t max_upload_bytes() const { return (uint64_t) max_upload_mb * 1024ull * 1024ull; }
    backoff_policy backoff_policy_value() const;

    // Path registered for id, "" if unknown.
    std::string model_path_for_id(const std::string & id) const;
};

using env_getter = std::function<const char *(const char * name)>;

void print_usage(const char * argv0);

// Environment overrides. Pass nullptr to read the process environment.
bool apply_env_overrides(server_config & cfg, const env_getter & getenv_fn, std::string & err);

bool parse_args(int argc, char ** argv, server_config & cfg, std::string & err);

// Fills derived defaults and range-checks every field.
bool finalize_config(server_config & cfg, std::string & err);

bool parse_model_file_json_arg(
        const std::string & raw,
        const std::string & option_name,
        std::vector<server_config::model_file_config> & out,
        std::string & err);

json server_config_to_json(const server_config & cfg);
