#include "server-config.h"

#include "spkv-common.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace {

static bool is_valid_model_id(const std::string & id) {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') ||
                        (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') ||
                        c == '_' || c == '-' || c == '.' || c == '/';
        if (!ok) {
            return false;
        }
    }
    return true;
}

static bool parse_model_file_json_entry(
        const json & j,
        const std::string & arg_name,
        server_config::model_file_config & out,
        std::string & err) {
    if (!j.is_object()) {
        err = arg_name + " entry must be a JSON object";
        return false;
    }

    const auto it_id = j.find("id");
    const auto it_path = j.find("path");
    if (it_id == j.end() || !it_id->is_string()) {
        err = arg_name + " requires string field 'id'";
        return false;
    }
    if (it_path == j.end() || !it_path->is_string()) {
        err = arg_name + " requires string field 'path'";
        return false;
    }

    out.id = it_id->get<std::string>();
    out.path = it_path->get<std::string>();
    if (!is_valid_model_id(out.id)) {
        err = arg_name + " id is invalid: " + out.id;
        return false;
    }
    if (out.path.empty()) {
        err = arg_name + " path is empty";
        return false;
    }
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

} // namespace

backoff_policy server_config::backoff_policy_value() const {
    backoff_policy p;
    p.kind = backoff;
    p.base = std::chrono::milliseconds(backoff_base_ms);
    p.max = std::chrono::milliseconds(backoff_max_ms);
    return p;
}

std::string server_config::model_path_for_id(const std::string & id) const {
    for (const auto & m : model_files) {
        if (m.id == id) {
            return m.path;
        }
    }
    return std::string();
}

void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -m MODEL [options]\n\n"
        "Model:\n"
        "  -m, --model FNAME               speaker encoder GGUF (env SPKV_MODEL)\n"
        "  --model-id STR                  id reported for --model (env SPEAKER_MODEL_ID)\n"
        "  --model-file-json JSON          register selectable models, object or array\n"
        "                                  e.g. '[{\"id\":\"campplus\",\"path\":\"/models/campplus.gguf\"}]'\n"
        "  --device STR                    auto | cpu (default: auto, env DEVICE)\n"
        "  --threads N                     compute threads per extraction (default: 0, auto)\n"
        "  --load-attempts N               model load attempts before failing (default: 3)\n"
        "  --backoff STR                   linear | exponential (default: exponential)\n"
        "  --backoff-base-ms N             first retry delay (default: 500)\n"
        "  --backoff-max-ms N              retry delay cap (default: 8000)\n"
        "  --lazy-load                     load the model on first use instead of at start-up\n\n"
        "Verification:\n"
        "  --threshold F                   decision threshold (default: 0.5, env SIMILARITY_THRESHOLD)\n"
        "  --threshold-mode STR            strict (>) | inclusive (>=) (default: strict)\n\n"
        "Audio input:\n"
        "  --max-upload-mb N               upload and download limit (default: 50, env MAX_CONTENT_LENGTH in bytes)\n"
        "  --allowed-ext LIST              accepted upload extensions (default: wav,mp3,flac)\n"
        "  --min-duration F                minimum audio seconds (default: 0.5, env MIN_AUDIO_DURATION)\n"
        "  --max-duration F                maximum audio seconds (default: 30, env MAX_AUDIO_DURATION)\n"
        "  --local-paths on|off            accept server-side file paths (default: on)\n"
        "  --download-timeout N            download connect/read timeout seconds (default: 30)\n"
        "  --extract-timeout N             extraction deadline seconds (default: 60)\n\n"
        "Storage:\n"
        "  --cache-dir DIR                 URL download cache (env CACHE_DIR)\n"
        "  --scratch-dir DIR               upload scratch directory (default: <cache-dir>/scratch)\n"
        "  --cache-ttl N                   evict cache entries older than N seconds (default: 0, off)\n"
        "  --cache-max-mb N                evict least recently used above N MiB (default: 0, off)\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 0.0.0.0, env HOST)\n"
        "  --port N                        bind port (default: 5002, env PORT)\n"
        "  --threads-http N                request worker threads (default: 8)\n"
        "  --stats-capacity N              recent requests kept for /stats (default: 256)\n"
        "  --verbose                       print all ggml log output\n",
        argv0);
}

bool apply_env_overrides(server_config & cfg, const env_getter & getenv_fn, std::string & err) {
    auto get = [&](const char * name) -> const char * {
        const char * v = getenv_fn ? getenv_fn(name) : std::getenv(name);
        return (v != nullptr && v[0] != '\0') ? v : nullptr;
    };

    if (const char * v = get("HOST")) cfg.host = v;
    if (const char * v = get("PORT")) {
        if (!parse_i32(v, cfg.port)) { err = "invalid PORT: " + std::string(v); return false; }
    }
    if (const char * v = get("SPKV_MODEL")) cfg.model_path = v;
    if (const char * v = get("SPEAKER_MODEL_ID")) cfg.model_id = v;
    if (const char * v = get("DEVICE")) cfg.device = v;
    if (const char * v = get("SIMILARITY_THRESHOLD")) {
        if (!parse_f32(v, cfg.threshold)) { err = "invalid SIMILARITY_THRESHOLD: " + std::string(v); return false; }
    }
    if (const char * v = get("MAX_CONTENT_LENGTH")) {
        int64_t bytes = 0;
        if (!parse_i64(v, bytes) || bytes <= 0) { err = "invalid MAX_CONTENT_LENGTH: " + std::string(v); return false; }
        cfg.max_upload_mb = std::max<int64_t>(1, (bytes + 1024 * 1024 - 1) / (1024 * 1024));
    }
    if (const char * v = get("MIN_AUDIO_DURATION")) {
        if (!parse_f32(v, cfg.min_duration_sec)) { err = "invalid MIN_AUDIO_DURATION: " + std::string(v); return false; }
    }
    if (const char * v = get("MAX_AUDIO_DURATION")) {
        if (!parse_f32(v, cfg.max_duration_sec)) { err = "invalid MAX_AUDIO_DURATION: " + std::string(v); return false; }
    }
    if (const char * v = get("CACHE_DIR")) cfg.cache_dir = v;
    return true;
}

bool parse_model_file_json_arg(
        const std::string & raw,
        const std::string & option_name,
        std::vector<server_config::model_file_config> & out,
        std::string & err) {
    try {
        const json j = json::parse(raw);

        if (j.is_object()) {
            server_config::model_file_config mcfg;
            if (!parse_model_file_json_entry(j, option_name, mcfg, err)) {
                return false;
            }
            out.push_back(std::move(mcfg));
            return true;
        }

        if (j.is_array()) {
            for (size_t idx = 0; idx < j.size(); ++idx) {
                server_config::model_file_config mcfg;
                if (!parse_model_file_json_entry(j[idx], option_name + "[" + std::to_string(idx) + "]", mcfg, err)) {
                    return false;
                }
                out.push_back(std::move(mcfg));
            }
            return true;
        }

        err = option_name + " must be a JSON object or array";
        return false;
    } catch (const std::exception & e) {
        err = std::string("invalid ") + option_name + " JSON: " + e.what();
        return false;
    }
}

bool parse_args(int argc, char ** argv, server_config & cfg, std::string & err) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        bool ok = true;
        if (arg == "-m" || arg == "--model") {
            ok = needs_value(i, argc);
            if (ok) cfg.model_path = argv[++i];
        } else if (arg == "--model-id") {
            ok = needs_value(i, argc);
            if (ok) cfg.model_id = argv[++i];
        } else if (arg == "--model-file-json") {
            if (!needs_value(i, argc)) {
                ok = false;
            } else if (!parse_model_file_json_arg(argv[++i], arg, cfg.model_files, err)) {
                return false;
            }
        } else if (arg == "--device") {
            ok = needs_value(i, argc);
            if (ok) cfg.device = argv[++i];
        } else if (arg == "--threads") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.n_threads);
        } else if (arg == "--load-attempts") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.load_attempts);
        } else if (arg == "--backoff") {
            ok = needs_value(i, argc) && parse_backoff_kind(argv[++i], cfg.backoff);
        } else if (arg == "--backoff-base-ms") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.backoff_base_ms);
        } else if (arg == "--backoff-max-ms") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.backoff_max_ms);
        } else if (arg == "--lazy-load") {
            cfg.lazy_load = true;
        } else if (arg == "--threshold") {
            ok = needs_value(i, argc) && parse_f32(argv[++i], cfg.threshold);
        } else if (arg == "--threshold-mode") {
            ok = needs_value(i, argc) && parse_threshold_mode(argv[++i], cfg.threshold_mode_value);
        } else if (arg == "--max-upload-mb") {
            ok = needs_value(i, argc) && parse_i64(argv[++i], cfg.max_upload_mb);
        } else if (arg == "--allowed-ext") {
            ok = needs_value(i, argc) && parse_csv_list(argv[++i], cfg.allowed_extensions);
        } else if (arg == "--min-duration") {
            ok = needs_value(i, argc) && parse_f32(argv[++i], cfg.min_duration_sec);
        } else if (arg == "--max-duration") {
            ok = needs_value(i, argc) && parse_f32(argv[++i], cfg.max_duration_sec);
        } else if (arg == "--local-paths") {
            ok = needs_value(i, argc) && parse_on_off_bool(argv[++i], cfg.allow_local_paths);
        } else if (arg == "--download-timeout") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.download_timeout_sec);
        } else if (arg == "--extract-timeout") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.extract_timeout_sec);
        } else if (arg == "--cache-dir") {
            ok = needs_value(i, argc);
            if (ok) cfg.cache_dir = argv[++i];
        } else if (arg == "--scratch-dir") {
            ok = needs_value(i, argc);
            if (ok) cfg.scratch_dir = argv[++i];
        } else if (arg == "--cache-ttl") {
            ok = needs_value(i, argc) && parse_i64(argv[++i], cfg.cache_ttl_sec);
        } else if (arg == "--cache-max-mb") {
            ok = needs_value(i, argc) && parse_i64(argv[++i], cfg.cache_max_mb);
        } else if (arg == "--host") {
            ok = needs_value(i, argc);
            if (ok) cfg.host = argv[++i];
        } else if (arg == "--port") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.port);
        } else if (arg == "--threads-http") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.n_http_threads);
        } else if (arg == "--stats-capacity") {
            ok = needs_value(i, argc) && parse_i32(argv[++i], cfg.stats_capacity);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            err.clear();
            return false;
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
        if (!ok) {
            err = "missing or invalid value for " + arg;
            return false;
        }
    }
    return true;
}

bool finalize_config(server_config & cfg, std::string & err) {
    if (cfg.model_path.empty() && !cfg.model_files.empty()) {
        const std::string path = cfg.model_id.empty() ? cfg.model_files.front().path : cfg.model_path_for_id(cfg.model_id);
        if (path.empty()) {
            err = "model id is not registered: " + cfg.model_id;
            return false;
        }
        cfg.model_path = path;
    }
    if (cfg.model_path.empty()) {
        err = "a model is required (-m or --model-file-json)";
        return false;
    }
    if (cfg.model_id.empty()) {
        for (const auto & m : cfg.model_files) {
            if (m.path == cfg.model_path) {
                cfg.model_id = m.id;
                break;
            }
        }
        if (cfg.model_id.empty()) {
            cfg.model_id = std::filesystem::path(cfg.model_path).stem().string();
        }
    }
    if (cfg.model_path_for_id(cfg.model_id).empty()) {
        cfg.model_files.push_back({cfg.model_id, cfg.model_path});
    }

    const std::string device = to_lower_ascii(cfg.device);
    if (device != "auto" && device != "cpu") {
        err = "unsupported --device: " + cfg.device + " (expected auto or cpu)";
        return false;
    }
    cfg.device = device;

    if (!std::isfinite(cfg.threshold) || cfg.threshold < -1.0f || cfg.threshold > 1.0f) {
        err = "threshold must be within [-1, 1]";
        return false;
    }
    if (cfg.port < 0 || cfg.port > 65535) {
        err = "invalid port";
        return false;
    }
    if (cfg.n_http_threads < 1 || cfg.load_attempts < 1 || cfg.stats_capacity < 1) {
        err = "--threads-http, --load-attempts and --stats-capacity must be positive";
        return false;
    }
    if (cfg.backoff_base_ms < 0 || cfg.backoff_max_ms < cfg.backoff_base_ms) {
        err = "backoff delays must satisfy 0 <= base <= max";
        return false;
    }
    if (cfg.max_upload_mb < 1 || cfg.download_timeout_sec < 1 || cfg.extract_timeout_sec < 1) {
        err = "upload limit and timeouts must be positive";
        return false;
    }
    if (cfg.cache_ttl_sec < 0 || cfg.cache_max_mb < 0) {
        err = "cache limits must not be negative";
        return false;
    }
    if (cfg.min_duration_sec < 0.0f || (cfg.max_duration_sec > 0.0f && cfg.max_duration_sec < cfg.min_duration_sec)) {
        err = "invalid duration limits";
        return false;
    }
    if (cfg.allowed_extensions.empty()) {
        err = "--allowed-ext must list at least one extension";
        return false;
    }
    for (auto & ext : cfg.allowed_extensions) {
        ext = to_lower_ascii(ext);
        if (!ext.empty() && ext[0] == '.') {
            ext.erase(0, 1);
        }
    }

    if (cfg.cache_dir.empty()) {
        std::error_code ec;
        std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            tmp = "/tmp";
        }
        cfg.cache_dir = (tmp / "speaker_verification_cache").string();
    }
    if (cfg.scratch_dir.empty()) {
        cfg.scratch_dir = (std::filesystem::path(cfg.cache_dir) / "scratch").string();
    }
    return true;
}

json server_config_to_json(const server_config & cfg) {
    json models = json::array();
    for (const auto & m : cfg.model_files) {
        models.push_back({{"id", m.id}, {"path", m.path}});
    }
    return json {
        {"model_id", cfg.model_id},
        {"model_path", cfg.model_path},
        {"device", cfg.device},
        {"threshold", cfg.threshold},
        {"threshold_mode", threshold_mode_to_cstr(cfg.threshold_mode_value)},
        {"max_file_size", cfg.max_upload_bytes()},
        {"allowed_extensions", cfg.allowed_extensions},
        {"allow_local_paths", cfg.allow_local_paths},
        {"min_audio_duration", cfg.min_duration_sec},
        {"max_audio_duration", cfg.max_duration_sec},
        {"download_timeout_sec", cfg.download_timeout_sec},
        {"extract_timeout_sec", cfg.extract_timeout_sec},
        {"cache_dir", cfg.cache_dir},
        {"cache_ttl_sec", cfg.cache_ttl_sec},
        {"cache_max_mb", cfg.cache_max_mb},
        {"load_attempts", cfg.load_attempts},
        {"backoff", backoff_kind_to_cstr(cfg.backoff)},
        {"backoff_base_ms", cfg.backoff_base_ms},
        {"backoff_max_ms", cfg.backoff_max_ms},
        {"http_threads", cfg.n_http_threads},
        {"models", models},
    };
}
