#include "server-context.h"

#include "speaker-encoder.h"

#include <chrono>
#include <cstdio>
#include <utility>

namespace {

// Upload names older than this are left over from a previous process.
constexpr int64_t k_stale_upload_age_sec = 15 * 60;

} // namespace

model_config make_model_config(const server_config & cfg, const std::string & model_id, const std::string & model_path) {
    model_config mc;
    mc.model_id = model_id;
    mc.model_path = model_path;
    mc.device = cfg.device;
    mc.n_threads = cfg.n_threads;
    return mc;
}

model_loader make_speaker_encoder_loader(float max_audio_seconds) {
    return [max_audio_seconds](const model_config & mc, spkv_error & err) -> model_handle {
        auto encoder = std::make_shared<speaker_encoder>();
        encoder->set_model_id(mc.model_id);
        encoder->set_max_audio_seconds(max_audio_seconds);
        std::string load_err;
        if (!encoder->load(mc.model_path, mc.device, load_err)) {
            err.set(SPKV_ERR_MODEL_UNAVAILABLE, load_err);
            return nullptr;
        }
        return encoder;
    };
}

bool init_server_context(
        server_context & ctx,
        const server_config & cfg,
        model_loader loader,
        url_fetcher fetcher,
        sleep_fn sleeper,
        std::string & err) {
    ctx.cfg = cfg;
    ctx.threshold = cfg.threshold;
    ctx.mode = cfg.threshold_mode_value;

    ctx.stats = std::make_unique<request_stats>((size_t) cfg.stats_capacity);

    ctx.janitor = std::make_unique<temp_janitor>(cfg.scratch_dir);
    if (!ctx.janitor->init(k_stale_upload_age_sec, err)) {
        return false;
    }

    if (!fetcher) {
        http_fetch_options fo;
        fo.connect_timeout_sec = cfg.download_timeout_sec;
        fo.read_timeout_sec = cfg.download_timeout_sec;
        fo.total_timeout_sec = cfg.download_timeout_sec * 2;
        fo.max_bytes = cfg.max_upload_bytes();
        fetcher = make_http_fetcher(fo);
    }

    content_cache_config cc;
    cc.dir = cfg.cache_dir;
    cc.ttl_sec = cfg.cache_ttl_sec;
    cc.max_bytes = (uint64_t) cfg.cache_max_mb * 1024ull * 1024ull;
    ctx.cache = std::make_unique<content_cache>(cc, std::move(fetcher));
    if (!ctx.cache->init(err)) {
        return false;
    }

    resolver_config rc;
    rc.allowed_extensions = cfg.allowed_extensions;
    rc.max_upload_bytes = cfg.max_upload_bytes();
    rc.allow_local_paths = cfg.allow_local_paths;
    rc.min_duration_sec = cfg.min_duration_sec;
    rc.max_duration_sec = cfg.max_duration_sec;
    ctx.resolver = std::make_unique<audio_source_resolver>(rc, *ctx.cache, *ctx.janitor);

    ctx.models = std::make_unique<model_coordinator>(
            make_model_config(cfg, cfg.model_id, cfg.model_path), std::move(loader), std::move(sleeper));

    verification_engine_config ec;
    ec.max_load_attempts = cfg.load_attempts;
    ec.backoff = cfg.backoff_policy_value();
    ec.extract_timeout = std::chrono::seconds(cfg.extract_timeout_sec);
    ec.n_threads = cfg.n_threads;
    ctx.engine = std::make_unique<verification_engine>(*ctx.resolver, *ctx.models, ec);

    std::fprintf(stderr, "server: context ready model=%s device=%s threshold=%.3f mode=%s cache=%s scratch=%s\n",
            cfg.model_id.c_str(), cfg.device.c_str(), cfg.threshold,
            threshold_mode_to_cstr(cfg.threshold_mode_value), cfg.cache_dir.c_str(), cfg.scratch_dir.c_str());
    return true;
}
