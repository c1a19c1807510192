#include "server-config.h"
#include "server-context.h"
#include "server-routes.h"

#include "ggml.h"

#include <httplib.h>

#include <csignal>
#include <cstdio>
#include <string>

namespace {

bool g_verbose = false;
httplib::Server * g_server = nullptr;

void ggml_log_callback_server(ggml_log_level level, const char * text, void * /* user_data */) {
    if (g_verbose || level >= GGML_LOG_LEVEL_WARN) {
        std::fputs(text, stderr);
    }
}

void handle_stop_signal(int) {
    if (g_server != nullptr) {
        g_server->stop();
    }
}

} // namespace

int main(int argc, char ** argv) {
    server_config cfg;
    std::string err;
    if (!apply_env_overrides(cfg, nullptr, err)) {
        std::fprintf(stderr, "config: %s\n", err.c_str());
        return 1;
    }
    if (!parse_args(argc, argv, cfg, err)) {
        if (!err.empty()) {
            std::fprintf(stderr, "config: %s\n", err.c_str());
        }
        print_usage(argv[0]);
        return err.empty() ? 0 : 1;
    }
    if (!finalize_config(cfg, err)) {
        std::fprintf(stderr, "config: %s\n", err.c_str());
        return 1;
    }

    g_verbose = cfg.verbose;
    ggml_log_set(ggml_log_callback_server, nullptr);

    if (cfg.verbose) {
        std::fprintf(stderr, "config: %s\n", server_config_to_json(cfg).dump().c_str());
    }

    server_context ctx;
    if (!init_server_context(ctx, cfg, make_speaker_encoder_loader(cfg.max_duration_sec), nullptr, nullptr, err)) {
        std::fprintf(stderr, "server: init failed: %s\n", err.c_str());
        return 1;
    }

    if (!cfg.lazy_load) {
        spkv_error load_err;
        // the server still starts, /health reports the failure and later requests retry
        if (!ctx.models->ensure_ready(cfg.load_attempts, cfg.backoff_policy_value(), load_err)) {
            std::fprintf(stderr, "server: initial model load failed: %s\n", load_err.message.c_str());
        }
    } else {
        std::fprintf(stderr, "server: model load deferred to first request\n");
    }

    httplib::Server server;
    configure_server(server, cfg);
    register_routes(server, ctx);

    g_server = &server;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    std::fprintf(stderr, "spkv-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    const bool listened = server.listen(cfg.host, cfg.port);
    g_server = nullptr;
    ctx.models->shutdown();

    if (!listened) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }
    std::fprintf(stderr, "spkv-server stopped\n");
    return 0;
}
