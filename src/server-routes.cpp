#include "server-routes.h"

#include "spkv-common.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char * k_json_type = "application/json; charset=utf-8";

static bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

template<typename T>
static bool get_json_number(const json & j, const char * key, T & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    out = it->get<T>();
    return true;
}

static json make_error_json(const spkv_error & err) {
    const int code = spkv_error_http_status(err.kind);
    return json {
        {"success", false},
        {"error", {
            {"type", spkv_error_kind_to_cstr(err.kind)},
            {"message", err.message},
            {"code", code},
            {"retryable", spkv_error_is_retryable(err.kind)},
        }},
    };
}

static void send_json(httplib::Response & res, int status, const json & j) {
    res.status = status;
    res.set_content(j.dump(), k_json_type);
}

static void send_error(httplib::Response & res, const spkv_error & err) {
    send_json(res, spkv_error_http_status(err.kind), make_error_json(err));
}

static void send_error(httplib::Response & res, request_scope & scope, spkv_error_kind kind, const std::string & msg) {
    spkv_error err;
    err.set(kind, msg);
    scope.set_error(err);
    send_error(res, err);
}

static json verification_result_to_json(const verification_result & r, threshold_mode mode) {
    return json {
        {"score", r.score},
        {"similarity", r.score},
        {"is_same_speaker", r.is_same},
        {"threshold", r.threshold},
        {"threshold_mode", threshold_mode_to_cstr(mode)},
        {"confidence", r.confidence},
    };
}

static json stats_to_json(const request_stats_snapshot & s) {
    return json {
        {"total_requests", s.total},
        {"successful_requests", s.success},
        {"failed_requests", s.failed},
        {"inflight", s.inflight},
        {"success_rate", s.success_rate},
        {"avg_response_time_ms", s.avg_duration_ms},
        {"uptime_sec", s.uptime_sec},
        {"dropped_records", s.dropped_records},
    };
}

static json cache_stats_to_json(const content_cache_stats & s) {
    return json {
        {"entries", s.entries},
        {"bytes", s.bytes},
        {"hits", s.hits},
        {"misses", s.misses},
        {"fetches", s.fetches},
        {"fetch_failures", s.fetch_failures},
        {"evictions", s.evictions},
        {"pinned", s.pinned},
    };
}

static bool parse_json_body(const httplib::Request & req, json & body, spkv_error & err) {
    try {
        body = json::parse(req.body.empty() ? "{}" : req.body);
    } catch (const std::exception & e) {
        err.set(SPKV_ERR_INVALID_SOURCE, std::string("invalid JSON: ") + e.what());
        return false;
    }
    if (!body.is_object()) {
        err.set(SPKV_ERR_INVALID_SOURCE, "request body must be a JSON object");
        return false;
    }
    return true;
}

// Accepts "http(s)://..." or a path string, or {"url": ...} / {"path": ...}.
static bool parse_source_json(const json & j, audio_source & out, std::string & err) {
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        if (s.empty()) {
            err = "audio source string is empty";
            return false;
        }
        out = audio_source::from_string(s);
        return true;
    }
    if (j.is_object()) {
        std::string v;
        if (get_json_string(j, "url", v)) {
            out = audio_source::from_url(v);
            return true;
        }
        if (get_json_string(j, "path", v)) {
            out = audio_source::from_path(v);
            return true;
        }
        err = "audio source object needs 'url' or 'path'";
        return false;
    }
    err = "audio source must be a string or an object";
    return false;
}

// Looks for <name> as an uploaded file, then <name>_url / <name>_path as form
// fields or JSON keys, then <name> as a JSON source.
static bool find_source(
        const httplib::Request & req,
        const json & body,
        const std::string & name,
        audio_source & out,
        spkv_error & err) {
    if (req.is_multipart_form_data()) {
        if (req.form.has_file(name)) {
            const auto file = req.form.get_file(name);
            out = audio_source::from_upload(file.filename, file.content);
            return true;
        }
        if (req.form.has_field(name + "_url")) {
            out = audio_source::from_url(req.form.get_field(name + "_url"));
            return true;
        }
        if (req.form.has_field(name + "_path")) {
            out = audio_source::from_path(req.form.get_field(name + "_path"));
            return true;
        }
        err.set(SPKV_ERR_INVALID_SOURCE, "missing audio input '" + name + "' (file, " + name + "_url or " + name + "_path)");
        return false;
    }

    try {
        std::string v;
        if (get_json_string(body, (name + "_url").c_str(), v)) {
            out = audio_source::from_url(v);
            return true;
        }
        if (get_json_string(body, (name + "_path").c_str(), v)) {
            out = audio_source::from_path(v);
            return true;
        }
        auto it = body.find(name);
        if (it != body.end() && !it->is_null()) {
            std::string perr;
            if (!parse_source_json(*it, out, perr)) {
                err.set(SPKV_ERR_INVALID_SOURCE, name + ": " + perr);
                return false;
            }
            return true;
        }
    } catch (const std::exception & e) {
        err.set(SPKV_ERR_INVALID_SOURCE, e.what());
        return false;
    }

    err.set(SPKV_ERR_INVALID_SOURCE, "missing audio input: provide " + name + "_url or " + name + "_path");
    return false;
}

// Request threshold override, falling back to the configured value.
static bool find_threshold(const httplib::Request & req, const json & body, float & threshold, spkv_error & err) {
    bool found = false;
    if (req.is_multipart_form_data()) {
        if (req.form.has_field("threshold")) {
            const std::string v = req.form.get_field("threshold");
            if (!parse_f32(v.c_str(), threshold)) {
                err.set(SPKV_ERR_INVALID_SOURCE, "invalid threshold: " + v);
                return false;
            }
            found = true;
        }
    } else {
        try {
            found = get_json_number(body, "threshold", threshold);
        } catch (const std::exception & e) {
            err.set(SPKV_ERR_INVALID_SOURCE, e.what());
            return false;
        }
    }
    if (found && (!std::isfinite(threshold) || threshold < -1.0f || threshold > 1.0f)) {
        err.set(SPKV_ERR_INVALID_SOURCE, "threshold must be within [-1, 1]");
        return false;
    }
    return true;
}

static bool parse_embedding(const json & body, const char * key, speaker_embedding & out, spkv_error & err) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_array() || it->empty()) {
        err.set(SPKV_ERR_INVALID_SOURCE, std::string("'") + key + "' must be a non-empty array of numbers");
        return false;
    }
    out.clear();
    out.reserve(it->size());
    for (const auto & v : *it) {
        if (!v.is_number()) {
            err.set(SPKV_ERR_INVALID_SOURCE, std::string("'") + key + "' must contain only numbers");
            return false;
        }
        out.push_back(v.get<float>());
    }
    return true;
}

} // namespace

void configure_server(httplib::Server & server, const server_config & cfg) {
    const size_t n_threads = (size_t) std::max(1, cfg.n_http_threads);
    server.new_task_queue = [n_threads] { return new httplib::ThreadPool(n_threads); };

    // /verify carries two uploads plus form overhead
    server.set_payload_max_length((size_t) cfg.max_upload_bytes() * 2 + 1024 * 1024);
    server.set_default_headers({{"Server", "spkv-server"}});

    server.set_pre_routing_handler([](const httplib::Request & req, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Origin", req.has_header("Origin") ? req.get_header_value("Origin") : "*");
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Credentials", "true");
            res.set_header("Access-Control-Allow-Methods", "GET, POST");
            res.set_header("Access-Control-Allow-Headers", "*");
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.set_error_handler([](const httplib::Request &, httplib::Response & res) {
        if (!res.body.empty()) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        std::string msg = "request failed";
        if (res.status == 404) {
            msg = "endpoint not found";
        } else if (res.status == 413) {
            msg = "request body too large";
        }
        const json j = {
            {"success", false},
            {"error", {
                {"type", res.status == 404 || res.status == 413 ? "invalid_source" : "internal_error"},
                {"message", msg},
                {"code", res.status},
                {"retryable", false},
            }},
        };
        res.set_content(j.dump(), k_json_type);
        return httplib::Server::HandlerResponse::Handled;
    });

    server.set_exception_handler([](const httplib::Request & req, httplib::Response & res, std::exception_ptr ep) {
        spkv_error err;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception & e) {
            err.set(SPKV_ERR_INTERNAL, e.what());
        } catch (...) {
            err.set(SPKV_ERR_INTERNAL, "unknown exception");
        }
        std::fprintf(stderr, "server: unhandled exception path=%s err=%s\n", req.path.c_str(), err.message.c_str());
        send_error(res, err);
    });
}

void register_routes(httplib::Server & server, server_context & ctx) {
    server.Get("/health", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/health", req.remote_addr);
        if (req.has_param("load")) {
            spkv_error load_err;
            // the outcome is visible through the coordinator status below
            if (!ctx.engine->acquire_model(load_err)) {
                std::fprintf(stderr, "server: health-triggered load failed: %s\n", load_err.message.c_str());
            }
        }

        const model_status ms = ctx.models->status();
        const char * status = "starting";
        if (ms.state == MODEL_STATE_READY) {
            status = "healthy";
        } else if (ms.state == MODEL_STATE_FAILED) {
            status = "unhealthy";
        }
        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);

        const json j = {
            {"status", status},
            {"model_loaded", ms.state == MODEL_STATE_READY},
            {"model_state", model_state_to_cstr(ms.state)},
            {"model_id", ms.model_id},
            {"load_attempts", ms.attempts},
            {"last_error", ms.last_error},
            {"device", ctx.cfg.device},
            {"threshold", threshold},
            {"threshold_mode", threshold_mode_to_cstr(mode)},
            {"uptime_sec", ctx.stats->snapshot().uptime_sec},
            {"stats", stats_to_json(ctx.stats->snapshot())},
            {"cache", cache_stats_to_json(ctx.cache->stats())},
            {"temp_files", ctx.janitor->outstanding()},
        };
        scope.set_ok();
        send_json(res, ms.state == MODEL_STATE_FAILED ? 503 : 200, j);
    });

    server.Post("/verify", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/verify", req.remote_addr);
        spkv_error err;
        json body = json::object();
        if (!req.is_multipart_form_data() && !parse_json_body(req, body, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);

        audio_source a;
        audio_source b;
        if (!find_source(req, body, "audio1", a, err) ||
            !find_source(req, body, "audio2", b, err) ||
            !find_threshold(req, body, threshold, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        verification_result r;
        if (!ctx.engine->verify(a, b, threshold, mode, r, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        json j = verification_result_to_json(r, mode);
        j["success"] = true;
        j["processing_time_ms"] = scope.elapsed_ms();
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Post("/verify_batch", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/verify_batch", req.remote_addr);
        spkv_error err;

        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);

        audio_source reference;
        std::vector<audio_source> candidates;
        json body = json::object();

        if (req.is_multipart_form_data()) {
            if (!find_source(req, body, "reference", reference, err) || !find_threshold(req, body, threshold, err)) {
                scope.set_error(err);
                send_error(res, err);
                return;
            }
            for (const auto & file : req.form.get_files("candidates")) {
                candidates.push_back(audio_source::from_upload(file.filename, file.content));
            }
            for (const auto & v : req.form.get_fields("candidates")) {
                candidates.push_back(audio_source::from_string(v));
            }
        } else {
            if (!parse_json_body(req, body, err) || !find_threshold(req, body, threshold, err)) {
                scope.set_error(err);
                send_error(res, err);
                return;
            }
            auto it_ref = body.find("reference");
            auto it_cand = body.find("candidates");
            if (it_ref == body.end() || it_cand == body.end() || !it_cand->is_array()) {
                send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "body requires 'reference' and a 'candidates' array");
                return;
            }
            try {
                std::string perr;
                if (!parse_source_json(*it_ref, reference, perr)) {
                    send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "reference: " + perr);
                    return;
                }
                for (size_t i = 0; i < it_cand->size(); ++i) {
                    audio_source src;
                    if (!parse_source_json((*it_cand)[i], src, perr)) {
                        send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "candidates[" + std::to_string(i) + "]: " + perr);
                        return;
                    }
                    candidates.push_back(std::move(src));
                }
            } catch (const std::exception & e) {
                send_error(res, scope, SPKV_ERR_INVALID_SOURCE, e.what());
                return;
            }
        }

        if (candidates.empty()) {
            send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "at least one candidate is required");
            return;
        }

        std::vector<batch_item> items;
        if (!ctx.engine->verify_batch(reference, candidates, threshold, mode, items, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        json results = json::array();
        size_t n_ok = 0;
        for (const auto & item : items) {
            json r = {
                {"index", item.index},
                {"candidate", item.candidate},
                {"success", item.ok},
            };
            if (item.ok) {
                r["result"] = verification_result_to_json(item.result, mode);
                ++n_ok;
            } else {
                r["error"] = make_error_json(item.error)["error"];
            }
            results.push_back(std::move(r));
        }

        const json j = {
            {"success", true},
            {"reference", reference.describe()},
            {"results", results},
            {"summary", {
                {"total", items.size()},
                {"succeeded", n_ok},
                {"failed", items.size() - n_ok},
            }},
            {"processing_time_ms", scope.elapsed_ms()},
        };
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Post("/extract_embedding", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/extract_embedding", req.remote_addr);
        spkv_error err;
        json body = json::object();
        if (!req.is_multipart_form_data() && !parse_json_body(req, body, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        audio_source src;
        if (!find_source(req, body, "audio", src, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        speaker_embedding emb;
        std::string model_id;
        if (!ctx.engine->extract(src, emb, model_id, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        const json j = {
            {"success", true},
            {"embedding", emb},
            {"dimension", emb.size()},
            {"model_id", model_id},
            {"processing_time_ms", scope.elapsed_ms()},
        };
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Post("/compare_embeddings", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/compare_embeddings", req.remote_addr);
        spkv_error err;
        json body;
        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);

        speaker_embedding e1;
        speaker_embedding e2;
        verification_result r;
        if (!parse_json_body(req, body, err) ||
            !parse_embedding(body, "embedding1", e1, err) ||
            !parse_embedding(body, "embedding2", e2, err) ||
            !find_threshold(req, body, threshold, err) ||
            !compare_embeddings(e1, e2, threshold, mode, r, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        json j = verification_result_to_json(r, mode);
        j["success"] = true;
        scope.set_ok();
        send_json(res, 200, j);
    });

    auto config_json = [&ctx]() {
        json j = server_config_to_json(ctx.cfg);
        const model_config mc = ctx.models->config();
        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);
        j["model_id"] = mc.model_id;
        j["model_path"] = mc.model_path;
        j["threshold"] = threshold;
        j["threshold_mode"] = threshold_mode_to_cstr(mode);
        return j;
    };

    server.Get("/config", [&ctx, config_json](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/config", req.remote_addr);
        json j = config_json();
        j["success"] = true;
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Post("/config", [&ctx, config_json](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/config", req.remote_addr);
        spkv_error err;
        json body;
        if (!parse_json_body(req, body, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }

        float threshold = 0.0f;
        threshold_mode mode = THRESHOLD_STRICT;
        ctx.get_decision(threshold, mode);
        std::string mode_str;
        std::string model_id;
        try {
            get_json_string(body, "threshold_mode", mode_str);
            get_json_string(body, "model_id", model_id);
        } catch (const std::exception & e) {
            send_error(res, scope, SPKV_ERR_INVALID_SOURCE, e.what());
            return;
        }
        if (!find_threshold(req, body, threshold, err)) {
            scope.set_error(err);
            send_error(res, err);
            return;
        }
        if (!mode_str.empty() && !parse_threshold_mode(mode_str.c_str(), mode)) {
            send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "threshold_mode must be 'strict' or 'inclusive'");
            return;
        }

        // a failed load keeps the requested id in the config, so retrying it must load again
        std::string model_path;
        const bool model_change = !model_id.empty() &&
                (model_id != ctx.models->config().model_id || ctx.models->status().state == MODEL_STATE_FAILED);
        if (model_change) {
            model_path = ctx.cfg.model_path_for_id(model_id);
            if (model_path.empty()) {
                send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "unknown model_id: " + model_id);
                return;
            }
        }

        if (model_change) {
            if (!ctx.models->reload(make_model_config(ctx.cfg, model_id, model_path),
                        ctx.cfg.load_attempts, ctx.cfg.backoff_policy_value(), err)) {
                std::fprintf(stderr, "server: config rejected model=%s err=%s\n", model_id.c_str(), err.message.c_str());
                scope.set_error(err);
                send_error(res, err);
                return;
            }
        }

        {
            std::lock_guard<std::mutex> lock(ctx.settings_mtx);
            ctx.threshold = threshold;
            ctx.mode = mode;
        }
        std::fprintf(stderr, "server: config updated threshold=%.3f mode=%s model_change=%s\n",
                threshold, threshold_mode_to_cstr(mode), model_change ? model_id.c_str() : "none");

        json j = config_json();
        j["success"] = true;
        j["reloaded"] = model_change;
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Get("/models", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/models", req.remote_addr);
        const model_status ms = ctx.models->status();
        const std::string current = ctx.models->config().model_id;
        json models = json::array();
        for (const auto & m : ctx.cfg.model_files) {
            models.push_back({
                {"id", m.id},
                {"path", m.path},
                {"active", m.id == current},
                {"loaded", m.id == current && ms.state == MODEL_STATE_READY},
            });
        }
        const json j = {
            {"success", true},
            {"current", current},
            {"models", models},
        };
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Get("/stats", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/stats", req.remote_addr);
        int32_t limit = 50;
        if (req.has_param("limit")) {
            const std::string v = req.get_param_value("limit");
            if (!parse_i32(v.c_str(), limit) || limit < 0) {
                send_error(res, scope, SPKV_ERR_INVALID_SOURCE, "invalid limit: " + v);
                return;
            }
        }

        json recent = json::array();
        for (const auto & rec : ctx.stats->recent((size_t) limit)) {
            recent.push_back({
                {"timestamp_ms", rec.timestamp_ms},
                {"endpoint", rec.endpoint},
                {"duration_ms", rec.duration_ms},
                {"success", rec.success},
                {"error", rec.success ? json(nullptr) : json(rec.error)},
                {"client", rec.client},
            });
        }

        const json j = {
            {"success", true},
            {"stats", stats_to_json(ctx.stats->snapshot())},
            {"cache", cache_stats_to_json(ctx.cache->stats())},
            {"temp_files", ctx.janitor->outstanding()},
            {"recent", recent},
        };
        scope.set_ok();
        send_json(res, 200, j);
    });

    server.Post("/cache/clear", [&](const httplib::Request & req, httplib::Response & res) {
        request_scope scope(*ctx.stats, "/cache/clear", req.remote_addr);
        const size_t removed = ctx.cache->clear();
        const json j = {
            {"success", true},
            {"removed", removed},
            {"cache", cache_stats_to_json(ctx.cache->stats())},
        };
        scope.set_ok();
        send_json(res, 200, j);
    });
}
