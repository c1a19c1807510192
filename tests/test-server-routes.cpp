#include "server-context.h"
#include "server-routes.h"

#include "test-utils.h"

#include <httplib.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>

using spkv_test::fake_extractor;
using spkv_test::temp_dir;

class server_routes_test : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(spkv_test::write_tone_wav(files.file("a.wav"), 220.0f, 1.0f));
        ASSERT_TRUE(spkv_test::write_tone_wav(files.file("b.wav"), 440.0f, 1.0f));
        wav_a = spkv_test::read_file(files.file("a.wav"));
        wav_b = spkv_test::read_file(files.file("b.wav"));

        server_config cfg;
        cfg.model_path = "/models/fake.gguf";
        cfg.model_id = "fake-model";
        cfg.model_files = {
            {"fake-model", "/models/fake.gguf"},
            {"other-model", "/models/other.gguf"},
            {"flaky-model", "/models/flaky.gguf"},
        };
        cfg.cache_dir = cache.path();
        cfg.n_http_threads = 4;
        std::string err;
        ASSERT_TRUE(finalize_config(cfg, err)) << err;

        extractor = std::make_shared<fake_extractor>(16, "fake-model");
        other = std::make_shared<fake_extractor>(8, "other-model");
        auto ex = extractor;
        auto ot = other;
        auto flaky = flaky_available;
        model_loader loader = [ex, ot, flaky](const model_config & mc, spkv_error & e) -> model_handle {
            if (mc.model_id == "flaky-model") {
                if (!flaky->load()) {
                    e.set(SPKV_ERR_MODEL_UNAVAILABLE, "weights not found");
                    return nullptr;
                }
                return ot;
            }
            if (mc.model_id == "other-model") {
                return ot;
            }
            return ex;
        };
        const std::string body = wav_b;
        url_fetcher fetcher = [body](const std::string & url, const std::string & dest, spkv_error & e) {
            if (url.find("missing") != std::string::npos) {
                e.set(SPKV_ERR_DOWNLOAD_FAILED, "HTTP 404 for " + url);
                return false;
            }
            std::string io_err;
            return save_binary_file(dest, body, io_err);
        };
        ASSERT_TRUE(init_server_context(ctx, cfg, loader, fetcher, [](std::chrono::milliseconds) {}, err)) << err;

        configure_server(server, ctx.cfg);
        register_routes(server, ctx);
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        listener = std::thread([this]() { server.listen_after_bind(); });
        server.wait_until_ready();

        client = std::make_unique<httplib::Client>("127.0.0.1", port);
        client->set_read_timeout(30, 0);
    }

    void TearDown() override {
        server.stop();
        if (listener.joinable()) {
            listener.join();
        }
        ctx.models->shutdown();
    }

    json post_json(const std::string & path, const json & body, int expect_status) {
        auto res = client->Post(path, body.dump(), "application/json");
        EXPECT_TRUE(res);
        if (!res) {
            return json();
        }
        EXPECT_EQ(res->status, expect_status) << res->body;
        return json::parse(res->body);
    }

    json get_json(const std::string & path, int expect_status = 200) {
        auto res = client->Get(path);
        EXPECT_TRUE(res);
        if (!res) {
            return json();
        }
        EXPECT_EQ(res->status, expect_status) << res->body;
        return json::parse(res->body);
    }

    temp_dir files;
    temp_dir cache;
    std::string wav_a;
    std::string wav_b;
    std::shared_ptr<fake_extractor> extractor;
    std::shared_ptr<fake_extractor> other;
    std::shared_ptr<std::atomic<bool>> flaky_available = std::make_shared<std::atomic<bool>>(false);

    server_context ctx;
    httplib::Server server;
    std::thread listener;
    int port = 0;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(server_routes_test, health_reports_lazy_state_then_ready) {
    json j = get_json("/health");
    EXPECT_EQ(j["status"], "starting");
    EXPECT_EQ(j["model_loaded"], false);

    j = get_json("/health?load=1");
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_EQ(j["model_loaded"], true);
    EXPECT_EQ(j["model_id"], "fake-model");
}

TEST_F(server_routes_test, verify_json_paths) {
    json j = post_json("/verify", {
        {"audio1_path", files.file("a.wav")},
        {"audio2_path", files.file("a.wav")},
    }, 200);
    EXPECT_EQ(j["success"], true);
    EXPECT_NEAR(j["score"].get<double>(), 1.0, 1e-5);
    EXPECT_EQ(j["is_same_speaker"], true);
    EXPECT_EQ(j["confidence"], "high");
    EXPECT_EQ(j["threshold_mode"], "strict");
}

TEST_F(server_routes_test, verify_multipart_uploads_leave_no_files) {
    httplib::UploadFormDataItems items = {
        {"audio1", wav_a, "a.wav", "audio/wav"},
        {"audio2", wav_b, "b.wav", "audio/wav"},
        {"threshold", "0.99", "", ""},
    };
    auto res = client->Post("/verify", items);
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    const json j = json::parse(res->body);
    EXPECT_FLOAT_EQ(j["threshold"].get<float>(), 0.99f);
    EXPECT_EQ(j["is_same_speaker"], false);

    EXPECT_EQ(spkv_test::count_files_in(ctx.cfg.scratch_dir), 0u);
    EXPECT_EQ(ctx.janitor->outstanding(), 0u);
}

TEST_F(server_routes_test, verify_errors_use_taxonomy) {
    json j = post_json("/verify", {{"audio1_path", files.file("a.wav")}}, 400);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error"]["type"], "invalid_source");
    EXPECT_EQ(j["error"]["code"], 400);
    EXPECT_EQ(j["error"]["retryable"], false);

    j = post_json("/verify", {
        {"audio1_url", "http://example.com/missing.wav"},
        {"audio2_path", files.file("a.wav")},
    }, 502);
    EXPECT_EQ(j["error"]["type"], "download_failed");
    EXPECT_EQ(j["error"]["retryable"], true);

    httplib::UploadFormDataItems items = {
        {"audio1", "garbage bytes", "a.wav", "audio/wav"},
        {"audio2", wav_b, "b.wav", "audio/wav"},
    };
    auto res = client->Post("/verify", items);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 422);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], "validation_failed");
    EXPECT_EQ(spkv_test::count_files_in(ctx.cfg.scratch_dir), 0u);

    auto bad = client->Post("/verify", "{not json", "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
}

TEST_F(server_routes_test, verify_batch_keeps_order_and_item_errors) {
    const json j = post_json("/verify_batch", {
        {"reference", files.file("a.wav")},
        {"candidates", {
            files.file("a.wav"),
            files.file("does-not-exist.wav"),
            "http://example.com/b.wav",
        }},
    }, 200);
    ASSERT_EQ(j["results"].size(), 3u);
    EXPECT_EQ(j["results"][0]["success"], true);
    EXPECT_EQ(j["results"][0]["result"]["is_same_speaker"], true);
    EXPECT_EQ(j["results"][1]["success"], false);
    EXPECT_EQ(j["results"][1]["error"]["type"], "invalid_source");
    EXPECT_EQ(j["results"][2]["success"], true);
    EXPECT_EQ(j["results"][2]["index"], 2);
    EXPECT_EQ(j["summary"]["succeeded"], 2);
    EXPECT_EQ(j["summary"]["failed"], 1);
}

TEST_F(server_routes_test, verify_batch_multipart) {
    httplib::UploadFormDataItems items = {
        {"reference", wav_a, "ref.wav", "audio/wav"},
        {"candidates", wav_a, "c0.wav", "audio/wav"},
        {"candidates", wav_b, "c1.wav", "audio/wav"},
    };
    auto res = client->Post("/verify_batch", items);
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    const json j = json::parse(res->body);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["result"]["is_same_speaker"], true);
    EXPECT_EQ(spkv_test::count_files_in(ctx.cfg.scratch_dir), 0u);
}

TEST_F(server_routes_test, verify_batch_requires_candidates) {
    const json j = post_json("/verify_batch", {{"reference", files.file("a.wav")}, {"candidates", json::array()}}, 400);
    EXPECT_EQ(j["error"]["type"], "invalid_source");
}

TEST_F(server_routes_test, extract_embedding_from_url_uses_cache) {
    json j = post_json("/extract_embedding", {{"audio_url", "http://example.com/b.wav"}}, 200);
    EXPECT_EQ(j["dimension"], 16);
    EXPECT_EQ(j["embedding"].size(), 16u);
    EXPECT_EQ(j["model_id"], "fake-model");

    post_json("/extract_embedding", {{"audio_url", "http://example.com/b.wav"}}, 200);
    EXPECT_EQ(ctx.cache->stats().hits, 1u);
    EXPECT_EQ(ctx.cache->stats().pinned, 0u);
}

TEST_F(server_routes_test, compare_embeddings_endpoint) {
    json j = post_json("/compare_embeddings", {
        {"embedding1", {1.0, 0.0}},
        {"embedding2", {0.0, 1.0}},
    }, 200);
    EXPECT_NEAR(j["score"].get<double>(), 0.0, 1e-6);
    EXPECT_EQ(j["is_same_speaker"], false);
    EXPECT_EQ(j["confidence"], "high");

    j = post_json("/compare_embeddings", {{"embedding1", {1.0, 0.0}}, {"embedding2", {1.0, 0.0, 0.0}}}, 400);
    EXPECT_EQ(j["error"]["type"], "invalid_source");
}

TEST_F(server_routes_test, config_update_and_model_switch) {
    json j = post_json("/config", {{"threshold", 0.8}, {"threshold_mode", "inclusive"}}, 200);
    EXPECT_FLOAT_EQ(j["threshold"].get<float>(), 0.8f);
    EXPECT_EQ(j["threshold_mode"], "inclusive");

    j = get_json("/config");
    EXPECT_FLOAT_EQ(j["threshold"].get<float>(), 0.8f);

    j = post_json("/config", {{"threshold", 3.0}}, 400);
    EXPECT_EQ(j["error"]["type"], "invalid_source");
    j = post_json("/config", {{"model_id", "nope"}}, 400);

    j = post_json("/config", {{"model_id", "other-model"}}, 200);
    EXPECT_EQ(j["reloaded"], true);
    EXPECT_EQ(j["model_id"], "other-model");

    j = post_json("/extract_embedding", {{"audio_path", files.file("a.wav")}}, 200);
    EXPECT_EQ(j["dimension"], 8);

    j = get_json("/models");
    EXPECT_EQ(j["current"], "other-model");
    EXPECT_EQ(j["models"].size(), 3u);
}

TEST_F(server_routes_test, failed_model_switch_keeps_decision_settings) {
    json j = get_json("/health?load=1");
    EXPECT_EQ(j["model_loaded"], true);
    j = get_json("/config");
    const float threshold_before = j["threshold"].get<float>();
    const std::string mode_before = j["threshold_mode"].get<std::string>();

    j = post_json("/config", {{"threshold", 0.9}, {"threshold_mode", "inclusive"}, {"model_id", "flaky-model"}}, 503);
    EXPECT_EQ(j["error"]["type"], "model_unavailable");

    j = get_json("/config");
    EXPECT_FLOAT_EQ(j["threshold"].get<float>(), threshold_before);
    EXPECT_EQ(j["threshold_mode"], mode_before);

    // asking for the same id again must retry the load, not report it as current
    flaky_available->store(true);
    j = post_json("/config", {{"threshold", 0.9}, {"model_id", "flaky-model"}}, 200);
    EXPECT_EQ(j["reloaded"], true);
    EXPECT_FLOAT_EQ(j["threshold"].get<float>(), 0.9f);

    j = get_json("/health");
    EXPECT_EQ(j["model_loaded"], true);
}

TEST_F(server_routes_test, stats_and_cache_clear) {
    post_json("/extract_embedding", {{"audio_url", "http://example.com/b.wav"}}, 200);
    post_json("/verify", {{"audio1_path", files.file("a.wav")}}, 400);

    json j = get_json("/stats?limit=10");
    EXPECT_GE(j["stats"]["total_requests"].get<int>(), 2);
    EXPECT_GE(j["stats"]["failed_requests"].get<int>(), 1);
    ASSERT_GE(j["recent"].size(), 2u);
    EXPECT_EQ(j["recent"].back()["endpoint"], "/verify");
    EXPECT_EQ(j["cache"]["entries"], 1);

    auto res = client->Post("/cache/clear");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["removed"], 1);
    EXPECT_EQ(ctx.cache->stats().entries, 0u);
}

TEST_F(server_routes_test, unknown_endpoint_is_json_404) {
    auto res = client->Get("/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    const json j = json::parse(res->body);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error"]["code"], 404);
}
