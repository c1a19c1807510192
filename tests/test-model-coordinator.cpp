#include "model-coordinator.h"

#include "test-utils.h"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using spkv_test::fake_extractor;

namespace {

struct recorded_sleeps {
    std::mutex mtx;
    std::vector<std::chrono::milliseconds> waits;

    sleep_fn fn() {
        return [this](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lock(mtx);
            waits.push_back(d);
        };
    }
};

model_config test_config(const std::string & id = "m1") {
    model_config cfg;
    cfg.model_id = id;
    cfg.model_path = "/models/" + id + ".gguf";
    return cfg;
}

} // namespace

TEST(backoff_policy, exponential_doubles_and_caps) {
    backoff_policy p;
    p.kind = BACKOFF_EXPONENTIAL;
    p.base = std::chrono::milliseconds(100);
    p.max = std::chrono::milliseconds(1000);
    EXPECT_EQ(p.delay(1).count(), 100);
    EXPECT_EQ(p.delay(2).count(), 200);
    EXPECT_EQ(p.delay(3).count(), 400);
    EXPECT_EQ(p.delay(5).count(), 1000);
    EXPECT_EQ(p.delay(200).count(), 1000);
}

TEST(backoff_policy, linear_is_monotonic) {
    backoff_policy p;
    p.kind = BACKOFF_LINEAR;
    p.base = std::chrono::milliseconds(250);
    p.max = std::chrono::milliseconds(1000);
    int64_t prev = 0;
    for (int i = 1; i < 10; ++i) {
        const int64_t d = p.delay(i).count();
        EXPECT_GE(d, prev);
        EXPECT_LE(d, 1000);
        prev = d;
    }
    EXPECT_EQ(p.delay(2).count(), 500);
}

TEST(backoff_kind, parse) {
    backoff_kind k = BACKOFF_EXPONENTIAL;
    EXPECT_TRUE(parse_backoff_kind("linear", k));
    EXPECT_EQ(k, BACKOFF_LINEAR);
    EXPECT_FALSE(parse_backoff_kind("fibonacci", k));
}

TEST(model_coordinator, concurrent_callers_share_one_load) {
    std::atomic<int> loads {0};
    auto model = std::make_shared<fake_extractor>();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error &) -> model_handle {
        loads.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return model;
    });

    constexpr int n_callers = 16;
    std::vector<std::thread> threads;
    std::vector<model_handle> got(n_callers);
    for (int i = 0; i < n_callers; ++i) {
        threads.emplace_back([&, i]() {
            spkv_error err;
            got[(size_t) i] = coord.ensure_ready(3, backoff_policy(), err);
        });
    }
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(loads.load(), 1);
    for (const auto & h : got) {
        EXPECT_EQ(h.get(), model.get());
    }
    const model_status s = coord.status();
    EXPECT_EQ(s.state, MODEL_STATE_READY);
    EXPECT_EQ(s.load_count, 1u);
}

TEST(model_coordinator, retries_with_increasing_waits) {
    recorded_sleeps sleeps;
    int calls = 0;
    auto model = std::make_shared<fake_extractor>();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error & err) -> model_handle {
        if (++calls < 3) {
            err.set(SPKV_ERR_MODEL_UNAVAILABLE, "not yet");
            return nullptr;
        }
        return model;
    }, sleeps.fn());

    spkv_error err;
    model_handle h = coord.ensure_ready(5, backoff_policy(), err);
    ASSERT_TRUE(h);
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps.waits.size(), 2u);
    EXPECT_LT(sleeps.waits[0], sleeps.waits[1]);
    EXPECT_EQ(coord.status().attempts, 3);
}

TEST(model_coordinator, exhaustion_fails_then_later_call_retries) {
    recorded_sleeps sleeps;
    bool available = false;
    int calls = 0;
    auto model = std::make_shared<fake_extractor>();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error & err) -> model_handle {
        ++calls;
        if (!available) {
            err.set(SPKV_ERR_MODEL_UNAVAILABLE, "weights missing");
            return nullptr;
        }
        return model;
    }, sleeps.fn());

    spkv_error err;
    EXPECT_FALSE(coord.ensure_ready(3, backoff_policy(), err));
    EXPECT_EQ(err.kind, SPKV_ERR_MODEL_UNAVAILABLE);
    EXPECT_NE(err.message.find("weights missing"), std::string::npos);
    EXPECT_EQ(calls, 3);

    model_status s = coord.status();
    EXPECT_EQ(s.state, MODEL_STATE_FAILED);
    EXPECT_EQ(s.attempts, 3);
    EXPECT_EQ(s.last_error, "weights missing");
    EXPECT_FALSE(coord.current());

    available = true;
    err.clear();
    EXPECT_TRUE(coord.ensure_ready(3, backoff_policy(), err));
    EXPECT_EQ(coord.status().state, MODEL_STATE_READY);
}

TEST(model_coordinator, loader_exception_is_a_failed_attempt) {
    model_coordinator coord(test_config(), [](const model_config &, spkv_error &) -> model_handle {
        throw std::runtime_error("corrupt file");
    }, [](std::chrono::milliseconds) {});

    spkv_error err;
    EXPECT_FALSE(coord.ensure_ready(2, backoff_policy(), err));
    EXPECT_EQ(err.kind, SPKV_ERR_MODEL_UNAVAILABLE);
    EXPECT_NE(coord.status().last_error.find("corrupt file"), std::string::npos);
}

TEST(model_coordinator, non_standard_exception_does_not_wedge_waiters) {
    int calls = 0;
    auto model = std::make_shared<fake_extractor>();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error &) -> model_handle {
        if (++calls == 1) {
            throw 42;
        }
        return model;
    }, [](std::chrono::milliseconds) {});

    spkv_error err;
    EXPECT_FALSE(coord.ensure_ready(1, backoff_policy(), err));
    EXPECT_EQ(err.kind, SPKV_ERR_MODEL_UNAVAILABLE);
    EXPECT_EQ(coord.status().state, MODEL_STATE_FAILED);

    err.clear();
    EXPECT_TRUE(coord.ensure_ready(1, backoff_policy(), err));
    EXPECT_EQ(calls, 2);
}

TEST(model_coordinator, concurrent_callers_share_one_failure) {
    constexpr int n_callers = 12;
    std::atomic<int> loads {0};
    std::atomic<int> started {0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error & err) -> model_handle {
        loads.fetch_add(1);
        released.wait();
        err.set(SPKV_ERR_MODEL_UNAVAILABLE, "weights missing");
        return nullptr;
    }, [](std::chrono::milliseconds) {});

    std::vector<std::thread> threads;
    std::vector<spkv_error> errors(n_callers);
    std::vector<model_handle> got(n_callers);
    for (int i = 0; i < n_callers; ++i) {
        threads.emplace_back([&, i]() {
            started.fetch_add(1);
            got[(size_t) i] = coord.ensure_ready(1, backoff_policy(), errors[(size_t) i]);
        });
    }
    while (started.load() < n_callers || loads.load() == 0) {
        std::this_thread::yield();
    }
    // give the other callers time to block on the load in flight
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    release.set_value();
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(loads.load(), 1);
    for (int i = 0; i < n_callers; ++i) {
        EXPECT_FALSE(got[(size_t) i]);
        EXPECT_EQ(errors[(size_t) i].kind, SPKV_ERR_MODEL_UNAVAILABLE);
        EXPECT_EQ(errors[(size_t) i].message, errors[0].message);
    }
    const model_status s = coord.status();
    EXPECT_EQ(s.state, MODEL_STATE_FAILED);
    EXPECT_EQ(s.load_count, 1u);
}

TEST(model_coordinator, reload_during_load_discards_stale_result) {
    auto m1 = std::make_shared<fake_extractor>(16, "m1");
    auto m2 = std::make_shared<fake_extractor>(32, "m2");
    std::atomic<int> m1_loads {0};
    std::atomic<int> m2_loads {0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    model_coordinator coord(test_config("m1"), [&](const model_config & cfg, spkv_error &) -> model_handle {
        if (cfg.model_id == "m1") {
            m1_loads.fetch_add(1);
            released.wait();
            return m1;
        }
        m2_loads.fetch_add(1);
        return m2;
    });

    model_handle first;
    std::thread loader_thread([&]() {
        spkv_error err;
        first = coord.ensure_ready(1, backoff_policy(), err);
    });
    while (m1_loads.load() == 0) {
        std::this_thread::yield();
    }

    bool reloaded = false;
    std::thread reload_thread([&]() {
        spkv_error err;
        reloaded = coord.reload(test_config("m2"), 1, backoff_policy(), err);
    });
    while (coord.config().model_id != "m2") {
        std::this_thread::yield();
    }
    release.set_value();
    loader_thread.join();
    reload_thread.join();

    EXPECT_TRUE(reloaded);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->model_id(), "m2");
    ASSERT_TRUE(coord.current());
    EXPECT_EQ(coord.current()->model_id(), "m2");
    EXPECT_EQ(m1_loads.load(), 1);
    EXPECT_EQ(m2_loads.load(), 1);

    const model_status s = coord.status();
    EXPECT_EQ(s.state, MODEL_STATE_READY);
    EXPECT_EQ(s.generation, 1u);
    EXPECT_EQ(s.load_count, 2u);
}

TEST(model_coordinator, reload_switches_config_and_keeps_old_handles) {
    auto m1 = std::make_shared<fake_extractor>(16, "m1");
    auto m2 = std::make_shared<fake_extractor>(32, "m2");
    model_coordinator coord(test_config("m1"), [&](const model_config & cfg, spkv_error &) -> model_handle {
        if (cfg.model_id == "m1") {
            return m1;
        }
        return m2;
    });

    spkv_error err;
    model_handle first = coord.ensure_ready(1, backoff_policy(), err);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->model_id(), "m1");

    ASSERT_TRUE(coord.reload(test_config("m2"), 1, backoff_policy(), err));
    model_handle second = coord.current();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->model_id(), "m2");
    EXPECT_EQ(second->embedding_dim(), 32);

    // the handle given out before the reload is still usable
    EXPECT_EQ(first->embedding_dim(), 16);
    const model_status s = coord.status();
    EXPECT_EQ(s.generation, 1u);
    EXPECT_EQ(s.load_count, 2u);
    EXPECT_EQ(coord.config().model_id, "m2");
}

TEST(model_coordinator, shutdown_drops_handle) {
    auto model = std::make_shared<fake_extractor>();
    model_coordinator coord(test_config(), [&](const model_config &, spkv_error &) -> model_handle { return model; });
    spkv_error err;
    ASSERT_TRUE(coord.ensure_ready(1, backoff_policy(), err));
    coord.shutdown();
    EXPECT_FALSE(coord.current());
    EXPECT_EQ(coord.status().state, MODEL_STATE_UNLOADED);
}
