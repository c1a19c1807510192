#include "request-stats.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace {

request_record make_record(const std::string & endpoint, bool ok, double ms) {
    request_record rec;
    rec.endpoint = endpoint;
    rec.success = ok;
    rec.duration_ms = ms;
    return rec;
}

} // namespace

TEST(request_stats, counters_and_rates) {
    request_stats stats(8);
    stats.record(make_record("/verify", true, 10.0));
    stats.record(make_record("/verify", true, 20.0));
    stats.record(make_record("/verify", false, 30.0));
    stats.record(true, 40.0);

    const request_stats_snapshot s = stats.snapshot();
    EXPECT_EQ(s.total, 4u);
    EXPECT_EQ(s.success, 3u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_DOUBLE_EQ(s.success_rate, 0.75);
    EXPECT_NEAR(s.avg_duration_ms, 25.0, 1e-6);
    EXPECT_EQ(s.total, s.success + s.failed);
}

TEST(request_stats, empty_snapshot) {
    request_stats stats;
    const request_stats_snapshot s = stats.snapshot();
    EXPECT_EQ(s.total, 0u);
    EXPECT_DOUBLE_EQ(s.success_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.avg_duration_ms, 0.0);
    EXPECT_TRUE(stats.recent(10).empty());
}

TEST(request_stats, ring_keeps_newest_last) {
    request_stats stats(3);
    for (int i = 0; i < 5; ++i) {
        stats.record(make_record("/e" + std::to_string(i), true, 1.0));
    }
    const auto recent = stats.recent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].endpoint, "/e2");
    EXPECT_EQ(recent[1].endpoint, "/e3");
    EXPECT_EQ(recent[2].endpoint, "/e4");

    const auto last = stats.recent(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].endpoint, "/e4");
    EXPECT_EQ(stats.snapshot().total, 5u);
}

TEST(request_stats, concurrent_records_are_all_counted) {
    request_stats stats(64);
    constexpr int n_threads = 8;
    constexpr int per_thread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < n_threads; ++t) {
        threads.emplace_back([&stats, t]() {
            for (int i = 0; i < per_thread; ++i) {
                stats.record(make_record("/t", (i + t) % 2 == 0, 1.0));
            }
        });
    }
    for (auto & th : threads) {
        th.join();
    }
    const request_stats_snapshot s = stats.snapshot();
    EXPECT_EQ(s.total, (uint64_t) n_threads * per_thread);
    EXPECT_EQ(s.success + s.failed, s.total);
    EXPECT_LE(stats.recent(1000).size(), 64u);
}

TEST(request_scope, records_failure_unless_marked_ok) {
    request_stats stats;
    {
        request_scope scope(stats, "/verify", "127.0.0.1");
        EXPECT_EQ(stats.snapshot().inflight, 1);
    }
    {
        request_scope scope(stats, "/verify", "127.0.0.1");
        spkv_error err;
        err.set(SPKV_ERR_TIMEOUT, "slow");
        scope.set_error(err);
    }
    {
        request_scope scope(stats, "/health", "127.0.0.1");
        scope.set_ok();
    }

    const request_stats_snapshot s = stats.snapshot();
    EXPECT_EQ(s.inflight, 0);
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.success, 1u);

    const auto recent = stats.recent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].error, "unfinished");
    EXPECT_EQ(recent[1].error, "timeout");
    EXPECT_TRUE(recent[2].success);
    EXPECT_EQ(recent[2].endpoint, "/health");
    EXPECT_EQ(recent[2].client, "127.0.0.1");
}
