#include "audio-source.h"

#include "test-utils.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

using spkv_test::temp_dir;

class audio_source_test : public ::testing::Test {
protected:
    void SetUp() override {
        janitor = std::make_unique<temp_janitor>(scratch.path());
        std::string err;
        ASSERT_TRUE(janitor->init(0, err)) << err;

        content_cache_config cc;
        cc.dir = cache_dir.path();
        cache = std::make_unique<content_cache>(cc, [this](const std::string & url, const std::string & dest, spkv_error & err) {
            ++fetches;
            if (url.find("missing") != std::string::npos) {
                err.set(SPKV_ERR_DOWNLOAD_FAILED, "HTTP 404 for " + url);
                return false;
            }
            std::string io_err;
            if (!save_binary_file(dest, tone_bytes, io_err)) {
                err.set(SPKV_ERR_INTERNAL, io_err);
                return false;
            }
            return true;
        });
        ASSERT_TRUE(cache->init(err)) << err;

        ASSERT_TRUE(spkv_test::write_tone_wav(files.file("tone.wav"), 220.0f, 1.0f));
        ASSERT_TRUE(spkv_test::write_tone_wav(files.file("short.wav"), 220.0f, 0.2f));
        tone_bytes = spkv_test::read_file(files.file("tone.wav"));
        ASSERT_FALSE(tone_bytes.empty());
    }

    audio_source_resolver make_resolver(resolver_config rc = resolver_config()) {
        return audio_source_resolver(rc, *cache, *janitor);
    }

    temp_dir scratch;
    temp_dir cache_dir;
    temp_dir files;
    std::unique_ptr<temp_janitor> janitor;
    std::unique_ptr<content_cache> cache;
    std::string tone_bytes;
    int fetches = 0;
};

TEST(audio_source, from_string_classifies) {
    EXPECT_EQ(audio_source::from_string("https://x/a.wav").kind, AUDIO_SOURCE_URL);
    EXPECT_EQ(audio_source::from_string("HTTP://x/a.wav").kind, AUDIO_SOURCE_URL);
    EXPECT_EQ(audio_source::from_string("/data/a.wav").kind, AUDIO_SOURCE_PATH);
    EXPECT_EQ(audio_source::from_upload("a.wav", "x").describe(), "a.wav");
}

TEST(temp_janitor, unique_paths_and_stale_sweep) {
    temp_dir dir;
    temp_janitor j(dir.path());
    std::string err;
    ASSERT_TRUE(j.init(3600, err));

    const std::string a = j.make_path("wav");
    const std::string b = j.make_path("wav");
    EXPECT_NE(a, b);
    EXPECT_EQ(std::filesystem::path(a).extension().string(), ".wav");
    EXPECT_EQ(std::filesystem::path(a).parent_path().string(), dir.path());

    std::string ignored;
    ASSERT_TRUE(save_binary_file(a, "leftover", ignored));
    ASSERT_TRUE(save_binary_file(dir.file("unrelated.txt"), "keep", ignored));
    EXPECT_EQ(j.sweep_stale(3600), 0u);
    EXPECT_EQ(j.sweep_stale(0), 1u);
    EXPECT_FALSE(std::filesystem::exists(a));
    EXPECT_TRUE(std::filesystem::exists(dir.file("unrelated.txt")));
}

TEST(temp_janitor, scoped_file_removed_on_scope_exit) {
    temp_dir dir;
    temp_janitor j(dir.path());
    std::string err;
    ASSERT_TRUE(j.init(0, err));

    std::string path;
    {
        scoped_temp_file f(&j, j.make_path("wav"));
        path = f.path();
        ASSERT_TRUE(save_binary_file(path, "data", err));
        EXPECT_EQ(j.outstanding(), 1u);

        scoped_temp_file moved(std::move(f));
        EXPECT_FALSE(f.active());
        EXPECT_TRUE(moved.active());
        EXPECT_EQ(j.outstanding(), 1u);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(j.outstanding(), 0u);
}

TEST_F(audio_source_test, upload_is_removed_after_use) {
    auto resolver = make_resolver();
    {
        resolved_audio audio;
        spkv_error err;
        ASSERT_TRUE(resolver.resolve(audio_source::from_upload("voice.WAV", tone_bytes), audio, err)) << err.message;
        EXPECT_TRUE(audio.owned());
        EXPECT_TRUE(std::filesystem::exists(audio.path()));
        EXPECT_EQ(janitor->outstanding(), 1u);
    }
    EXPECT_EQ(spkv_test::count_files_in(scratch.path()), 0u);
    EXPECT_EQ(janitor->outstanding(), 0u);
}

TEST_F(audio_source_test, failed_upload_validation_leaves_nothing) {
    auto resolver = make_resolver();
    resolved_audio audio;
    spkv_error err;
    EXPECT_FALSE(resolver.resolve(audio_source::from_upload("voice.wav", "this is not audio"), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_VALIDATION_FAILED);
    EXPECT_EQ(spkv_test::count_files_in(scratch.path()), 0u);
    EXPECT_EQ(janitor->outstanding(), 0u);
}

TEST_F(audio_source_test, rejects_bad_upload_metadata) {
    resolver_config rc;
    rc.max_upload_bytes = 16;
    auto resolver = make_resolver(rc);
    resolved_audio audio;
    spkv_error err;

    EXPECT_FALSE(resolver.resolve(audio_source::from_upload("voice.ogg", tone_bytes), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);

    EXPECT_FALSE(resolver.resolve(audio_source::from_upload("voice.wav", ""), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);

    EXPECT_FALSE(resolver.resolve(audio_source::from_upload("voice.wav", tone_bytes), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);
    EXPECT_EQ(spkv_test::count_files_in(scratch.path()), 0u);
}

TEST_F(audio_source_test, duration_bounds) {
    auto resolver = make_resolver();
    resolved_audio audio;
    spkv_error err;
    EXPECT_FALSE(resolver.resolve(audio_source::from_path(files.file("short.wav")), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_VALIDATION_FAILED);

    resolver_config rc;
    rc.max_duration_sec = 0.5;
    auto strict = make_resolver(rc);
    EXPECT_FALSE(strict.resolve(audio_source::from_path(files.file("tone.wav")), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_VALIDATION_FAILED);
}

TEST_F(audio_source_test, local_paths) {
    auto resolver = make_resolver();
    resolved_audio audio;
    spkv_error err;
    ASSERT_TRUE(resolver.resolve(audio_source::from_path(files.file("tone.wav")), audio, err)) << err.message;
    EXPECT_FALSE(audio.owned());
    audio.reset();
    // caller-owned files are never deleted
    EXPECT_TRUE(std::filesystem::exists(files.file("tone.wav")));

    EXPECT_FALSE(resolver.resolve(audio_source::from_path(files.file("nope.wav")), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);

    resolver_config rc;
    rc.allow_local_paths = false;
    auto locked = make_resolver(rc);
    EXPECT_FALSE(locked.resolve(audio_source::from_path(files.file("tone.wav")), audio, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);
}

TEST_F(audio_source_test, urls_go_through_cache) {
    auto resolver = make_resolver();
    spkv_error err;
    {
        resolved_audio audio;
        ASSERT_TRUE(resolver.resolve(audio_source::from_url("http://example.com/a.wav"), audio, err)) << err.message;
        EXPECT_FALSE(audio.owned());
        EXPECT_EQ(cache->stats().pinned, 1u);
    }
    EXPECT_EQ(cache->stats().pinned, 0u);

    resolved_audio again;
    ASSERT_TRUE(resolver.resolve(audio_source::from_url("http://example.com/a.wav"), again, err));
    EXPECT_EQ(fetches, 1);

    resolved_audio bad;
    EXPECT_FALSE(resolver.resolve(audio_source::from_url("ftp://example.com/a.wav"), bad, err));
    EXPECT_EQ(err.kind, SPKV_ERR_INVALID_SOURCE);

    EXPECT_FALSE(resolver.resolve(audio_source::from_url("http://example.com/missing.wav"), bad, err));
    EXPECT_EQ(err.kind, SPKV_ERR_DOWNLOAD_FAILED);
    EXPECT_TRUE(spkv_error_is_retryable(err.kind));
}
