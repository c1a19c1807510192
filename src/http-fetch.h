#pragma once

#include "spkv-error.h"

#include <cstdint>
#include <functional>
#include <string>

struct parsed_http_url {
    bool https = false;
    std::string host;
    int32_t port = 0;
    std::string path = "/";
};

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err);

struct http_fetch_options {
    int32_t connect_timeout_sec = 30;
    int32_t read_timeout_sec = 30;
    int32_t total_timeout_sec = 60;
    uint64_t max_bytes = 50ull * 1024 * 1024;
    bool follow_redirects = true;
};

// Downloads url into dest_path. On failure dest_path may hold a partial file;
// callers download to a scratch name and rename only on success.
bool http_fetch_to_file(
        const std::string & url,
        const std::string & dest_path,
        const http_fetch_options & opts,
        spkv_error & err);

using url_fetcher = std::function<bool(const std::string & url, const std::string & dest_path, spkv_error & err)>;

url_fetcher make_http_fetcher(const http_fetch_options & opts);
