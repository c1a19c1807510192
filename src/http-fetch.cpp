#include "http-fetch.h"

#include "spkv-common.h"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <regex>

namespace {

enum fetch_abort_reason {
    FETCH_ABORT_NONE = 0,
    FETCH_ABORT_STATUS,
    FETCH_ABORT_TOO_LARGE,
    FETCH_ABORT_DEADLINE,
    FETCH_ABORT_WRITE,
};

template<typename Client>
static httplib::Result do_get(
        Client & cli,
        const parsed_http_url & endpoint,
        const http_fetch_options & opts,
        const httplib::ResponseHandler & on_response,
        const httplib::ContentReceiver & on_data) {
    cli.set_follow_location(opts.follow_redirects);
    cli.set_connection_timeout(opts.connect_timeout_sec, 0);
    cli.set_read_timeout(opts.read_timeout_sec, 0);
    cli.set_write_timeout(opts.read_timeout_sec, 0);
    return cli.Get(endpoint.path, on_response, on_data);
}

} // namespace

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?(#.*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(raw, m, re)) {
        err = "unsupported URL (expected http or https): " + raw;
        return false;
    }

    const std::string scheme = to_lower_ascii(m[1].str());
    if (scheme != "http" && scheme != "https") {
        err = "unsupported URL scheme: " + scheme;
        return false;
    }

    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        int32_t p = 0;
        if (!parse_i32(m[3].str().c_str(), p) || p < 1 || p > 65535) {
            err = "invalid port in URL: " + raw;
            return false;
        }
        out.port = p;
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }

    return true;
}

bool http_fetch_to_file(
        const std::string & url,
        const std::string & dest_path,
        const http_fetch_options & opts,
        spkv_error & err) {
    parsed_http_url endpoint;
    std::string perr;
    if (!parse_http_url(url, endpoint, perr)) {
        err.set(SPKV_ERR_INVALID_SOURCE, perr);
        return false;
    }

    std::ofstream file(dest_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err.set(SPKV_ERR_INTERNAL, "failed to open download destination: " + dest_path);
        return false;
    }

    const auto t_start = std::chrono::steady_clock::now();
    const auto deadline = t_start + std::chrono::seconds(std::max(1, opts.total_timeout_sec));
    fetch_abort_reason abort_reason = FETCH_ABORT_NONE;
    int status = 0;
    uint64_t received = 0;

    auto on_response = [&](const httplib::Response & response) {
        status = response.status;
        if (response.status < 200 || response.status >= 300) {
            abort_reason = FETCH_ABORT_STATUS;
            return false;
        }
        return true;
    };

    auto on_data = [&](const char * data, size_t len) {
        if (std::chrono::steady_clock::now() >= deadline) {
            abort_reason = FETCH_ABORT_DEADLINE;
            return false;
        }
        received += len;
        if (opts.max_bytes > 0 && received > opts.max_bytes) {
            abort_reason = FETCH_ABORT_TOO_LARGE;
            return false;
        }
        file.write(data, (std::streamsize) len);
        if (!file.good()) {
            abort_reason = FETCH_ABORT_WRITE;
            return false;
        }
        return true;
    };

    httplib::Result res;
    if (endpoint.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(endpoint.host, endpoint.port);
        res = do_get(cli, endpoint, opts, on_response, on_data);
#else
        err.set(SPKV_ERR_DOWNLOAD_FAILED, "https URL requires CPPHTTPLIB_OPENSSL_SUPPORT");
        return false;
#endif
    } else {
        httplib::Client cli(endpoint.host, endpoint.port);
        res = do_get(cli, endpoint, opts, on_response, on_data);
    }

    file.close();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t_start).count();

    if (!res || abort_reason != FETCH_ABORT_NONE) {
        switch (abort_reason) {
            case FETCH_ABORT_STATUS:
                err.set(SPKV_ERR_DOWNLOAD_FAILED, "download returned HTTP " + std::to_string(status) + ": " + url);
                break;
            case FETCH_ABORT_TOO_LARGE:
                err.set(SPKV_ERR_DOWNLOAD_FAILED, "download exceeds " + std::to_string(opts.max_bytes) + " bytes: " + url);
                break;
            case FETCH_ABORT_DEADLINE:
                err.set(SPKV_ERR_TIMEOUT, "download exceeded " + std::to_string(opts.total_timeout_sec) + "s: " + url);
                break;
            case FETCH_ABORT_WRITE:
                err.set(SPKV_ERR_DOWNLOAD_FAILED, "failed to write download to disk: " + dest_path);
                break;
            case FETCH_ABORT_NONE: {
                const httplib::Error e = res.error();
                const bool timed_out = e == httplib::Error::ConnectionTimeout ||
                        (e == httplib::Error::Read && elapsed_ms >= 1000.0 * (double) opts.read_timeout_sec);
                err.set(timed_out ? SPKV_ERR_TIMEOUT : SPKV_ERR_DOWNLOAD_FAILED,
                        "download failed (" + httplib::to_string(e) + "): " + url);
                break;
            }
        }
        std::fprintf(stderr, "fetch: url=%s ok=false status=%d bytes=%llu ms=%.2f err=%s\n",
                url.c_str(), status, (unsigned long long) received, elapsed_ms, err.message.c_str());
        return false;
    }

    if (res->status < 200 || res->status >= 300) {
        err.set(SPKV_ERR_DOWNLOAD_FAILED, "download returned HTTP " + std::to_string(res->status) + ": " + url);
        return false;
    }

    std::fprintf(stderr, "fetch: url=%s ok=true status=%d bytes=%llu ms=%.2f\n",
            url.c_str(), res->status, (unsigned long long) received, elapsed_ms);
    return true;
}

url_fetcher make_http_fetcher(const http_fetch_options & opts) {
    return [opts](const std::string & url, const std::string & dest_path, spkv_error & err) {
        return http_fetch_to_file(url, dest_path, opts, err);
    };
}
