#pragma once

#include <string>
#include <utility>

enum spkv_error_kind {
    SPKV_ERR_NONE = 0,
    SPKV_ERR_INVALID_SOURCE,
    SPKV_ERR_DOWNLOAD_FAILED,
    SPKV_ERR_VALIDATION_FAILED,
    SPKV_ERR_MODEL_UNAVAILABLE,
    SPKV_ERR_EXTRACTION,
    SPKV_ERR_TIMEOUT,
    SPKV_ERR_INTERNAL,
};

struct spkv_error {
    spkv_error_kind kind = SPKV_ERR_NONE;
    std::string message;

    bool ok() const { return kind == SPKV_ERR_NONE; }

    void set(spkv_error_kind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }

    void clear() {
        kind = SPKV_ERR_NONE;
        message.clear();
    }
};

const char * spkv_error_kind_to_cstr(spkv_error_kind kind);

// 4xx for input problems, 5xx for service-side failures.
int spkv_error_http_status(spkv_error_kind kind);

bool spkv_error_is_retryable(spkv_error_kind kind);
