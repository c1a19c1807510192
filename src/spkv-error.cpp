#include "spkv-error.h"

const char * spkv_error_kind_to_cstr(spkv_error_kind kind) {
    switch (kind) {
        case SPKV_ERR_NONE:              return "none";
        case SPKV_ERR_INVALID_SOURCE:    return "invalid_source";
        case SPKV_ERR_DOWNLOAD_FAILED:   return "download_failed";
        case SPKV_ERR_VALIDATION_FAILED: return "validation_failed";
        case SPKV_ERR_MODEL_UNAVAILABLE: return "model_unavailable";
        case SPKV_ERR_EXTRACTION:        return "extraction_error";
        case SPKV_ERR_TIMEOUT:           return "timeout";
        case SPKV_ERR_INTERNAL:          return "internal_error";
    }
    return "internal_error";
}

int spkv_error_http_status(spkv_error_kind kind) {
    switch (kind) {
        case SPKV_ERR_NONE:              return 200;
        case SPKV_ERR_INVALID_SOURCE:    return 400;
        case SPKV_ERR_VALIDATION_FAILED: return 422;
        case SPKV_ERR_DOWNLOAD_FAILED:   return 502;
        case SPKV_ERR_MODEL_UNAVAILABLE: return 503;
        case SPKV_ERR_TIMEOUT:           return 504;
        case SPKV_ERR_EXTRACTION:
        case SPKV_ERR_INTERNAL:          return 500;
    }
    return 500;
}

bool spkv_error_is_retryable(spkv_error_kind kind) {
    switch (kind) {
        case SPKV_ERR_DOWNLOAD_FAILED:
        case SPKV_ERR_MODEL_UNAVAILABLE:
        case SPKV_ERR_EXTRACTION:
        case SPKV_ERR_TIMEOUT:
            return true;
        default:
            return false;
    }
}
