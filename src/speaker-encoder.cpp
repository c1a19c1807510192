#include "speaker-encoder.h"

#include "audio-io.h"
#include "fbank.h"
#include "spkv-common.h"

#include "ggml-alloc.h"
#include "ggml-backend.h"
#include "ggml-cpu.h"
#include "gguf.h"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace {

static ggml_tensor * linear(ggml_context * ctx, ggml_tensor * x, ggml_tensor * w, ggml_tensor * b) {
    ggml_tensor * y = ggml_mul_mat(ctx, w, x);
    if (b != nullptr) {
        y = ggml_add(ctx, y, ggml_repeat(ctx, b, y));
    }
    return y;
}

static bool deadline_abort_callback(void * data) {
    const auto * opts = static_cast<const extract_options *>(data);
    return opts != nullptr && opts->expired();
}

static bool device_is_supported(const std::string & device) {
    const std::string d = to_lower_ascii(device);
    return d.empty() || d == "auto" || d == "cpu";
}

} // namespace

speaker_encoder::speaker_encoder() = default;

speaker_encoder::~speaker_encoder() {
    release();
}

void speaker_encoder::release() {
    if (ctx_weights_ != nullptr) {
        ggml_free(ctx_weights_);
        ctx_weights_ = nullptr;
    }
    if (ctx_gguf_ != nullptr) {
        gguf_free(ctx_gguf_);
        ctx_gguf_ = nullptr;
    }
    frame_w_ = frame_b_ = proj_w_ = proj_b_ = nullptr;
}

bool speaker_encoder::is_loaded() const {
    return ctx_gguf_ != nullptr && ctx_weights_ != nullptr;
}

bool speaker_encoder::get_u32_kv(const char * key, uint32_t & out) const {
    if (ctx_gguf_ == nullptr) {
        return false;
    }
    const int64_t key_id = gguf_find_key(ctx_gguf_, key);
    if (key_id < 0) {
        return false;
    }

    switch (gguf_get_kv_type(ctx_gguf_, key_id)) {
        case GGUF_TYPE_UINT8:  out = gguf_get_val_u8 (ctx_gguf_, key_id); return true;
        case GGUF_TYPE_UINT16: out = gguf_get_val_u16(ctx_gguf_, key_id); return true;
        case GGUF_TYPE_UINT32: out = gguf_get_val_u32(ctx_gguf_, key_id); return true;
        case GGUF_TYPE_INT8:   out = (uint32_t) gguf_get_val_i8 (ctx_gguf_, key_id); return true;
        case GGUF_TYPE_INT16:  out = (uint32_t) gguf_get_val_i16(ctx_gguf_, key_id); return true;
        case GGUF_TYPE_INT32:  out = (uint32_t) gguf_get_val_i32(ctx_gguf_, key_id); return true;
        default: return false;
    }
}

bool speaker_encoder::get_f32_kv(const char * key, float & out) const {
    if (ctx_gguf_ == nullptr) {
        return false;
    }
    const int64_t key_id = gguf_find_key(ctx_gguf_, key);
    if (key_id < 0) {
        return false;
    }

    switch (gguf_get_kv_type(ctx_gguf_, key_id)) {
        case GGUF_TYPE_FLOAT32: out = gguf_get_val_f32(ctx_gguf_, key_id); return true;
        case GGUF_TYPE_FLOAT64: out = (float) gguf_get_val_f64(ctx_gguf_, key_id); return true;
        default: return false;
    }
}

bool speaker_encoder::get_str_kv(const char * key, std::string & out) const {
    if (ctx_gguf_ == nullptr) {
        return false;
    }
    const int64_t key_id = gguf_find_key(ctx_gguf_, key);
    if (key_id < 0 || gguf_get_kv_type(ctx_gguf_, key_id) != GGUF_TYPE_STRING) {
        return false;
    }
    out = gguf_get_val_str(ctx_gguf_, key_id);
    return true;
}

bool speaker_encoder::load(const std::string & path, const std::string & device, std::string & err) {
    release();

    if (!device_is_supported(device)) {
        err = "unsupported device for speaker encoder: " + device;
        return false;
    }

    gguf_init_params params = {
        /*.no_alloc = */ false,
        /*.ctx      = */ &ctx_weights_,
    };

    ctx_gguf_ = gguf_init_from_file(path.c_str(), params);
    if (ctx_gguf_ == nullptr || ctx_weights_ == nullptr) {
        err = "failed to load GGUF: " + path;
        release();
        return false;
    }

    uint32_t u32 = 0;
    float f32 = 0.0f;
    if (get_u32_kv("spkv.sample_rate", u32)) hp_.sample_rate = (int) u32;
    if (get_u32_kv("spkv.n_mels", u32)) hp_.n_mels = (int) u32;
    if (get_u32_kv("spkv.hidden_dim", u32)) hp_.hidden_dim = (int) u32;
    if (get_u32_kv("spkv.embed_dim", u32)) hp_.embed_dim = (int) u32;
    if (get_f32_kv("spkv.frame_length_ms", f32)) hp_.frame_length_ms = f32;
    if (get_f32_kv("spkv.frame_shift_ms", f32)) hp_.frame_shift_ms = f32;
    if (get_f32_kv("spkv.norm_eps", f32)) hp_.norm_eps = f32;

    if (model_id_.empty() && !get_str_kv("general.name", model_id_)) {
        model_id_ = std::filesystem::path(path).stem().string();
    }

    auto require_tensor = [&](const char * name, int64_t ne0, int64_t ne1) -> ggml_tensor * {
        ggml_tensor * t = ggml_get_tensor(ctx_weights_, name);
        if (t == nullptr) {
            if (err.empty()) err = std::string("missing tensor: ") + name;
            return nullptr;
        }
        if (t->type != GGML_TYPE_F32 || t->ne[0] != ne0 || t->ne[1] != ne1) {
            if (err.empty()) err = std::string("unexpected shape or type for tensor: ") + name;
            return nullptr;
        }
        return t;
    };

    err.clear();
    frame_w_ = require_tensor("spkv.frame.weight", hp_.n_mels, hp_.hidden_dim);
    frame_b_ = require_tensor("spkv.frame.bias", hp_.hidden_dim, 1);
    proj_w_ = require_tensor("spkv.proj.weight", 2 * (int64_t) hp_.hidden_dim, hp_.embed_dim);
    proj_b_ = require_tensor("spkv.proj.bias", hp_.embed_dim, 1);
    if (!err.empty()) {
        release();
        return false;
    }

    std::fprintf(stderr, "model: speaker encoder loaded id=%s sr=%d n_mels=%d hidden=%d embed=%d path=%s\n",
            model_id_.c_str(), hp_.sample_rate, hp_.n_mels, hp_.hidden_dim, hp_.embed_dim, path.c_str());
    return true;
}

bool speaker_encoder::extract(
        const std::string & audio_path,
        const extract_options & options,
        speaker_embedding & out,
        spkv_error & err) const {
    if (!is_loaded()) {
        err.set(SPKV_ERR_EXTRACTION, "speaker encoder not loaded");
        return false;
    }
    if (options.expired()) {
        err.set(SPKV_ERR_TIMEOUT, "extraction deadline exceeded before decode");
        return false;
    }

    const size_t max_frames = max_audio_seconds_ > 0.0f
            ? (size_t) ((double) max_audio_seconds_ * (double) hp_.sample_rate)
            : 0;

    std::vector<float> wav;
    std::string derr;
    if (!audio_decode_file_f32_mono(audio_path, hp_.sample_rate, max_frames, wav, derr)) {
        err.set(SPKV_ERR_EXTRACTION, "failed to decode audio: " + derr);
        return false;
    }

    fbank_params fp;
    fp.sample_rate = hp_.sample_rate;
    fp.n_mels = hp_.n_mels;
    fp.frame_length_ms = hp_.frame_length_ms;
    fp.frame_shift_ms = hp_.frame_shift_ms;

    std::vector<float> feats;
    int n_frames = 0;
    std::string ferr;
    if (!fbank_compute(wav, fp, feats, n_frames, ferr, [&]() { return options.expired(); })) {
        if (options.expired()) {
            err.set(SPKV_ERR_TIMEOUT, "extraction deadline exceeded during feature computation");
        } else {
            err.set(SPKV_ERR_EXTRACTION, "fbank failed: " + ferr);
        }
        return false;
    }

    return embed_features(feats, n_frames, options, out, err);
}

bool speaker_encoder::embed_features(
        const std::vector<float> & feats,
        int n_frames,
        const extract_options & options,
        speaker_embedding & out,
        spkv_error & err) const {
    if (!is_loaded()) {
        err.set(SPKV_ERR_EXTRACTION, "speaker encoder not loaded");
        return false;
    }
    if (n_frames <= 0 || feats.size() != (size_t) n_frames * (size_t) hp_.n_mels) {
        err.set(SPKV_ERR_EXTRACTION, "feature buffer does not match model input");
        return false;
    }

    // Graph metadata only, tensor data comes from ggml_gallocr.
    ggml_init_params gparams = {
        /*.mem_size   = */ ggml_tensor_overhead() * 64 + ggml_graph_overhead(),
        /*.mem_buffer = */ nullptr,
        /*.no_alloc   = */ true,
    };
    ggml_context * ctx = ggml_init(gparams);
    if (ctx == nullptr) {
        err.set(SPKV_ERR_EXTRACTION, "ggml_init failed");
        return false;
    }

    ggml_tensor * x = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, hp_.n_mels, n_frames);
    ggml_set_name(x, "spkv.feats_in");
    ggml_set_input(x);

    ggml_tensor * h = ggml_relu(ctx, linear(ctx, x, frame_w_, frame_b_)); // [hidden, T]

    // pool over time: ggml reductions run along ne0
    ggml_tensor * ht = ggml_cont(ctx, ggml_transpose(ctx, h));             // [T, hidden]
    ggml_tensor * mean = ggml_mean(ctx, ht);                               // [1, hidden]
    ggml_tensor * centered = ggml_sub(ctx, ht, ggml_repeat(ctx, mean, ht));
    ggml_tensor * var = ggml_mean(ctx, ggml_sqr(ctx, centered));
    ggml_tensor * stddev = ggml_sqrt(ctx, ggml_clamp(ctx, var, hp_.norm_eps, FLT_MAX));

    ggml_tensor * stats = ggml_concat(
            ctx,
            ggml_reshape_1d(ctx, mean, hp_.hidden_dim),
            ggml_reshape_1d(ctx, stddev, hp_.hidden_dim),
            0);                                                            // [2*hidden]

    ggml_tensor * emb = linear(ctx, stats, proj_w_, proj_b_);             // [embed]
    ggml_set_name(emb, "spkv.embedding");
    ggml_set_output(emb);

    ggml_cgraph * gf = ggml_new_graph(ctx);
    ggml_build_forward_expand(gf, emb);

    ggml_gallocr_t galloc = ggml_gallocr_new(ggml_backend_cpu_buffer_type());
    if (!ggml_gallocr_alloc_graph(galloc, gf)) {
        ggml_gallocr_free(galloc);
        ggml_free(ctx);
        err.set(SPKV_ERR_EXTRACTION, "ggml_gallocr_alloc_graph failed");
        return false;
    }

    std::memcpy(x->data, feats.data(), feats.size() * sizeof(float));

    ggml_cplan cplan = ggml_graph_plan(gf, std::max(1, options.n_threads), nullptr);
    std::vector<uint8_t> work_data;
    if (cplan.work_size > 0) {
        work_data.resize(cplan.work_size);
        cplan.work_data = work_data.data();
    }
    cplan.abort_callback = deadline_abort_callback;
    cplan.abort_callback_data = const_cast<extract_options *>(&options);

    const ggml_status status = ggml_graph_compute(gf, &cplan);
    if (status != GGML_STATUS_SUCCESS) {
        ggml_gallocr_free(galloc);
        ggml_free(ctx);
        if (status == GGML_STATUS_ABORTED || options.expired()) {
            err.set(SPKV_ERR_TIMEOUT, "extraction deadline exceeded during compute");
        } else {
            err.set(SPKV_ERR_EXTRACTION, std::string("ggml_graph_compute failed: ") + ggml_status_to_string(status));
        }
        return false;
    }

    out.resize((size_t) hp_.embed_dim);
    std::memcpy(out.data(), emb->data, out.size() * sizeof(float));
    ggml_gallocr_free(galloc);
    ggml_free(ctx);

    if (!l2_normalize(out)) {
        err.set(SPKV_ERR_EXTRACTION, "model produced a zero or non-finite embedding");
        return false;
    }
    return true;
}
