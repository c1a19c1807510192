#pragma once

#include "embedding-extractor.h"

#include "ggml.h"

#include <cstdint>
#include <string>

struct speaker_encoder_params {
    int sample_rate = 16000;
    int n_mels = 80;
    int hidden_dim = 512;
    int embed_dim = 192;
    float frame_length_ms = 25.0f;
    float frame_shift_ms = 10.0f;
    float norm_eps = 1e-5f;
};

// Frame-level affine + ReLU over log-mel features, mean/std statistics pooling
// and a final projection. Weights stay read-only after load(), each extract()
// builds and frees its own compute graph.
class speaker_encoder : public embedding_extractor {
public:
    speaker_encoder();
    ~speaker_encoder() override;

    speaker_encoder(const speaker_encoder &) = delete;
    speaker_encoder & operator=(const speaker_encoder &) = delete;

    // device: "auto" or "cpu"
    bool load(const std::string & path, const std::string & device, std::string & err);
    bool is_loaded() const;

    void set_model_id(const std::string & id) { model_id_ = id; }
    void set_max_audio_seconds(float sec) { max_audio_seconds_ = sec; }

    const speaker_encoder_params & params() const { return hp_; }

    int embedding_dim() const override { return hp_.embed_dim; }
    const std::string & model_id() const override { return model_id_; }

    bool extract(
            const std::string & audio_path,
            const extract_options & options,
            speaker_embedding & out,
            spkv_error & err) const override;

    // Runs the network on precomputed [n_mels, n_frames] features.
    bool embed_features(
            const std::vector<float> & feats,
            int n_frames,
            const extract_options & options,
            speaker_embedding & out,
            spkv_error & err) const;

private:
    struct gguf_context * ctx_gguf_    = nullptr;
    struct ggml_context * ctx_weights_ = nullptr;

    speaker_encoder_params hp_ = {};
    std::string model_id_;
    float max_audio_seconds_ = 120.0f;

    ggml_tensor * frame_w_ = nullptr; // [n_mels, hidden]
    ggml_tensor * frame_b_ = nullptr;
    ggml_tensor * proj_w_ = nullptr;  // [2*hidden, embed]
    ggml_tensor * proj_b_ = nullptr;

    void release();
    bool get_u32_kv(const char * key, uint32_t & out) const;
    bool get_f32_kv(const char * key, float & out) const;
    bool get_str_kv(const char * key, std::string & out) const;
};
