#define _USE_MATH_DEFINES
#include "audio-io.h"
#include "speaker-encoder.h"
#include "spkv-common.h"
#include "verification.h"

#include "ggml.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

struct cli_params {
    std::string model;
    std::string model_id;
    std::string device = "auto";
    int32_t n_threads = 0;

    std::string audio1;
    std::string audio2;
    float threshold = 0.5f;
    threshold_mode mode = THRESHOLD_STRICT;
    float max_audio_seconds = 120.0f;
    int32_t timeout_sec = 0;

    std::string extract_in;
    std::string output;

    std::string tone_out;
    float tone_freq = 220.0f;
    float tone_seconds = 2.0f;
    int32_t tone_sample_rate = 16000;

    bool verbose = false;
    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -m MODEL --audio1 A --audio2 B [options]    verify two recordings\n"
        "  %s -m MODEL --extract A [-o out.json]          extract an embedding\n"
        "  %s --make-tone OUT.wav [--freq HZ] [--seconds S] [--sample-rate N]\n\n"
        "Model:\n"
        "  -m, --model FNAME          speaker encoder GGUF\n"
        "  --model-id STR             id reported in output (default: file stem)\n"
        "  --device STR               auto | cpu (default: auto)\n"
        "  --threads N                compute threads (default: auto)\n\n"
        "Verification:\n"
        "  --threshold F              decision threshold in [-1, 1] (default: 0.5)\n"
        "  --threshold-mode STR       strict | inclusive (default: strict)\n"
        "  --max-audio-seconds F      input is truncated beyond this (default: 120)\n"
        "  --timeout N                per-extraction timeout seconds, 0 disables (default: 0)\n\n"
        "Tone:\n"
        "  --freq HZ                  sine frequency (default: 220)\n"
        "  --seconds S                duration (default: 2)\n"
        "  --sample-rate N            output sample rate (default: 16000)\n\n"
        "Other:\n"
        "  -o, --output FNAME         write JSON result to FNAME instead of stdout\n"
        "  --verbose                  forward ggml debug logs\n"
        "  -h, --help                 show this help\n",
        argv0, argv0, argv0);
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-m" || arg == "--model") {
            if (!needs_value(i, argc)) return false;
            p.model = argv[++i];
        } else if (arg == "--model-id") {
            if (!needs_value(i, argc)) return false;
            p.model_id = argv[++i];
        } else if (arg == "--device") {
            if (!needs_value(i, argc)) return false;
            p.device = argv[++i];
        } else if (arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.n_threads)) return false;
        } else if (arg == "--audio1") {
            if (!needs_value(i, argc)) return false;
            p.audio1 = argv[++i];
        } else if (arg == "--audio2") {
            if (!needs_value(i, argc)) return false;
            p.audio2 = argv[++i];
        } else if (arg == "--threshold") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.threshold)) return false;
        } else if (arg == "--threshold-mode") {
            if (!needs_value(i, argc) || !parse_threshold_mode(argv[++i], p.mode)) return false;
        } else if (arg == "--max-audio-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.max_audio_seconds)) return false;
        } else if (arg == "--timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.timeout_sec)) return false;
        } else if (arg == "--extract") {
            if (!needs_value(i, argc)) return false;
            p.extract_in = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "--make-tone") {
            if (!needs_value(i, argc)) return false;
            p.tone_out = argv[++i];
        } else if (arg == "--freq") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.tone_freq)) return false;
        } else if (arg == "--seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.tone_seconds)) return false;
        } else if (arg == "--sample-rate") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.tone_sample_rate)) return false;
        } else if (arg == "--verbose") {
            p.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            p.show_help = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

static bool g_verbose = false;

static void ggml_log_callback_cli(ggml_log_level level, const char * text, void * /* user_data */) {
    if (g_verbose || level >= GGML_LOG_LEVEL_WARN) {
        std::fputs(text, stderr);
    }
}

static bool write_output(const cli_params & p, const json & j) {
    const std::string text = j.dump(2) + "\n";
    if (p.output.empty()) {
        std::fputs(text.c_str(), stdout);
        return true;
    }
    std::string err;
    if (!save_binary_file(p.output, text, err)) {
        std::fprintf(stderr, "%s\n", err.c_str());
        return false;
    }
    std::fprintf(stderr, "wrote %s\n", p.output.c_str());
    return true;
}

static int run_make_tone(const cli_params & p) {
    if (p.tone_sample_rate <= 0 || !(p.tone_seconds > 0.0f) || !(p.tone_freq > 0.0f)) {
        std::fprintf(stderr, "tone: frequency, duration and sample rate must be positive\n");
        return 1;
    }
    const size_t n = (size_t) std::lround((double) p.tone_seconds * p.tone_sample_rate);
    std::vector<float> pcm(n);
    const double w = 2.0 * M_PI * (double) p.tone_freq / (double) p.tone_sample_rate;
    for (size_t i = 0; i < n; ++i) {
        pcm[i] = 0.5f * (float) std::sin(w * (double) i);
    }
    std::string err;
    if (!audio_save_wav16(p.tone_out, pcm.data(), pcm.size(), p.tone_sample_rate, err)) {
        std::fprintf(stderr, "tone: %s\n", err.c_str());
        return 1;
    }
    std::fprintf(stderr, "tone: wrote %s freq=%.1f seconds=%.2f sr=%d\n",
            p.tone_out.c_str(), p.tone_freq, p.tone_seconds, p.tone_sample_rate);
    return 0;
}

static bool embed_file(
        const speaker_encoder & encoder,
        const cli_params & p,
        const std::string & path,
        speaker_embedding & out) {
    extract_options opts;
    opts.n_threads = p.n_threads;
    if (p.timeout_sec > 0) {
        opts.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(p.timeout_sec);
    }
    spkv_error err;
    const int64_t t0 = steady_now_ms();
    if (!encoder.extract(path, opts, out, err)) {
        std::fprintf(stderr, "extract: path=%s type=%s err=%s\n",
                path.c_str(), spkv_error_kind_to_cstr(err.kind), err.message.c_str());
        return false;
    }
    std::fprintf(stderr, "extract: path=%s dim=%zu ms=%lld\n",
            path.c_str(), out.size(), (long long) (steady_now_ms() - t0));
    return true;
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!p.tone_out.empty()) {
        return run_make_tone(p);
    }

    const bool extract_mode = !p.extract_in.empty();
    if (p.model.empty() || (!extract_mode && (p.audio1.empty() || p.audio2.empty()))) {
        print_usage(argv[0]);
        return 1;
    }
    if (!std::isfinite(p.threshold) || p.threshold < -1.0f || p.threshold > 1.0f) {
        std::fprintf(stderr, "--threshold must be within [-1, 1]\n");
        return 1;
    }

    g_verbose = p.verbose;
    ggml_log_set(ggml_log_callback_cli, nullptr);

    speaker_encoder encoder;
    encoder.set_model_id(p.model_id);
    encoder.set_max_audio_seconds(p.max_audio_seconds);
    std::string err;
    if (!encoder.load(p.model, p.device, err)) {
        std::fprintf(stderr, "model: %s\n", err.c_str());
        return 1;
    }

    if (extract_mode) {
        speaker_embedding emb;
        if (!embed_file(encoder, p, p.extract_in, emb)) {
            return 1;
        }
        const json j = {
            {"audio", p.extract_in},
            {"model_id", encoder.model_id()},
            {"dimension", emb.size()},
            {"embedding", emb},
        };
        return write_output(p, j) ? 0 : 1;
    }

    speaker_embedding e1;
    speaker_embedding e2;
    if (!embed_file(encoder, p, p.audio1, e1) || !embed_file(encoder, p, p.audio2, e2)) {
        return 1;
    }

    verification_result r;
    spkv_error verr;
    if (!compare_embeddings(e1, e2, p.threshold, p.mode, r, verr)) {
        std::fprintf(stderr, "compare: %s\n", verr.message.c_str());
        return 1;
    }

    const json j = {
        {"audio1", p.audio1},
        {"audio2", p.audio2},
        {"model_id", encoder.model_id()},
        {"score", r.score},
        {"is_same_speaker", r.is_same},
        {"threshold", r.threshold},
        {"threshold_mode", threshold_mode_to_cstr(p.mode)},
        {"confidence", r.confidence},
    };
    return write_output(p, j) ? 0 : 1;
}
