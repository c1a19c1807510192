#include "audio-io.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_ENCODING
#define MA_NO_DEVICE_IO
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_NODE_GRAPH
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MA_API static
#include <miniaudio/miniaudio.h>

namespace {

static void build_wav_header(uint8_t * p, uint32_t sample_rate, uint32_t pcm_bytes) {
    const uint32_t chunk_size = 36 + pcm_bytes;
    const uint32_t byte_rate = sample_rate * 2;
    const uint16_t block_align = 2;
    const uint16_t bits = 16;
    const uint16_t channels = 1;
    const uint16_t fmt = 1;
    const uint32_t fmt_size = 16;
    std::memcpy(p, "RIFF", 4); p += 4;
    std::memcpy(p, &chunk_size, 4); p += 4;
    std::memcpy(p, "WAVE", 4); p += 4;
    std::memcpy(p, "fmt ", 4); p += 4;
    std::memcpy(p, &fmt_size, 4); p += 4;
    std::memcpy(p, &fmt, 2); p += 2;
    std::memcpy(p, &channels, 2); p += 2;
    std::memcpy(p, &sample_rate, 4); p += 4;
    std::memcpy(p, &byte_rate, 4); p += 4;
    std::memcpy(p, &block_align, 2); p += 2;
    std::memcpy(p, &bits, 2); p += 2;
    std::memcpy(p, "data", 4); p += 4;
    std::memcpy(p, &pcm_bytes, 4);
}

} // namespace

bool audio_probe_file(const std::string & path, audio_file_info & info, std::string & err) {
    // format/channels/rate of 0 keep the source's native values
    ma_decoder_config decoder_config = ma_decoder_config_init(ma_format_f32, 0, 0);
    ma_decoder decoder;
    ma_result result = ma_decoder_init_file(path.c_str(), &decoder_config, &decoder);
    if (result != MA_SUCCESS) {
        err = std::string("unsupported or corrupt audio: ") + ma_result_description(result);
        return false;
    }

    ma_uint64 frame_count = 0;
    result = ma_decoder_get_length_in_pcm_frames(&decoder, &frame_count);
    info.sample_rate = (int) decoder.outputSampleRate;
    info.channels = (int) decoder.outputChannels;
    ma_decoder_uninit(&decoder);

    if (result != MA_SUCCESS || frame_count == 0 || info.sample_rate <= 0) {
        err = "audio has no decodable frames";
        return false;
    }

    info.n_frames = (uint64_t) frame_count;
    info.duration_sec = (double) frame_count / (double) info.sample_rate;
    return true;
}

bool audio_decode_file_f32_mono(
        const std::string & path,
        int target_sample_rate,
        size_t max_frames,
        std::vector<float> & out,
        std::string & err) {
    if (target_sample_rate <= 0) {
        err = "invalid target sample rate";
        return false;
    }

    ma_decoder_config decoder_config = ma_decoder_config_init(ma_format_f32, 1, (ma_uint32) target_sample_rate);
    ma_decoder decoder;
    ma_result result = ma_decoder_init_file(path.c_str(), &decoder_config, &decoder);
    if (result != MA_SUCCESS) {
        err = std::string("ma_decoder_init_file failed: ") + ma_result_description(result);
        return false;
    }

    ma_uint64 frame_count = 0;
    result = ma_decoder_get_length_in_pcm_frames(&decoder, &frame_count);
    if (result != MA_SUCCESS || frame_count == 0) {
        ma_decoder_uninit(&decoder);
        err = "ma_decoder_get_length_in_pcm_frames failed";
        return false;
    }

    ma_uint64 frames_to_read = frame_count;
    if (max_frames > 0) {
        frames_to_read = std::min<ma_uint64>(frame_count, (ma_uint64) max_frames);
    }
    if (frames_to_read > (ma_uint64) std::numeric_limits<size_t>::max() / sizeof(float)) {
        ma_decoder_uninit(&decoder);
        err = "audio is too large";
        return false;
    }

    out.resize((size_t) frames_to_read);
    ma_uint64 frames_read = 0;
    result = ma_decoder_read_pcm_frames(&decoder, out.data(), frames_to_read, &frames_read);
    ma_decoder_uninit(&decoder);
    if ((result != MA_SUCCESS && result != MA_AT_END) || frames_read == 0) {
        err = "ma_decoder_read_pcm_frames failed";
        return false;
    }

    if (frames_read < frames_to_read) {
        out.resize((size_t) frames_read);
    }
    return true;
}

bool audio_save_wav16(
        const std::string & path,
        const float * audio,
        size_t n_samples,
        int sample_rate,
        std::string & err) {
    if (sample_rate <= 0) {
        err = "invalid sample rate";
        return false;
    }
    if (n_samples > (size_t) (std::numeric_limits<uint32_t>::max() - 44) / 2) {
        err = "audio is too long for a WAV file";
        return false;
    }

    const uint32_t pcm_bytes = (uint32_t) (n_samples * 2);
    std::vector<uint8_t> buf(44 + (size_t) pcm_bytes);
    build_wav_header(buf.data(), (uint32_t) sample_rate, pcm_bytes);

    int16_t * pcm = reinterpret_cast<int16_t *>(buf.data() + 44);
    for (size_t i = 0; i < n_samples; ++i) {
        const float x = std::clamp(audio[i], -1.0f, 1.0f);
        pcm[i] = (int16_t) std::lrintf(x * 32767.0f);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    file.write(reinterpret_cast<const char *>(buf.data()), (std::streamsize) buf.size());
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}
