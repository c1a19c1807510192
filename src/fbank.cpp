#include "fbank.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdint>

namespace {

constexpr double k_pi = 3.14159265358979323846;

static float mel_scale(float hz) {
    return 1127.0f * std::log(1.0f + hz / 700.0f);
}

static int next_pow2(int n) {
    int p = 1;
    while (p < n) {
        p <<= 1;
    }
    return p;
}

// in-place iterative radix-2, size must be a power of two
static void fft_inplace(std::vector<std::complex<float>> & a) {
    const size_t n = a.size();
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(a[i], a[j]);
        }
    }
    for (size_t len = 2; len <= n; len <<= 1) {
        const double ang = -2.0 * k_pi / (double) len;
        const std::complex<float> wlen((float) std::cos(ang), (float) std::sin(ang));
        for (size_t i = 0; i < n; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (size_t k = 0; k < len / 2; ++k) {
                const std::complex<float> u = a[i + k];
                const std::complex<float> v = a[i + k + len / 2] * w;
                a[i + k] = u + v;
                a[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

struct mel_bank {
    int first_bin = 0;
    std::vector<float> weights;
};

static std::vector<mel_bank> make_mel_banks(const fbank_params & p, int n_fft) {
    const float nyquist = 0.5f * (float) p.sample_rate;
    const float high = p.high_freq > 0.0f ? p.high_freq : nyquist + p.high_freq;
    const float mel_low = mel_scale(p.low_freq);
    const float mel_high = mel_scale(high);
    const float mel_delta = (mel_high - mel_low) / (float) (p.n_mels + 1);
    const int n_bins = n_fft / 2;
    const float bin_hz = (float) p.sample_rate / (float) n_fft;

    std::vector<mel_bank> banks((size_t) p.n_mels);
    for (int m = 0; m < p.n_mels; ++m) {
        const float left = mel_low + (float) m * mel_delta;
        const float center = left + mel_delta;
        const float right = center + mel_delta;

        mel_bank & bank = banks[(size_t) m];
        bank.first_bin = -1;
        for (int b = 0; b < n_bins; ++b) {
            const float mel = mel_scale(bin_hz * (float) b);
            if (mel <= left || mel >= right) {
                continue;
            }
            const float w = mel <= center ? (mel - left) / (center - left) : (right - mel) / (right - center);
            if (bank.first_bin < 0) {
                bank.first_bin = b;
            }
            bank.weights.resize((size_t) (b - bank.first_bin + 1), 0.0f);
            bank.weights.back() = w;
        }
        if (bank.first_bin < 0) {
            bank.first_bin = 0;
        }
    }
    return banks;
}

} // namespace

bool fbank_compute(
        const std::vector<float> & wav,
        const fbank_params & p,
        std::vector<float> & feats_out,
        int & n_frames,
        std::string & err,
        const std::function<bool()> & should_abort) {
    if (p.sample_rate <= 0 || p.n_mels <= 0 || p.frame_length_ms <= 0.0f || p.frame_shift_ms <= 0.0f) {
        err = "invalid fbank parameters";
        return false;
    }

    const int frame_len = (int) std::lround((double) p.sample_rate * p.frame_length_ms / 1000.0);
    const int frame_shift = (int) std::lround((double) p.sample_rate * p.frame_shift_ms / 1000.0);
    if (frame_len <= 1 || frame_shift <= 0) {
        err = "invalid fbank frame geometry";
        return false;
    }
    if ((int64_t) wav.size() < frame_len) {
        err = "audio is shorter than one analysis frame";
        return false;
    }

    n_frames = 1 + (int) (((int64_t) wav.size() - frame_len) / frame_shift);
    const int n_fft = next_pow2(frame_len);
    const int n_bins = n_fft / 2;
    const std::vector<mel_bank> banks = make_mel_banks(p, n_fft);

    std::vector<float> window((size_t) frame_len);
    for (int i = 0; i < frame_len; ++i) {
        window[(size_t) i] = (float) (0.54 - 0.46 * std::cos(2.0 * k_pi * (double) i / (double) (frame_len - 1)));
    }

    feats_out.assign((size_t) p.n_mels * (size_t) n_frames, 0.0f);
    std::vector<float> frame((size_t) frame_len);
    std::vector<std::complex<float>> spec((size_t) n_fft);
    std::vector<float> power((size_t) n_bins + 1);
    const float energy_floor = 1.1920929e-07f;

    for (int t = 0; t < n_frames; ++t) {
        if (should_abort && (t % 64) == 0 && should_abort()) {
            err = "fbank aborted";
            return false;
        }

        const float * src = wav.data() + (size_t) t * (size_t) frame_shift;
        double mean = 0.0;
        for (int i = 0; i < frame_len; ++i) {
            frame[(size_t) i] = src[i] * p.input_scale;
            mean += frame[(size_t) i];
        }
        mean /= (double) frame_len;
        for (float & v : frame) {
            v -= (float) mean;
        }
        for (int i = frame_len - 1; i > 0; --i) {
            frame[(size_t) i] -= p.preemph * frame[(size_t) i - 1];
        }
        frame[0] -= p.preemph * frame[0];

        std::fill(spec.begin(), spec.end(), std::complex<float>(0.0f, 0.0f));
        for (int i = 0; i < frame_len; ++i) {
            spec[(size_t) i] = std::complex<float>(frame[(size_t) i] * window[(size_t) i], 0.0f);
        }
        fft_inplace(spec);
        for (int b = 0; b <= n_bins; ++b) {
            power[(size_t) b] = std::norm(spec[(size_t) b]);
        }

        float * dst = feats_out.data() + (size_t) t * (size_t) p.n_mels;
        for (int m = 0; m < p.n_mels; ++m) {
            const mel_bank & bank = banks[(size_t) m];
            double e = 0.0;
            for (size_t k = 0; k < bank.weights.size(); ++k) {
                e += (double) bank.weights[k] * (double) power[(size_t) bank.first_bin + k];
            }
            dst[m] = std::log(std::max((float) e, energy_floor));
        }
    }

    if (p.subtract_mean) {
        std::vector<double> mean((size_t) p.n_mels, 0.0);
        for (int t = 0; t < n_frames; ++t) {
            const float * row = feats_out.data() + (size_t) t * (size_t) p.n_mels;
            for (int m = 0; m < p.n_mels; ++m) {
                mean[(size_t) m] += row[m];
            }
        }
        for (double & v : mean) {
            v /= (double) n_frames;
        }
        for (int t = 0; t < n_frames; ++t) {
            float * row = feats_out.data() + (size_t) t * (size_t) p.n_mels;
            for (int m = 0; m < p.n_mels; ++m) {
                row[m] -= (float) mean[(size_t) m];
            }
        }
    }

    return true;
}
