#include "voiceguard/fbank.hpp"
#include "voiceguard/errors.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace voiceguard {

namespace {
    float hzToMel(float hz) { return 1127.0f * std::log(1.0f + hz / 700.0f); }
}

FbankExtractor::FbankExtractor(const Config& config)
    : config_(config), fft_in_(nullptr), fft_out_(nullptr), plan_(nullptr) {
    if (config_.frame_length < 2 || config_.frame_shift <= 0 || config_.n_fft < config_.frame_length ||
        config_.n_mels <= 0 || config_.sample_rate <= 0) {
        throw ConfigurationError("Invalid fbank configuration");
    }
    if (config_.high_freq <= 0.0f) {
        config_.high_freq = config_.sample_rate / 2.0f;
    }

    // Povey window: Hann raised to 0.85
    window_.resize(config_.frame_length);
    for (int i = 0; i < config_.frame_length; ++i) {
        double hann = 0.5 - 0.5 * std::cos(2.0 * M_PI * i / (config_.frame_length - 1));
        window_[i] = static_cast<float>(std::pow(hann, 0.85));
    }

    buildMelBanks();

    fft_in_ = fftwf_alloc_real(config_.n_fft);
    fft_out_ = fftwf_alloc_complex(config_.n_fft / 2 + 1);
    plan_ = fftwf_plan_dft_r2c_1d(config_.n_fft, fft_in_, fft_out_, FFTW_ESTIMATE);
    if (!fft_in_ || !fft_out_ || !plan_) {
        if (plan_) fftwf_destroy_plan(plan_);
        fftwf_free(fft_in_);
        fftwf_free(fft_out_);
        throw ConfigurationError("Failed to create FFT plan");
    }
}

FbankExtractor::~FbankExtractor() {
    fftwf_destroy_plan(plan_);
    fftwf_free(fft_in_);
    fftwf_free(fft_out_);
}

void FbankExtractor::buildMelBanks() {
    const int n_bins = config_.n_fft / 2 + 1;
    const float bin_hz = static_cast<float>(config_.sample_rate) / config_.n_fft;
    const float mel_low = hzToMel(config_.low_freq);
    const float mel_high = hzToMel(config_.high_freq);
    const float mel_step = (mel_high - mel_low) / (config_.n_mels + 1);

    mel_banks_.assign(config_.n_mels, std::vector<float>(n_bins, 0.0f));
    for (int m = 0; m < config_.n_mels; ++m) {
        float left = mel_low + m * mel_step;
        float center = left + mel_step;
        float right = center + mel_step;
        for (int k = 0; k < n_bins; ++k) {
            float mel = hzToMel(k * bin_hz);
            if (mel > left && mel < right) {
                mel_banks_[m][k] = (mel <= center) ? (mel - left) / (center - left)
                                                   : (right - mel) / (right - center);
            }
        }
    }
}

int FbankExtractor::numFrames(size_t num_samples) const {
    if (num_samples < static_cast<size_t>(config_.frame_length)) {
        return 0;
    }
    return 1 + static_cast<int>((num_samples - config_.frame_length) / config_.frame_shift);
}

std::vector<float> FbankExtractor::compute(const std::vector<float>& samples) {
    const int n_frames = numFrames(samples.size());
    const int n_bins = config_.n_fft / 2 + 1;
    std::vector<float> features(static_cast<size_t>(n_frames) * config_.n_mels);
    std::vector<float> frame(config_.frame_length);
    std::vector<float> power(n_bins);

    for (int f = 0; f < n_frames; ++f) {
        const float* src = samples.data() + static_cast<size_t>(f) * config_.frame_shift;

        // Scale and remove DC offset
        double mean = 0.0;
        for (int i = 0; i < config_.frame_length; ++i) {
            frame[i] = src[i] * config_.input_scale;
            mean += frame[i];
        }
        mean /= config_.frame_length;
        for (float& v : frame) {
            v -= static_cast<float>(mean);
        }

        for (int i = config_.frame_length - 1; i > 0; --i) {
            frame[i] -= config_.preemphasis * frame[i - 1];
        }
        frame[0] -= config_.preemphasis * frame[0];

        std::fill(fft_in_, fft_in_ + config_.n_fft, 0.0f);
        for (int i = 0; i < config_.frame_length; ++i) {
            fft_in_[i] = frame[i] * window_[i];
        }
        fftwf_execute(plan_);

        for (int k = 0; k < n_bins; ++k) {
            power[k] = fft_out_[k][0] * fft_out_[k][0] + fft_out_[k][1] * fft_out_[k][1];
        }

        float* out = features.data() + static_cast<size_t>(f) * config_.n_mels;
        for (int m = 0; m < config_.n_mels; ++m) {
            double energy = 0.0;
            const std::vector<float>& bank = mel_banks_[m];
            for (int k = 0; k < n_bins; ++k) {
                energy += bank[k] * power[k];
            }
            out[m] = std::log(std::max(static_cast<float>(energy), FLT_EPSILON));
        }
    }

    if (config_.mean_normalize && n_frames > 0) {
        for (int m = 0; m < config_.n_mels; ++m) {
            double sum = 0.0;
            for (int f = 0; f < n_frames; ++f) {
                sum += features[static_cast<size_t>(f) * config_.n_mels + m];
            }
            float mean = static_cast<float>(sum / n_frames);
            for (int f = 0; f < n_frames; ++f) {
                features[static_cast<size_t>(f) * config_.n_mels + m] -= mean;
            }
        }
    }

    return features;
}

} // namespace voiceguard
