#ifndef VOICEGUARD_FBANK_HPP
#define VOICEGUARD_FBANK_HPP

#include <fftw3.h>

#include <vector>

namespace voiceguard {

/**
 * Kaldi-style log mel filterbank features, the front-end speaker embedding
 * models (WeSpeaker, 3D-Speaker) are trained on.
 *
 * Not thread-safe: the FFT plan and scratch buffers are reused per call.
 */
class FbankExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int frame_length = 400;        // 25 ms
        int frame_shift = 160;         // 10 ms
        int n_fft = 512;
        int n_mels = 80;
        float low_freq = 20.0f;
        float high_freq = 0.0f;        // 0 = Nyquist
        float preemphasis = 0.97f;
        float input_scale = 32768.0f;  // models expect int16-range input
        bool mean_normalize = true;    // subtract per-bin mean over frames
    };

    explicit FbankExtractor(const Config& config);
    ~FbankExtractor();

    FbankExtractor(const FbankExtractor&) = delete;
    FbankExtractor& operator=(const FbankExtractor&) = delete;

    // Row-major [numFrames(samples.size()) x n_mels]
    std::vector<float> compute(const std::vector<float>& samples);

    int numFrames(size_t num_samples) const;
    int numMels() const { return config_.n_mels; }

private:
    void buildMelBanks();

    Config config_;
    std::vector<float> window_;
    std::vector<std::vector<float>> mel_banks_;  // [n_mels][n_fft/2 + 1]

    float* fft_in_;
    fftwf_complex* fft_out_;
    fftwf_plan plan_;
};

} // namespace voiceguard

#endif // VOICEGUARD_FBANK_HPP
