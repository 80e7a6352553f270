#ifndef VOICEGUARD_ONNX_EMBEDDING_EXTRACTOR_HPP
#define VOICEGUARD_ONNX_EMBEDDING_EXTRACTOR_HPP

#include "voiceguard/embedding_extractor.hpp"
#include "voiceguard/fbank.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to keep onnxruntime headers out of this header
namespace Ort {
    struct Env;
    struct Session;
    struct MemoryInfo;
}

namespace voiceguard {

/**
 * Speaker embeddings from a pretrained ONNX model (ResNet / ECAPA-TDNN
 * exported by WeSpeaker) fed with 80-dim fbank features.
 * Calls are serialized internally, so enrollment and monitoring may share
 * one instance.
 */
class OnnxEmbeddingExtractor : public EmbeddingExtractor {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        int num_threads = 2;
        int min_samples = 4000;       // shorter input is rejected (250 ms)
        bool normalize_output = true; // L2-normalize embeddings
    };

    // Throws ConfigurationError when the model cannot be loaded
    explicit OnnxEmbeddingExtractor(const Config& config);
    ~OnnxEmbeddingExtractor() override;

    OnnxEmbeddingExtractor(const OnnxEmbeddingExtractor&) = delete;
    OnnxEmbeddingExtractor& operator=(const OnnxEmbeddingExtractor&) = delete;

    std::vector<float> extract(const std::vector<float>& audio) override;
    int dimension() const override { return embedding_dim_; }

private:
    Config config_;
    FbankExtractor fbank_;
    std::mutex mutex_;

    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::unique_ptr<Ort::MemoryInfo> memory_info_;

    std::string input_name_;
    std::string output_name_;
    int embedding_dim_ = 256;
};

} // namespace voiceguard

#endif // VOICEGUARD_ONNX_EMBEDDING_EXTRACTOR_HPP
