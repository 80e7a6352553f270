#include "voiceguard/onnx_embedding_extractor.hpp"
#include "voiceguard/errors.hpp"

#include <onnxruntime_cxx_api.h>

#include <cmath>
#include <iostream>

namespace voiceguard {

namespace {
    FbankExtractor::Config fbankConfigFor(int sample_rate) {
        FbankExtractor::Config cfg;
        cfg.sample_rate = sample_rate;
        cfg.frame_length = sample_rate / 40;  // 25 ms
        cfg.frame_shift = sample_rate / 100;  // 10 ms
        cfg.n_fft = 512;
        while (cfg.n_fft < cfg.frame_length) {
            cfg.n_fft *= 2;
        }
        return cfg;
    }

    void normalize(std::vector<float>& embedding) {
        double norm = 0.0;
        for (float v : embedding) {
            norm += static_cast<double>(v) * v;
        }
        norm = std::sqrt(norm);
        if (norm > 1e-8) {
            for (float& v : embedding) {
                v = static_cast<float>(v / norm);
            }
        }
    }
}

OnnxEmbeddingExtractor::OnnxEmbeddingExtractor(const Config& config)
    : config_(config), fbank_(fbankConfigFor(config.sample_rate)) {
    try {
        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "SpeakerEmbedding");

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(config_.num_threads);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        session_ = std::make_unique<Ort::Session>(*env_, config_.model_path.c_str(), session_options);

        Ort::AllocatorWithDefaultOptions allocator;
        if (session_->GetInputCount() < 1 || session_->GetOutputCount() < 1) {
            throw ConfigurationError("Speaker model " + config_.model_path + " has no inputs or outputs");
        }
        input_name_ = session_->GetInputNameAllocated(0, allocator).get();
        output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

        // (batch, embedding_dim); dynamic dims come back as -1
        auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) {
            embedding_dim_ = static_cast<int>(shape[1]);
        }

        memory_info_ = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));

    } catch (const Ort::Exception& e) {
        throw ConfigurationError(std::string("Failed to load speaker model: ") + e.what());
    }

    std::cout << "[OnnxEmbedding] Loaded " << config_.model_path << " (" << input_name_ << " -> "
              << output_name_ << ", dim " << embedding_dim_ << ")" << std::endl;
}

OnnxEmbeddingExtractor::~OnnxEmbeddingExtractor() = default;

std::vector<float> OnnxEmbeddingExtractor::extract(const std::vector<float>& audio) {
    if (audio.size() < static_cast<size_t>(config_.min_samples)) {
        throw ExtractionError("Audio too short for an embedding (" + std::to_string(audio.size()) + " samples)");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<float> features = fbank_.compute(audio);
    const int n_frames = fbank_.numFrames(audio.size());
    if (n_frames <= 0) {
        throw ExtractionError("No fbank frames extracted");
    }

    try {
        // [batch=1, frames, n_mels]
        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(n_frames), static_cast<int64_t>(fbank_.numMels())};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            *memory_info_,
            features.data(),
            features.size(),
            input_shape.data(),
            input_shape.size()
        );

        const char* input_names[] = {input_name_.c_str()};
        const char* output_names[] = {output_name_.c_str()};
        auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1, output_names, 1);

        const float* data = outputs[0].GetTensorData<float>();
        auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        size_t dim = shape.size() >= 2 ? static_cast<size_t>(shape[1]) : static_cast<size_t>(shape[0]);

        std::vector<float> embedding(data, data + dim);
        if (config_.normalize_output) {
            normalize(embedding);
        }
        return embedding;

    } catch (const Ort::Exception& e) {
        throw ExtractionError(std::string("Speaker model inference failed: ") + e.what());
    }
}

} // namespace voiceguard
