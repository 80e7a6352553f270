#include "voiceguard/file_capture_source.hpp"
#include "voiceguard/audio_file.hpp"
#include "voiceguard/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace voiceguard {

FileCaptureSource::FileCaptureSource(const Config& config) : config_(config) {
}

FileCaptureSource::~FileCaptureSource() {
    close();
}

void FileCaptureSource::open(ChunkSink sink) {
    if (is_open_.load()) {
        return;
    }
    if (config_.chunk_ms <= 0) {
        throw CaptureError("chunk_ms must be positive");
    }

    try {
        samples_ = loadAudioFile(config_.path, config_.sample_rate).samples;
    } catch (const std::exception& e) {
        throw CaptureError(std::string("Cannot play ") + e.what());
    }

    sink_ = std::move(sink);
    should_stop_.store(false);
    finished_.store(false);
    is_open_.store(true);

    thread_ = std::make_unique<std::thread>(&FileCaptureSource::playbackThread, this);
    std::cout << "[FileCapture] Playing " << config_.path << " ("
              << static_cast<double>(samples_.size()) / config_.sample_rate << " s"
              << (config_.loop ? ", looped" : "") << ")" << std::endl;
}

void FileCaptureSource::close() {
    if (!is_open_.load()) {
        return;
    }

    should_stop_.store(true);
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
    sink_ = nullptr;
    is_open_.store(false);
}

std::string FileCaptureSource::describe() const {
    return "file \"" + config_.path + "\"";
}

void FileCaptureSource::playbackThread() {
    const size_t chunk_samples = std::max<size_t>(1, static_cast<size_t>(config_.sample_rate) * config_.chunk_ms / 1000);
    auto next_delivery = std::chrono::steady_clock::now();
    size_t position = 0;

    while (!should_stop_.load()) {
        if (position >= samples_.size()) {
            if (!config_.loop || samples_.empty()) {
                break;
            }
            position = 0;
        }

        size_t n = std::min(chunk_samples, samples_.size() - position);
        sink_(AudioChunk(samples_.data() + position, n));
        position += n;

        // Pace delivery at the chunk's own duration
        next_delivery += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(static_cast<double>(n) / config_.sample_rate));
        std::this_thread::sleep_until(next_delivery);
    }

    if (!should_stop_.load()) {
        finished_.store(true);
        std::cout << "[FileCapture] End of " << config_.path << std::endl;
    }
}

} // namespace voiceguard
