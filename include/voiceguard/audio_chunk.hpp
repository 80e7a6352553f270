#ifndef VOICEGUARD_AUDIO_CHUNK_HPP
#define VOICEGUARD_AUDIO_CHUNK_HPP

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace voiceguard {

// Mono block of samples delivered by a capture source
struct AudioChunk {
    std::vector<float> samples;
    size_t frame_count;

    AudioChunk() : frame_count(0) {}
    explicit AudioChunk(std::vector<float> s)
        : samples(std::move(s)), frame_count(samples.size()) {}
    AudioChunk(const float* data, size_t frames)
        : samples(data, data + frames), frame_count(frames) {}

    // Samples present and frame count agrees with them
    bool wellFormed() const { return !samples.empty() && samples.size() == frame_count; }
};

// Receives chunks from the capture context. Must return without blocking.
using ChunkSink = std::function<void(AudioChunk&&)>;

} // namespace voiceguard

#endif // VOICEGUARD_AUDIO_CHUNK_HPP
