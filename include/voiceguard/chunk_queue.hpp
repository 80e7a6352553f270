#ifndef VOICEGUARD_CHUNK_QUEUE_HPP
#define VOICEGUARD_CHUNK_QUEUE_HPP

#include "voiceguard/audio_chunk.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace voiceguard {

// Hand-off between the capture context (producer) and the monitoring
// worker (single consumer).
class ChunkQueue {
public:
    ChunkQueue() = default;
    ~ChunkQueue() = default;

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    // Add a chunk. Never waits on the consumer.
    void push(AudioChunk&& chunk);

    // Wait up to `timeout` for a chunk. Returns false on timeout or when
    // interrupt() was called while waiting.
    bool popFor(AudioChunk& chunk, std::chrono::milliseconds timeout);

    // Wake a consumer blocked in popFor()
    void interrupt();

    // Drop everything queued, returns the number of chunks discarded
    size_t clear();

    bool empty() const;
    size_t size() const;

    size_t pushedCount() const { return pushed_count_.load(); }

private:
    std::queue<AudioChunk> chunks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_ = false;
    std::atomic<size_t> pushed_count_{0};
};

} // namespace voiceguard

#endif // VOICEGUARD_CHUNK_QUEUE_HPP
