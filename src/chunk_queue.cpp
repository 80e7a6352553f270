#include "voiceguard/chunk_queue.hpp"

namespace voiceguard {

void ChunkQueue::push(AudioChunk&& chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.push(std::move(chunk));
    }
    pushed_count_++;
    cv_.notify_one();
}

bool ChunkQueue::popFor(AudioChunk& chunk, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !chunks_.empty() || interrupted_; });

    if (interrupted_) {
        interrupted_ = false;
        return false;
    }
    if (chunks_.empty()) {
        return false;
    }

    chunk = std::move(chunks_.front());
    chunks_.pop();
    return true;
}

void ChunkQueue::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

size_t ChunkQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = chunks_.size();
    std::queue<AudioChunk> empty;
    std::swap(chunks_, empty);
    interrupted_ = false;
    return dropped;
}

bool ChunkQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.empty();
}

size_t ChunkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace voiceguard
