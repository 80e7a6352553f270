#include "voiceguard/sliding_window.hpp"
#include "voiceguard/errors.hpp"

#include <algorithm>
#include <cmath>

namespace voiceguard {

SlidingWindow::SlidingWindow(size_t capacity) : buffer_(capacity, 0.0f), head_(0) {
    if (capacity == 0) {
        throw ConfigurationError("Sliding window needs a non-zero capacity");
    }
}

SlidingWindow::SlidingWindow(double window_sec, int sample_rate)
    : SlidingWindow(static_cast<size_t>(std::lround(window_sec * sample_rate))) {
}

void SlidingWindow::push(const float* samples, size_t count) {
    const size_t capacity = buffer_.size();
    if (count == 0) {
        return;
    }

    // Longer than the window: only its tail survives
    if (count >= capacity) {
        std::copy(samples + (count - capacity), samples + count, buffer_.begin());
        head_ = 0;
        return;
    }

    // Overwrite the oldest samples in place, wrapping once at most
    size_t first = std::min(count, capacity - head_);
    std::copy(samples, samples + first, buffer_.begin() + head_);
    std::copy(samples + first, samples + count, buffer_.begin());
    head_ = (head_ + count) % capacity;
}

std::vector<float> SlidingWindow::snapshot() const {
    std::vector<float> out;
    out.reserve(buffer_.size());
    out.insert(out.end(), buffer_.begin() + head_, buffer_.end());
    out.insert(out.end(), buffer_.begin(), buffer_.begin() + head_);
    return out;
}

void SlidingWindow::reset() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    head_ = 0;
}

} // namespace voiceguard
