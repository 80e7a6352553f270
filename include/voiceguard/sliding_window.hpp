#ifndef VOICEGUARD_SLIDING_WINDOW_HPP
#define VOICEGUARD_SLIDING_WINDOW_HPP

#include <cstddef>
#include <vector>

namespace voiceguard {

// Trailing WIN_SEC * sample_rate samples of mono audio, kept as a ring.
// The window is always full length; it starts out as silence.
// Not thread-safe: owned by the monitoring thread.
class SlidingWindow {
public:
    explicit SlidingWindow(size_t capacity);
    SlidingWindow(double window_sec, int sample_rate);

    // Append samples at the tail, evicting as many from the head
    void push(const float* samples, size_t count);
    void push(const std::vector<float>& samples) { push(samples.data(), samples.size()); }

    // Contents oldest-first
    std::vector<float> snapshot() const;

    // Back to all zeros
    void reset();

    size_t size() const { return buffer_.size(); }

private:
    std::vector<float> buffer_;
    size_t head_;  // index of the oldest sample
};

} // namespace voiceguard

#endif // VOICEGUARD_SLIDING_WINDOW_HPP
