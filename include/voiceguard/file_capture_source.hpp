#ifndef VOICEGUARD_FILE_CAPTURE_SOURCE_HPP
#define VOICEGUARD_FILE_CAPTURE_SOURCE_HPP

#include "voiceguard/capture_source.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace voiceguard {

/**
 * @brief Plays an audio file into the sink at real-time pace, simulating a
 *        microphone. Useful for demos and for screening recorded calls.
 */
class FileCaptureSource : public CaptureSource {
public:
    struct Config {
        std::string path;
        int sample_rate = 16000;
        int chunk_ms = 100;
        bool loop = false;
    };

    explicit FileCaptureSource(const Config& config);
    ~FileCaptureSource() override;

    void open(ChunkSink sink) override;
    void close() override;
    bool isOpen() const override { return is_open_.load(); }
    std::string describe() const override;

    // True once a non-looping file has been fully delivered
    bool finished() const { return finished_.load(); }

private:
    void playbackThread();

    Config config_;
    ChunkSink sink_;
    std::vector<float> samples_;

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> is_open_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> finished_{false};
};

} // namespace voiceguard

#endif // VOICEGUARD_FILE_CAPTURE_SOURCE_HPP
