#ifndef VOICEGUARD_PORTAUDIO_CAPTURE_SOURCE_HPP
#define VOICEGUARD_PORTAUDIO_CAPTURE_SOURCE_HPP

#include "voiceguard/capture_source.hpp"

#include <portaudio.h>

#include <atomic>
#include <string>
#include <vector>

namespace voiceguard {

// Microphone input through a PortAudio callback stream. The callback only
// converts the buffer into an AudioChunk and hands it to the sink.
class PortAudioCaptureSource : public CaptureSource {
public:
    struct Config {
        int device_index = -1;          // -1 = default input device
        int target_sample_rate = 16000; // rate delivered to the sink
        int device_sample_rate = 0;     // 0 = device default; resampled when it differs
        unsigned long frames_per_buffer = 1600;
    };

    struct DeviceInfo {
        int index;
        std::string name;
        int max_input_channels;
        double default_sample_rate;
        bool is_default;
    };

    explicit PortAudioCaptureSource(const Config& config);
    ~PortAudioCaptureSource() override;

    void open(ChunkSink sink) override;
    void close() override;
    bool isOpen() const override { return stream_ != nullptr; }
    std::string describe() const override;

    // Input-capable devices
    static std::vector<DeviceInfo> listDevices();

    // Blocking recording of `seconds` of mono audio at the target rate.
    // Throws CaptureError.
    static std::vector<float> record(const Config& config, double seconds);

private:
    static int streamCallback(
        const void* input_buffer,
        void* output_buffer,
        unsigned long frames_per_buffer,
        const PaStreamCallbackTimeInfo* time_info,
        PaStreamCallbackFlags status_flags,
        void* user_data
    );

    void deliver(const float* input, unsigned long frames);

    Config config_;
    ChunkSink sink_;
    PaStream* stream_ = nullptr;
    int stream_rate_ = 0;
    std::string device_name_;
    std::atomic<size_t> overflow_count_{0};
};

} // namespace voiceguard

#endif // VOICEGUARD_PORTAUDIO_CAPTURE_SOURCE_HPP
