#include "voiceguard/portaudio_capture_source.hpp"
#include "voiceguard/audio_file.hpp"
#include "voiceguard/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace voiceguard {

namespace {

    // Pa_Initialize/Pa_Terminate pair; PortAudio reference-counts them
    class PortAudioSession {
    public:
        PortAudioSession() {
            PaError err = Pa_Initialize();
            if (err != paNoError) {
                throw CaptureError(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
            }
        }
        ~PortAudioSession() { Pa_Terminate(); }

        PortAudioSession(const PortAudioSession&) = delete;
        PortAudioSession& operator=(const PortAudioSession&) = delete;
    };

    PaDeviceIndex resolveDevice(int requested) {
        PaDeviceIndex device = (requested >= 0) ? requested : Pa_GetDefaultInputDevice();
        if (device == paNoDevice || device >= Pa_GetDeviceCount()) {
            throw CaptureError("No usable audio input device");
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        if (!info || info->maxInputChannels < 1) {
            throw CaptureError("Device " + std::to_string(device) + " has no input channels");
        }
        return device;
    }

    PaStreamParameters monoInput(PaDeviceIndex device) {
        PaStreamParameters params;
        params.device = device;
        params.channelCount = 1;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = Pa_GetDeviceInfo(device)->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;
        return params;
    }

    // Requested rate, or the device's own when the device refuses it
    int pickStreamRate(const PortAudioCaptureSource::Config& config, const PaStreamParameters& params) {
        if (config.device_sample_rate > 0) {
            return config.device_sample_rate;
        }
        if (Pa_IsFormatSupported(&params, nullptr, config.target_sample_rate) == paFormatIsSupported) {
            return config.target_sample_rate;
        }
        return static_cast<int>(Pa_GetDeviceInfo(params.device)->defaultSampleRate);
    }
}

PortAudioCaptureSource::PortAudioCaptureSource(const Config& config) : config_(config) {
}

PortAudioCaptureSource::~PortAudioCaptureSource() {
    close();
}

void PortAudioCaptureSource::open(ChunkSink sink) {
    if (stream_) {
        return;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw CaptureError(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
    }

    try {
        PaDeviceIndex device = resolveDevice(config_.device_index);
        PaStreamParameters params = monoInput(device);
        stream_rate_ = pickStreamRate(config_, params);
        device_name_ = Pa_GetDeviceInfo(device)->name;
        sink_ = std::move(sink);

        err = Pa_OpenStream(&stream_,
                            &params,
                            nullptr,  // no output
                            stream_rate_,
                            config_.frames_per_buffer,
                            paClipOff,
                            &PortAudioCaptureSource::streamCallback,
                            this);
        if (err != paNoError) {
            stream_ = nullptr;
            throw CaptureError(std::string("Failed to open stream: ") + Pa_GetErrorText(err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            throw CaptureError(std::string("Failed to start stream: ") + Pa_GetErrorText(err));
        }
    } catch (const CaptureError&) {
        sink_ = nullptr;
        Pa_Terminate();
        throw;
    }

    std::cout << "[PortAudioCapture] Capturing from " << device_name_ << " at " << stream_rate_ << " Hz";
    if (stream_rate_ != config_.target_sample_rate) {
        std::cout << " (resampled to " << config_.target_sample_rate << " Hz)";
    }
    std::cout << std::endl;
}

void PortAudioCaptureSource::close() {
    if (!stream_) {
        return;
    }

    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    sink_ = nullptr;
    Pa_Terminate();

    if (overflow_count_.load() > 0) {
        std::cerr << "[PortAudioCapture] " << overflow_count_.load() << " input overflow(s) during capture" << std::endl;
    }
    std::cout << "[PortAudioCapture] Capture closed" << std::endl;
}

std::string PortAudioCaptureSource::describe() const {
    if (!device_name_.empty()) {
        return "microphone \"" + device_name_ + "\"";
    }
    return config_.device_index >= 0 ? "microphone #" + std::to_string(config_.device_index)
                                     : "default microphone";
}

int PortAudioCaptureSource::streamCallback(
    const void* input_buffer,
    void* output_buffer,
    unsigned long frames_per_buffer,
    const PaStreamCallbackTimeInfo* time_info,
    PaStreamCallbackFlags status_flags,
    void* user_data) {
    (void)output_buffer;
    (void)time_info;

    PortAudioCaptureSource* source = static_cast<PortAudioCaptureSource*>(user_data);
    if (status_flags & paInputOverflow) {
        source->overflow_count_++;
    }

    const float* input = static_cast<const float*>(input_buffer);
    if (input) {
        source->deliver(input, frames_per_buffer);
    }
    return paContinue;
}

void PortAudioCaptureSource::deliver(const float* input, unsigned long frames) {
    if (!sink_ || frames == 0) {
        return;
    }

    if (stream_rate_ == config_.target_sample_rate) {
        sink_(AudioChunk(input, frames));
        return;
    }

    std::vector<float> raw(input, input + frames);
    std::vector<float> resampled = resampleLinear(raw, stream_rate_, config_.target_sample_rate);
    if (!resampled.empty()) {
        sink_(AudioChunk(std::move(resampled)));
    }
}

std::vector<PortAudioCaptureSource::DeviceInfo> PortAudioCaptureSource::listDevices() {
    PortAudioSession session;

    std::vector<DeviceInfo> devices;
    PaDeviceIndex default_input = Pa_GetDefaultInputDevice();
    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) {
            continue;
        }
        DeviceInfo dev;
        dev.index = i;
        dev.name = info->name;
        dev.max_input_channels = info->maxInputChannels;
        dev.default_sample_rate = info->defaultSampleRate;
        dev.is_default = (i == default_input);
        devices.push_back(dev);
    }
    return devices;
}

std::vector<float> PortAudioCaptureSource::record(const Config& config, double seconds) {
    if (!(seconds > 0.0)) {
        throw CaptureError("Recording length must be positive");
    }

    PortAudioSession session;
    PaDeviceIndex device = resolveDevice(config.device_index);
    PaStreamParameters params = monoInput(device);
    int rate = pickStreamRate(config, params);

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &params, nullptr, rate, config.frames_per_buffer,
                                paClipOff, nullptr, nullptr);  // blocking API
    if (err != paNoError) {
        throw CaptureError(std::string("Failed to open stream: ") + Pa_GetErrorText(err));
    }
    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        throw CaptureError(std::string("Failed to start stream: ") + Pa_GetErrorText(err));
    }

    const size_t total = static_cast<size_t>(std::lround(seconds * rate));
    std::vector<float> samples(total);
    size_t captured = 0;
    while (captured < total) {
        unsigned long frames = static_cast<unsigned long>(std::min<size_t>(config.frames_per_buffer, total - captured));
        err = Pa_ReadStream(stream, samples.data() + captured, frames);
        if (err != paNoError && err != paInputOverflowed) {
            Pa_StopStream(stream);
            Pa_CloseStream(stream);
            throw CaptureError(std::string("Recording failed: ") + Pa_GetErrorText(err));
        }
        captured += frames;
    }

    Pa_StopStream(stream);
    Pa_CloseStream(stream);

    return resampleLinear(samples, rate, config.target_sample_rate);
}

} // namespace voiceguard
