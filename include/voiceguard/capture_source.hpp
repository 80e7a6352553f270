#ifndef VOICEGUARD_CAPTURE_SOURCE_HPP
#define VOICEGUARD_CAPTURE_SOURCE_HPP

#include "voiceguard/audio_chunk.hpp"

#include <string>

namespace voiceguard {

/**
 * @brief Producer of mono audio chunks at the monitor's sample rate
 *
 * Implementations:
 * - PortAudioCaptureSource (microphone)
 * - FileCaptureSource (real-time playback of an audio file)
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    /**
     * @brief Start delivering chunks to `sink` from the source's own context
     * @throws CaptureError if the stream cannot be opened
     */
    virtual void open(ChunkSink sink) = 0;

    /**
     * @brief Stop delivering. No-op when not open.
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    // Human-readable name for logs
    virtual std::string describe() const = 0;
};

} // namespace voiceguard

#endif // VOICEGUARD_CAPTURE_SOURCE_HPP
