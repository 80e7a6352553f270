#ifndef VOICEGUARD_AUDIO_FILE_HPP
#define VOICEGUARD_AUDIO_FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace voiceguard {

struct DecodedAudio {
    std::vector<float> samples;  // mono, at the requested rate
    int source_rate;
    int source_channels;
    int major_format;            // SF_FORMAT_WAV, SF_FORMAT_FLAC, ...

    DecodedAudio() : source_rate(0), source_channels(0), major_format(0) {}
};

// Decode an in-memory audio file (any container libsndfile reads), mixed
// down to mono and resampled to target_rate. Throws DecodeError.
DecodedAudio decodeAudioBytes(const std::vector<uint8_t>& bytes, int target_rate);

// Same as decodeAudioBytes() for a file on disk. Throws PersistenceError
// when the file cannot be opened, DecodeError when it is not audio.
DecodedAudio loadAudioFile(const std::string& path, int target_rate);

// Encode mono float samples as a WAV file image (32-bit float PCM)
std::vector<uint8_t> encodeWav(const std::vector<float>& samples, int sample_rate);

// Whole-file helpers, both throw PersistenceError
std::vector<uint8_t> readFileBytes(const std::string& path);
void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes);

// Linear interpolation resampler for mono audio
std::vector<float> resampleLinear(const std::vector<float>& input, int input_rate, int output_rate);

// Average interleaved channels into one
std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels);

// ".wav", ".flac", ... for a libsndfile major format
std::string extensionForFormat(int major_format);

// True for extensions the voices directory scan picks up
bool isAudioExtension(const std::string& extension);

} // namespace voiceguard

#endif // VOICEGUARD_AUDIO_FILE_HPP
