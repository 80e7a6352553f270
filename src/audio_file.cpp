#include "voiceguard/audio_file.hpp"
#include "voiceguard/errors.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace voiceguard {

namespace {

    // Backing store for libsndfile virtual I/O. Reads come from `data`,
    // writes go to `sink` when one is attached.
    struct MemoryFile {
        const uint8_t* data;
        sf_count_t size;
        sf_count_t position;
        std::vector<uint8_t>* sink;
    };

    sf_count_t memGetLength(void* user) {
        return static_cast<MemoryFile*>(user)->size;
    }

    sf_count_t memSeek(sf_count_t offset, int whence, void* user) {
        MemoryFile* file = static_cast<MemoryFile*>(user);
        sf_count_t target = offset;
        switch (whence) {
            case SEEK_CUR:
                target = file->position + offset;
                break;
            case SEEK_END:
                target = file->size + offset;
                break;
            default:
                break;
        }
        if (target < 0) {
            return -1;
        }
        file->position = target;
        return file->position;
    }

    sf_count_t memRead(void* ptr, sf_count_t count, void* user) {
        MemoryFile* file = static_cast<MemoryFile*>(user);
        if (file->position >= file->size) {
            return 0;
        }
        sf_count_t n = std::min(count, file->size - file->position);
        std::memcpy(ptr, file->data + file->position, static_cast<size_t>(n));
        file->position += n;
        return n;
    }

    sf_count_t memWrite(const void* ptr, sf_count_t count, void* user) {
        MemoryFile* file = static_cast<MemoryFile*>(user);
        if (!file->sink) {
            return 0;
        }
        size_t end = static_cast<size_t>(file->position + count);
        if (end > file->sink->size()) {
            file->sink->resize(end);
        }
        std::memcpy(file->sink->data() + file->position, ptr, static_cast<size_t>(count));
        file->position += count;
        file->data = file->sink->data();
        file->size = static_cast<sf_count_t>(file->sink->size());
        return count;
    }

    sf_count_t memTell(void* user) {
        return static_cast<MemoryFile*>(user)->position;
    }

    // Pull every frame out of an open handle, then close it
    DecodedAudio readAll(SNDFILE* sf, const SF_INFO& info, int target_rate, const std::string& source) {
        if (info.channels <= 0 || info.samplerate <= 0) {
            sf_close(sf);
            throw DecodeError("Invalid audio parameters in " + source);
        }

        std::vector<float> interleaved(static_cast<size_t>(info.frames) * info.channels);
        sf_count_t frames_read = sf_readf_float(sf, interleaved.data(), info.frames);
        sf_close(sf);

        if (frames_read <= 0) {
            throw DecodeError("No audio frames in " + source);
        }
        interleaved.resize(static_cast<size_t>(frames_read) * info.channels);

        DecodedAudio audio;
        audio.source_rate = info.samplerate;
        audio.source_channels = info.channels;
        audio.major_format = info.format & SF_FORMAT_TYPEMASK;
        audio.samples = resampleLinear(downmixToMono(interleaved, info.channels), info.samplerate, target_rate);
        return audio;
    }

    SF_VIRTUAL_IO memoryIo() {
        SF_VIRTUAL_IO io;
        io.get_filelen = memGetLength;
        io.seek = memSeek;
        io.read = memRead;
        io.write = memWrite;
        io.tell = memTell;
        return io;
    }
}

DecodedAudio decodeAudioBytes(const std::vector<uint8_t>& bytes, int target_rate) {
    if (bytes.empty()) {
        throw DecodeError("Empty audio sample");
    }

    MemoryFile file{bytes.data(), static_cast<sf_count_t>(bytes.size()), 0, nullptr};
    SF_VIRTUAL_IO io = memoryIo();
    SF_INFO info;
    std::memset(&info, 0, sizeof(info));

    SNDFILE* sf = sf_open_virtual(&io, SFM_READ, &info, &file);
    if (!sf) {
        throw DecodeError(std::string("Unreadable audio sample: ") + sf_strerror(nullptr));
    }
    return readAll(sf, info, target_rate, "audio sample");
}

DecodedAudio loadAudioFile(const std::string& path, int target_rate) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PersistenceError("Cannot open " + path);
    }
    in.close();

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &info);
    if (!sf) {
        throw DecodeError(path + ": " + sf_strerror(nullptr));
    }
    return readAll(sf, info, target_rate, path);
}

std::vector<uint8_t> encodeWav(const std::vector<float>& samples, int sample_rate) {
    std::vector<uint8_t> out;
    MemoryFile file{nullptr, 0, 0, &out};
    SF_VIRTUAL_IO io = memoryIo();

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = sample_rate;
    info.channels = 1;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    SNDFILE* sf = sf_open_virtual(&io, SFM_WRITE, &info, &file);
    if (!sf) {
        throw PersistenceError(std::string("Cannot encode WAV: ") + sf_strerror(nullptr));
    }
    sf_count_t written = sf_writef_float(sf, samples.data(), static_cast<sf_count_t>(samples.size()));
    sf_close(sf);

    if (written != static_cast<sf_count_t>(samples.size())) {
        throw PersistenceError("Short write while encoding WAV");
    }
    return out;
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PersistenceError("Cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw PersistenceError("Read failed for " + path);
    }
    return bytes;
}

void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot create " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw PersistenceError("Write failed for " + path);
    }
}

std::vector<float> resampleLinear(const std::vector<float>& input, int input_rate, int output_rate) {
    if (input_rate == output_rate || input.empty() || input_rate <= 0 || output_rate <= 0) {
        return input;
    }

    double ratio = static_cast<double>(input_rate) / static_cast<double>(output_rate);
    size_t output_length = static_cast<size_t>(std::floor(static_cast<double>(input.size()) / ratio));
    std::vector<float> output(output_length);

    for (size_t i = 0; i < output_length; ++i) {
        double src_pos = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - static_cast<double>(idx);
        if (idx + 1 < input.size()) {
            output[i] = static_cast<float>((1.0 - frac) * input[idx] + frac * input[idx + 1]);
        } else {
            output[i] = input[std::min(idx, input.size() - 1)];
        }
    }
    return output;
}

std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }

    size_t frames = interleaved.size() / static_cast<size_t>(channels);
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[f * channels + ch];
        }
        mono[f] = sum / channels;
    }
    return mono;
}

std::string extensionForFormat(int major_format) {
    switch (major_format) {
        case SF_FORMAT_FLAC:
            return ".flac";
        case SF_FORMAT_OGG:
            return ".ogg";
        case SF_FORMAT_AIFF:
            return ".aiff";
        default:
            return ".wav";
    }
}

bool isAudioExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".wav" || ext == ".flac" || ext == ".ogg" || ext == ".aiff" || ext == ".aif";
}

} // namespace voiceguard
