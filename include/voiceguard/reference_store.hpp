#ifndef VOICEGUARD_REFERENCE_STORE_HPP
#define VOICEGUARD_REFERENCE_STORE_HPP

#include "voiceguard/embedding_extractor.hpp"
#include "voiceguard/reference_voice.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voiceguard {

/**
 * @brief Enrolled voices, one sample file per name in a voices directory.
 *
 * The directory holds the raw enrollment samples plus an index file
 * (voices.json) recording display name, file and enrollment date in
 * enrollment order. Files without an index entry are picked up by name of
 * their stem.
 *
 * Readers take an immutable snapshot; enroll/remove/clear publish a new one.
 * The monitoring thread may read while an operator thread mutates.
 */
class ReferenceStore {
public:
    using Voices = std::vector<ReferenceVoice>;

    struct Options {
        std::string directory = "voices";
        std::string index_file = "voices.json";
        int sample_rate = 16000;
    };

    struct LoadError {
        std::string file;
        std::string message;
    };

    struct LoadReport {
        std::vector<std::string> loaded;
        std::vector<LoadError> errors;

        bool ok() const { return errors.empty(); }
    };

    ReferenceStore(EmbeddingExtractor& extractor, const Options& options);
    explicit ReferenceStore(EmbeddingExtractor& extractor);

    ReferenceStore(const ReferenceStore&) = delete;
    ReferenceStore& operator=(const ReferenceStore&) = delete;

    // Rebuild the mapping from every sample in `directory`, which becomes
    // the store's directory. Unreadable files end up in the report only.
    LoadReport load(const std::string& directory);
    LoadReport load() { return load(directory()); }

    // Decode, embed and persist a sample under `name`, replacing any
    // previous sample for that name. On failure the previous entry stays.
    // Throws ConfigurationError, DecodeError, ExtractionError, PersistenceError.
    void enroll(const std::string& name, const std::vector<uint8_t>& audio_bytes);

    // Drop one voice and its sample. False if the name is not enrolled.
    bool remove(const std::string& name);

    // Drop every voice and delete the samples. Irreversible.
    // Returns the number of sample files deleted.
    size_t clear();

    std::shared_ptr<const Voices> snapshot() const;
    std::vector<std::string> names() const;
    bool contains(const std::string& name) const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    std::string directory() const;

    // File name (inside the directory) a sample for `name` is stored under
    static std::string fileStemFor(const std::string& name);

private:
    std::string pickFileName(const std::string& name, const std::string& extension, const Voices& voices) const;
    void writeIndex(const std::string& directory, const Voices& voices) const;
    void publish(std::shared_ptr<const Voices> voices);

    EmbeddingExtractor& extractor_;
    Options options_;

    mutable std::mutex mutex_;   // guards voices_ and options_.directory
    std::mutex write_mutex_;     // one mutation at a time
    std::shared_ptr<const Voices> voices_;
};

} // namespace voiceguard

#endif // VOICEGUARD_REFERENCE_STORE_HPP
