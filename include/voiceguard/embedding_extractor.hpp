#ifndef VOICEGUARD_EMBEDDING_EXTRACTOR_HPP
#define VOICEGUARD_EMBEDDING_EXTRACTOR_HPP

#include <vector>

namespace voiceguard {

/**
 * @brief Maps a mono waveform at the monitor's sample rate to a
 *        fixed-dimension speaker embedding.
 *
 * Called from the monitoring thread on every analysis cycle and from the
 * operator's thread on enrollment, so implementations must tolerate
 * concurrent calls. Failures are reported by throwing ExtractionError.
 */
class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    virtual std::vector<float> extract(const std::vector<float>& audio) = 0;

    // Length of the vectors extract() returns
    virtual int dimension() const = 0;
};

} // namespace voiceguard

#endif // VOICEGUARD_EMBEDDING_EXTRACTOR_HPP
