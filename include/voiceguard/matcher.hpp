#ifndef VOICEGUARD_MATCHER_HPP
#define VOICEGUARD_MATCHER_HPP

#include "voiceguard/call_event.hpp"
#include "voiceguard/reference_voice.hpp"

#include <string>
#include <vector>

namespace voiceguard {

// Dot product over the product of L2 norms. 0 when either vector has
// zero norm or the dimensions differ.
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

struct MatchResult {
    std::string caller;     // matched name, or kUnknownCaller
    float confidence;       // best similarity, clamped to [0, 1]
    CallStatus status;
    int best_index;         // index of the best reference, -1 if none

    MatchResult() : caller(kUnknownCaller), confidence(0.0f), status(CallStatus::Blocked), best_index(-1) {}
};

// Picks the most similar reference and applies the threshold.
// Ties keep the earliest reference in `references`.
MatchResult match(const std::vector<float>& live,
                  const std::vector<ReferenceVoice>& references,
                  float threshold);

} // namespace voiceguard

#endif // VOICEGUARD_MATCHER_HPP
