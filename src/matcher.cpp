#include "voiceguard/matcher.hpp"

#include <algorithm>
#include <cmath>

namespace voiceguard {

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double sim = dot / std::sqrt(norm_a * norm_b);
    if (!std::isfinite(sim)) {
        return 0.0f;
    }
    return static_cast<float>(std::max(-1.0, std::min(1.0, sim)));
}

MatchResult match(const std::vector<float>& live,
                  const std::vector<ReferenceVoice>& references,
                  float threshold) {
    MatchResult result;
    if (references.empty()) {
        return result;
    }

    float best = 0.0f;
    for (size_t i = 0; i < references.size(); ++i) {
        float sim = cosineSimilarity(live, references[i].embedding);
        // strict '>' keeps the first reference on ties
        if (result.best_index < 0 || sim > best) {
            best = sim;
            result.best_index = static_cast<int>(i);
        }
    }

    result.confidence = std::max(0.0f, std::min(1.0f, best));
    if (best >= threshold) {
        result.status = CallStatus::Authorized;
        result.caller = references[result.best_index].name;
    } else {
        result.status = CallStatus::Blocked;
        result.caller = kUnknownCaller;
    }
    return result;
}

} // namespace voiceguard
