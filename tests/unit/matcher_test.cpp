#include <cassert>
#include <cmath>
#include <vector>
#include "voiceguard/matcher.hpp"

using namespace voiceguard;

static bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) < eps; }

static ReferenceVoice voice(const std::string& name, std::vector<float> embedding) {
    ReferenceVoice v;
    v.name = name;
    v.embedding = std::move(embedding);
    return v;
}

int main() {
    std::vector<float> v{0.3f, -1.2f, 2.5f, 0.01f};
    std::vector<float> zero(4, 0.0f);

    // Similarity basics
    assert(near(cosineSimilarity(v, v), 1.0f));
    assert(cosineSimilarity(v, zero) == 0.0f);
    assert(cosineSimilarity(zero, zero) == 0.0f);
    assert(cosineSimilarity(v, std::vector<float>{1.0f, 2.0f}) == 0.0f);
    assert(cosineSimilarity({}, {}) == 0.0f);
    assert(near(cosineSimilarity({1, 0}, {0, 1}), 0.0f));
    assert(near(cosineSimilarity({1, 0}, {-1, 0}), -1.0f));
    assert(near(cosineSimilarity({2, 0}, {5, 0}), 1.0f));

    // No references: Blocked, Unknown, 0
    MatchResult empty = match(v, {}, 0.75f);
    assert(empty.status == CallStatus::Blocked);
    assert(empty.caller == kUnknownCaller);
    assert(empty.confidence == 0.0f);
    assert(empty.best_index == -1);

    // Exact match authorizes for any threshold up to 1
    std::vector<ReferenceVoice> refs{voice("A", v)};
    MatchResult a = match(v, refs, 0.75f);
    assert(a.status == CallStatus::Authorized);
    assert(a.caller == "A");
    assert(near(a.confidence, 1.0f));
    assert(match(v, refs, 0.999f).status == CallStatus::Authorized);

    // Best similarity 0.6 is below 0.75
    std::vector<ReferenceVoice> partial{voice("Mom", {1.0f, 0.0f})};
    std::vector<float> live{0.6f, 0.8f};
    MatchResult blocked = match(live, partial, 0.75f);
    assert(blocked.status == CallStatus::Blocked);
    assert(blocked.caller == "Unknown");
    assert(near(blocked.confidence, 0.6f));
    assert(blocked.best_index == 0);

    // Same input authorizes once the threshold drops
    MatchResult lowered = match(live, partial, 0.5f);
    assert(lowered.status == CallStatus::Authorized);
    assert(lowered.caller == "Mom");
    assert(match(live, partial, 0.0f).status == CallStatus::Authorized);

    // Highest similarity wins
    std::vector<ReferenceVoice> family{
        voice("Dad", {0.0f, 1.0f}),
        voice("Mom", {1.0f, 0.1f}),
        voice("Son", {1.0f, 1.0f}),
    };
    MatchResult best = match({1.0f, 0.0f}, family, 0.5f);
    assert(best.caller == "Mom");
    assert(best.best_index == 1);

    // Ties go to the first enrolled
    std::vector<ReferenceVoice> twins{voice("First", {1.0f, 0.0f}), voice("Second", {2.0f, 0.0f})};
    MatchResult tie = match({3.0f, 0.0f}, twins, 0.5f);
    assert(tie.caller == "First");
    assert(tie.best_index == 0);

    // Negative similarity reports confidence 0
    MatchResult opposite = match({-1.0f, 0.0f}, twins, 0.0f);
    assert(opposite.confidence == 0.0f);
    assert(opposite.confidence >= 0.0f && opposite.confidence <= 1.0f);

    // Dimension mismatch counts as no similarity
    MatchResult mismatch = match({1.0f, 0.0f, 0.0f}, twins, 0.1f);
    assert(mismatch.status == CallStatus::Blocked);
    assert(mismatch.confidence == 0.0f);

    return 0;
}
