#pragma once
#include "canon/Models.hpp"

namespace canon {

// Caller-side gate deciding whether a match is trusted enough to write back
// automatically. The matcher never consults it; swap policies freely.
struct AcceptancePolicy {
    double min_score = 0.70;
    Confidence min_tier = Confidence::Fuzzy;

    bool accepts(const MatchResult& r) const {
        return r.confidence >= min_tier && r.score >= min_score;
    }
};

}  // namespace canon
