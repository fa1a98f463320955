#pragma once

#include "core/shared/passage.h"

#include <optional>

namespace cr {

// Candidate produced by one ranker. Rank is 1-based, by descending score
// within that ranker's own result set.
struct ScoredHit {
    PassageKey key;
    Passage passage;
    double score = 0.0;
    int rank = 0;
};

// Candidate after reciprocal rank fusion. A side that did not retrieve the
// passage leaves its score unset (not zero).
struct FusedHit {
    PassageKey key;
    Passage passage;
    std::optional<double> denseScore;
    std::optional<double> sparseScore;
    std::optional<int> denseRank;
    std::optional<int> sparseRank;
    double fusedScore = 0.0;
    int rank = 0;
};

} // namespace cr
