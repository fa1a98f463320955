#pragma once

#include "core/shared/retrieval_types.h"

#include <vector>

namespace cr {

struct FusionConfig {
    int rrfK = 60;
    int fusedTopK = 3;
};

enum class HitSource {
    Dense,
    Sparse,
};

class RankFusion {
public:
    // Reciprocal Rank Fusion. Each list is already filtered and 1-based
    // ranked. A passage's fused score is the sum of 1 / (rrfK + rank) over
    // the lists that contain it. Ties prefer dense evidence, then the order
    // in which the passage was first seen (dense list before sparse).
    // Throws std::invalid_argument when fusedTopK <= 0.
    static std::vector<FusedHit> fuse(const std::vector<ScoredHit>& denseHits,
                                      const std::vector<ScoredHit>& sparseHits,
                                      FusionConfig config = {});

    // Wrap one raw ranked list as fused hits, keeping its order, scoring
    // each entry with its single-list RRF contribution.
    static std::vector<FusedHit> fromSingleList(const std::vector<ScoredHit>& hits,
                                                HitSource source,
                                                FusionConfig config = {});

    static double reciprocalRank(int rank, int rrfK);
};

} // namespace cr
