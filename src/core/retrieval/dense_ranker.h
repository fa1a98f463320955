#pragma once

#include "core/shared/retrieval_types.h"

#include <QString>

#include <vector>

namespace cr {

class DenseIndex;
class EmbeddingProvider;

struct DenseRankerConfig {
    // Neighbours below this cosine similarity are dropped before ranks are
    // assigned, so they never occupy a fusion rank.
    double minSimilarity = 0.15;
};

// Adapter from the borrowed embedding/index capability to ranked hits.
// Never fails the pipeline: an unready index or failed embedding yields an
// empty result.
class DenseRanker {
public:
    DenseRanker(EmbeddingProvider* embedder, const DenseIndex* index,
                DenseRankerConfig config = {});

    bool isAvailable() const;

    // Throws std::invalid_argument when k <= 0. When given, *degraded is set
    // to true if the index was unavailable or the query could not be
    // embedded, and to false otherwise.
    std::vector<ScoredHit> search(const QString& query, int k, bool* degraded = nullptr) const;

private:
    EmbeddingProvider* m_embedder = nullptr;  // Borrowed
    const DenseIndex* m_index = nullptr;      // Borrowed
    DenseRankerConfig m_config;
};

} // namespace cr
