#include "core/retrieval/dense_ranker.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"
#include "core/vector/dense_index.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace cr {

DenseRanker::DenseRanker(EmbeddingProvider* embedder, const DenseIndex* index,
                         DenseRankerConfig config)
    : m_embedder(embedder)
    , m_index(index)
    , m_config(config)
{
}

bool DenseRanker::isAvailable() const
{
    return m_embedder != nullptr && m_index != nullptr && m_index->isReady();
}

std::vector<ScoredHit> DenseRanker::search(const QString& query, int k, bool* degraded) const
{
    if (k <= 0) {
        throw std::invalid_argument("DenseRanker::search requires k > 0");
    }
    if (degraded) {
        *degraded = true;
    }

    std::vector<ScoredHit> hits;
    if (!isAvailable()) {
        LOG_WARN(crRetrieval, "DenseRanker: index unavailable, returning no dense hits");
        return hits;
    }

    std::vector<float> embedding;
    try {
        embedding = m_embedder->embed(query);
    } catch (const std::exception& e) {
        LOG_WARN(crRetrieval, "DenseRanker: embedding failed: %s", e.what());
        return hits;
    }

    if (embedding.empty() || static_cast<int>(embedding.size()) != m_index->dimensions()) {
        LOG_WARN(crRetrieval, "DenseRanker: unusable query embedding (size=%d, expected=%d)",
                 static_cast<int>(embedding.size()), m_index->dimensions());
        return hits;
    }
    embedding = normalizeEmbedding(std::move(embedding));
    if (degraded) {
        *degraded = false;
    }

    const std::vector<DenseIndex::Neighbor> neighbors = m_index->nearest(embedding, k);
    hits.reserve(neighbors.size());
    for (const DenseIndex::Neighbor& neighbor : neighbors) {
        if (static_cast<double>(neighbor.similarity) < m_config.minSimilarity) {
            continue;
        }
        std::optional<Passage> passage = m_index->passageFor(neighbor.vectorId);
        if (!passage) {
            LOG_WARN(crRetrieval, "DenseRanker: vector %llu has no passage",
                     static_cast<unsigned long long>(neighbor.vectorId));
            continue;
        }
        ScoredHit hit;
        hit.passage = std::move(*passage);
        hit.key = hit.passage.key();
        hit.score = static_cast<double>(neighbor.similarity);
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(), [](const ScoredHit& lhs, const ScoredHit& rhs) {
        return lhs.score > rhs.score;
    });
    if (static_cast<int>(hits.size()) > k) {
        hits.resize(static_cast<size_t>(k));
    }
    for (size_t i = 0; i < hits.size(); ++i) {
        hits[i].rank = static_cast<int>(i) + 1;
    }

    LOG_DEBUG(crRetrieval, "DenseRanker: %d hits of %d neighbours (k=%d)",
              static_cast<int>(hits.size()), static_cast<int>(neighbors.size()), k);
    return hits;
}

} // namespace cr
