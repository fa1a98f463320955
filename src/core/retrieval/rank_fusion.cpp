#include "core/retrieval/rank_fusion.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace cr {

namespace {

int effectiveRank(const ScoredHit& hit, size_t position)
{
    return hit.rank > 0 ? hit.rank : static_cast<int>(position) + 1;
}

void recordSide(FusedHit& fused, HitSource source, const ScoredHit& hit, int rank)
{
    if (source == HitSource::Dense) {
        fused.denseScore = hit.score;
        fused.denseRank = rank;
    } else {
        fused.sparseScore = hit.score;
        fused.sparseRank = rank;
    }
}

void accumulate(const std::vector<ScoredHit>& hits,
                HitSource source,
                int rrfK,
                std::vector<FusedHit>& fused,
                std::unordered_map<PassageKey, size_t, PassageKeyHash>& indexByKey)
{
    for (size_t i = 0; i < hits.size(); ++i) {
        const ScoredHit& hit = hits[i];
        const int rank = effectiveRank(hit, i);

        auto it = indexByKey.find(hit.key);
        if (it == indexByKey.end()) {
            FusedHit entry;
            entry.key = hit.key;
            entry.passage = hit.passage;
            indexByKey.emplace(hit.key, fused.size());
            fused.push_back(std::move(entry));
            it = indexByKey.find(hit.key);
        }

        FusedHit& entry = fused[it->second];
        const bool alreadySeen = source == HitSource::Dense
            ? entry.denseRank.has_value()
            : entry.sparseRank.has_value();
        if (alreadySeen) {
            // Only the best-ranked occurrence in one list counts.
            continue;
        }
        recordSide(entry, source, hit, rank);
        entry.fusedScore += RankFusion::reciprocalRank(rank, rrfK);
    }
}

} // namespace

double RankFusion::reciprocalRank(int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    const int denom = std::max(0, rrfK) + rank;
    return 1.0 / static_cast<double>(denom);
}

std::vector<FusedHit> RankFusion::fuse(const std::vector<ScoredHit>& denseHits,
                                       const std::vector<ScoredHit>& sparseHits,
                                       FusionConfig config)
{
    if (config.fusedTopK <= 0) {
        throw std::invalid_argument("RankFusion::fuse requires fusedTopK > 0");
    }

    std::vector<FusedHit> fused;
    fused.reserve(denseHits.size() + sparseHits.size());
    std::unordered_map<PassageKey, size_t, PassageKeyHash> indexByKey;
    indexByKey.reserve(denseHits.size() + sparseHits.size());

    accumulate(denseHits, HitSource::Dense, config.rrfK, fused, indexByKey);
    accumulate(sparseHits, HitSource::Sparse, config.rrfK, fused, indexByKey);

    std::stable_sort(fused.begin(), fused.end(), [](const FusedHit& lhs, const FusedHit& rhs) {
        if (lhs.fusedScore != rhs.fusedScore) {
            return lhs.fusedScore > rhs.fusedScore;
        }
        return lhs.denseScore.has_value() && !rhs.denseScore.has_value();
    });

    const size_t limit = static_cast<size_t>(config.fusedTopK);
    if (fused.size() > limit) {
        fused.resize(limit);
    }
    for (size_t i = 0; i < fused.size(); ++i) {
        fused[i].rank = static_cast<int>(i) + 1;
    }

    LOG_DEBUG(crRetrieval, "RankFusion: dense=%d sparse=%d fused=%d",
              static_cast<int>(denseHits.size()), static_cast<int>(sparseHits.size()),
              static_cast<int>(fused.size()));
    return fused;
}

std::vector<FusedHit> RankFusion::fromSingleList(const std::vector<ScoredHit>& hits,
                                                 HitSource source,
                                                 FusionConfig config)
{
    if (config.fusedTopK <= 0) {
        throw std::invalid_argument("RankFusion::fromSingleList requires fusedTopK > 0");
    }

    std::vector<FusedHit> result;
    const size_t limit = std::min(hits.size(), static_cast<size_t>(config.fusedTopK));
    result.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        const ScoredHit& hit = hits[i];
        const int rank = effectiveRank(hit, i);
        FusedHit entry;
        entry.key = hit.key;
        entry.passage = hit.passage;
        recordSide(entry, source, hit, rank);
        entry.fusedScore = reciprocalRank(rank, config.rrfK);
        entry.rank = static_cast<int>(i) + 1;
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace cr
