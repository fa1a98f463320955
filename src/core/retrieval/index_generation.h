#pragma once

#include "core/retrieval/sparse_ranker.h"
#include "core/shared/passage.h"
#include "core/shared/settings.h"

#include <QString>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace cr {

class DenseIndex;
class EmbeddingProvider;

struct IndexStats {
    bool present = false;
    QString generationId;
    int passages = 0;
    int vectors = 0;
    int dimensions = 0;
    QString modelId;
};

// One self-consistent snapshot of the corpus indexes. Dense and sparse
// sides are always published together.
struct IndexGeneration {
    QString generationId;
    std::shared_ptr<const DenseIndex> denseIndex;      // null when no dense index
    std::shared_ptr<const SparseRanker> sparseRanker;  // null when no corpus

    IndexStats stats() const;

    // Builds both sides over the same corpus. Source ids are reduced to file
    // names first so dense and sparse hits for one passage share a key.
    // A failed dense build still yields a sparse-only generation.
    static std::shared_ptr<const IndexGeneration> build(const QString& generationId,
                                                        std::vector<Passage> corpus,
                                                        EmbeddingProvider* embedder,
                                                        const RagSettings& settings);
};

// Single-writer, multi-reader handle on the current generation. Readers take
// one snapshot per query and keep it alive for as long as they use it.
class IndexGenerationHandle {
public:
    using Builder = std::function<std::shared_ptr<const IndexGeneration>()>;

    IndexGenerationHandle() = default;
    explicit IndexGenerationHandle(std::shared_ptr<const IndexGeneration> initial);

    IndexGenerationHandle(const IndexGenerationHandle&) = delete;
    IndexGenerationHandle& operator=(const IndexGenerationHandle&) = delete;

    std::shared_ptr<const IndexGeneration> current() const;
    void publish(std::shared_ptr<const IndexGeneration> generation);
    void reset();

    // Runs the builder and publishes its result on success. Returns false
    // without waiting when another rebuild is in progress, and false (keeping
    // the current generation) when the builder fails.
    bool rebuild(const Builder& builder);
    bool isRebuilding() const;

    IndexStats stats() const;

private:
    std::shared_ptr<const IndexGeneration> m_current;  // std::atomic_load / atomic_store only
    std::mutex m_rebuildMutex;
    std::atomic<bool> m_rebuilding{false};
};

} // namespace cr
