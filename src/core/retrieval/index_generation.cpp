#include "core/retrieval/index_generation.h"
#include "core/shared/logging.h"
#include "core/vector/dense_index.h"
#include "core/vector/hnsw_dense_index.h"

#include <exception>

namespace cr {

IndexStats IndexGeneration::stats() const
{
    IndexStats result;
    result.present = true;
    result.generationId = generationId;
    if (sparseRanker) {
        result.passages = sparseRanker->passageCount();
    }
    if (denseIndex && denseIndex->isReady()) {
        result.vectors = denseIndex->vectorCount();
        result.dimensions = denseIndex->dimensions();
        result.modelId = denseIndex->modelId();
    }
    return result;
}

std::shared_ptr<const IndexGeneration> IndexGeneration::build(const QString& generationId,
                                                              std::vector<Passage> corpus,
                                                              EmbeddingProvider* embedder,
                                                              const RagSettings& settings)
{
    for (Passage& passage : corpus) {
        passage.sourceId = normalizeSourceId(passage.sourceId);
    }

    auto generation = std::make_shared<IndexGeneration>();
    generation->generationId = generationId;

    VectorIndex::IndexMetadata metadata;
    metadata.generationId = generationId.toStdString();
    generation->denseIndex = HnswDenseIndex::build(corpus, embedder, metadata);
    if (!generation->denseIndex) {
        LOG_WARN(crIndex, "Generation %s has no dense index; sparse-only retrieval",
                 qUtf8Printable(generationId));
    }

    Bm25Config bm25;
    bm25.k1 = settings.bm25K1;
    bm25.b = settings.bm25B;
    bm25.epsilon = settings.bm25Epsilon;
    bm25.minScore = settings.bm25MinScore;
    generation->sparseRanker = std::make_shared<const SparseRanker>(std::move(corpus), bm25);

    return generation;
}

IndexGenerationHandle::IndexGenerationHandle(std::shared_ptr<const IndexGeneration> initial)
    : m_current(std::move(initial))
{
}

std::shared_ptr<const IndexGeneration> IndexGenerationHandle::current() const
{
    return std::atomic_load(&m_current);
}

void IndexGenerationHandle::publish(std::shared_ptr<const IndexGeneration> generation)
{
    const QString id = generation ? generation->generationId : QStringLiteral("<none>");
    std::atomic_store(&m_current, std::move(generation));
    LOG_INFO(crIndex, "Published index generation %s", qUtf8Printable(id));
}

void IndexGenerationHandle::reset()
{
    std::atomic_store(&m_current, std::shared_ptr<const IndexGeneration>());
}

bool IndexGenerationHandle::rebuild(const Builder& builder)
{
    std::unique_lock<std::mutex> lock(m_rebuildMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_WARN(crIndex, "Rebuild rejected: another rebuild is in progress");
        return false;
    }

    m_rebuilding.store(true);
    std::shared_ptr<const IndexGeneration> next;
    try {
        next = builder ? builder() : nullptr;
    } catch (const std::exception& e) {
        LOG_ERROR(crIndex, "Rebuild failed: %s", e.what());
        next.reset();
    }
    m_rebuilding.store(false);

    if (!next) {
        LOG_WARN(crIndex, "Rebuild produced no generation; keeping the current one");
        return false;
    }
    publish(std::move(next));
    return true;
}

bool IndexGenerationHandle::isRebuilding() const
{
    return m_rebuilding.load();
}

IndexStats IndexGenerationHandle::stats() const
{
    const std::shared_ptr<const IndexGeneration> generation = current();
    if (!generation) {
        return IndexStats{};
    }
    return generation->stats();
}

} // namespace cr
