#pragma once

#include "core/vector/dense_index.h"
#include "core/vector/vector_index.h"

#include <QString>

#include <memory>
#include <unordered_map>
#include <vector>

namespace cr {

class EmbeddingProvider;

// DenseIndex backed by an hnswlib inner-product index, with passages kept in
// memory and persisted to SQLite beside the index files.
//
// On-disk layout of a saved index directory:
//   vectors.hnsw        hnswlib graph
//   vectors.meta.json   dimensions, model id, generation id, counts
//   passages.db         SQLite table passages(vector_id, ...)
class HnswDenseIndex : public DenseIndex {
public:
    static constexpr const char* kIndexFileName = "vectors.hnsw";
    static constexpr const char* kMetaFileName = "vectors.meta.json";
    static constexpr const char* kPassageDbFileName = "passages.db";

    HnswDenseIndex();
    explicit HnswDenseIndex(const VectorIndex::IndexMetadata& metadata);
    ~HnswDenseIndex() override;

    HnswDenseIndex(const HnswDenseIndex&) = delete;
    HnswDenseIndex& operator=(const HnswDenseIndex&) = delete;

    // Embeds every passage and indexes it. Passages whose embedding fails
    // are skipped with a warning. Returns nullptr when nothing usable was
    // produced.
    static std::shared_ptr<HnswDenseIndex> build(const std::vector<Passage>& passages,
                                                 EmbeddingProvider* embedder,
                                                 VectorIndex::IndexMetadata metadata = {});

    bool create(int initialCapacity = VectorIndex::kInitialCapacity);
    bool addPassage(const Passage& passage, const std::vector<float>& embedding);

    bool save(const QString& directory) const;
    bool load(const QString& directory);

    bool isReady() const override;
    int dimensions() const override;
    int vectorCount() const override;
    QString modelId() const override;

    std::vector<Neighbor> nearest(const std::vector<float>& vector, int k) const override;
    std::optional<Passage> passageFor(uint64_t vectorId) const override;

private:
    std::unique_ptr<VectorIndex> m_index;
    std::unordered_map<uint64_t, Passage> m_passages;
};

} // namespace cr
