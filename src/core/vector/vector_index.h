#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace cr {

// HNSW inner-product index over L2-normalized vectors. Labels are assigned
// sequentially from 0 and double as the dense vector ids.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;  // 1 - inner product
    };

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        std::string modelId = "unknown";
        std::string generationId = "v1";
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool configure(const IndexMetadata& metadata);
    bool create(int initialCapacity = kInitialCapacity);
    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath) const;

    // Returns the new label, or UINT64_MAX on failure.
    uint64_t addVector(const float* embedding);

    std::vector<KnnResult> search(const float* queryVector, int k) const;

    int totalElements() const;
    bool isAvailable() const;
    uint64_t nextLabel() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

private:
    bool ensureCapacityForOneMore();

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    uint64_t m_nextLabel = 0;
    mutable std::mutex m_mutex;
};

} // namespace cr
