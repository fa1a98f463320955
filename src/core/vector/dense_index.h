#pragma once

#include "core/shared/passage.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace cr {

// Borrowed capability: nearest stored vectors for a query vector, and the
// association from each stored vector id back to its passage.
class DenseIndex {
public:
    struct Neighbor {
        uint64_t vectorId = 0;
        float similarity = 0.0f;  // cosine in [-1, 1] for normalized vectors
    };

    virtual ~DenseIndex() = default;

    virtual bool isReady() const = 0;
    virtual int dimensions() const = 0;
    virtual int vectorCount() const = 0;
    virtual QString modelId() const = 0;

    // Ordered by descending similarity; at most k entries.
    virtual std::vector<Neighbor> nearest(const std::vector<float>& vector, int k) const = 0;
    virtual std::optional<Passage> passageFor(uint64_t vectorId) const = 0;
};

} // namespace cr
