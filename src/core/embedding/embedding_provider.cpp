#include "core/embedding/embedding_provider.h"

#include <cmath>

namespace cr {

std::vector<float> normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

} // namespace cr
