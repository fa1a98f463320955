#pragma once

#include <QString>

#include <vector>

namespace cr {

// Borrowed capability: "given a text, return its vector". Implementations
// return an empty vector when the model is unavailable or inference fails.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const QString& text) = 0;
    virtual int dimensions() const = 0;
};

// L2-normalize so inner product equals cosine similarity. A zero vector is
// returned unchanged.
std::vector<float> normalizeEmbedding(std::vector<float> embedding);

} // namespace cr
