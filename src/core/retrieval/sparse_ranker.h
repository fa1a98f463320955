#pragma once

#include "core/shared/retrieval_types.h"

#include <QString>

#include <unordered_map>
#include <vector>

namespace cr {

struct Bm25Config {
    double k1 = 1.5;
    double b = 0.75;
    // Terms with negative IDF (present in most passages) score
    // epsilon * average IDF instead.
    double epsilon = 0.25;
    double minScore = 0.1;
};

// In-memory BM25 (Okapi) keyword index over one corpus snapshot. Built once;
// immutable afterwards, so concurrent searches need no locking.
class SparseRanker {
public:
    explicit SparseRanker(std::vector<Passage> corpus, Bm25Config config = {});

    SparseRanker(const SparseRanker&) = delete;
    SparseRanker& operator=(const SparseRanker&) = delete;

    // Lowercased runs of [a-z0-9_]; no stemming.
    static std::vector<QString> tokenize(const QString& text);

    // Hits with score >= minScore, descending, ranks 1..n, at most k.
    // Throws std::invalid_argument when k <= 0.
    std::vector<ScoredHit> search(const QString& query, int k) const;

    // Raw BM25 score of every passage, in corpus order.
    std::vector<double> scores(const QString& query) const;

    int passageCount() const;
    double averageLength() const;
    double idf(const QString& term) const;
    const Bm25Config& config() const;

private:
    using TermCounts = std::unordered_map<QString, int, QStringHash>;

    void buildIdf(const std::unordered_map<QString, int, QStringHash>& documentFrequency);

    std::vector<Passage> m_corpus;
    std::vector<TermCounts> m_termCounts;
    std::vector<int> m_lengths;
    std::unordered_map<QString, double, QStringHash> m_idf;
    double m_averageLength = 0.0;
    Bm25Config m_config;
};

} // namespace cr
