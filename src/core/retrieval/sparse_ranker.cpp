#include "core/retrieval/sparse_ranker.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <stdexcept>

namespace cr {

SparseRanker::SparseRanker(std::vector<Passage> corpus, Bm25Config config)
    : m_corpus(std::move(corpus))
    , m_config(config)
{
    m_termCounts.reserve(m_corpus.size());
    m_lengths.reserve(m_corpus.size());

    std::unordered_map<QString, int, QStringHash> documentFrequency;
    int64_t totalLength = 0;
    for (const Passage& passage : m_corpus) {
        TermCounts counts;
        const std::vector<QString> tokens = tokenize(passage.text);
        for (const QString& token : tokens) {
            ++counts[token];
        }
        for (const auto& [term, _] : counts) {
            ++documentFrequency[term];
        }
        totalLength += static_cast<int64_t>(tokens.size());
        m_lengths.push_back(static_cast<int>(tokens.size()));
        m_termCounts.push_back(std::move(counts));
    }

    if (!m_corpus.empty()) {
        m_averageLength = static_cast<double>(totalLength) / static_cast<double>(m_corpus.size());
    }
    buildIdf(documentFrequency);

    LOG_DEBUG(crRetrieval, "SparseRanker built: passages=%d terms=%d avgLength=%.2f",
              static_cast<int>(m_corpus.size()), static_cast<int>(m_idf.size()), m_averageLength);
}

std::vector<QString> SparseRanker::tokenize(const QString& text)
{
    static const QRegularExpression tokenRegex(QStringLiteral("[a-z0-9_]+"));

    std::vector<QString> tokens;
    const QString lowered = text.toLower();
    QRegularExpressionMatchIterator it = tokenRegex.globalMatch(lowered);
    while (it.hasNext()) {
        tokens.push_back(it.next().captured(0));
    }
    return tokens;
}

void SparseRanker::buildIdf(const std::unordered_map<QString, int, QStringHash>& documentFrequency)
{
    const double corpusSize = static_cast<double>(m_corpus.size());
    double idfSum = 0.0;
    std::vector<QString> negativeTerms;

    m_idf.reserve(documentFrequency.size());
    for (const auto& [term, frequency] : documentFrequency) {
        const double df = static_cast<double>(frequency);
        const double value = std::log(corpusSize - df + 0.5) - std::log(df + 0.5);
        m_idf[term] = value;
        idfSum += value;
        if (value < 0.0) {
            negativeTerms.push_back(term);
        }
    }

    if (m_idf.empty()) {
        return;
    }

    const double averageIdf = idfSum / static_cast<double>(m_idf.size());
    const double floorIdf = m_config.epsilon * averageIdf;
    for (const QString& term : negativeTerms) {
        m_idf[term] = floorIdf;
    }
}

std::vector<double> SparseRanker::scores(const QString& query) const
{
    std::vector<double> result(m_corpus.size(), 0.0);
    if (m_corpus.empty() || m_averageLength <= 0.0) {
        return result;
    }

    const std::vector<QString> queryTokens = tokenize(query);
    for (const QString& token : queryTokens) {
        const auto idfIt = m_idf.find(token);
        if (idfIt == m_idf.end()) {
            continue;
        }
        const double idfValue = idfIt->second;

        for (size_t i = 0; i < m_corpus.size(); ++i) {
            const auto countIt = m_termCounts[i].find(token);
            if (countIt == m_termCounts[i].end()) {
                continue;
            }
            const double tf = static_cast<double>(countIt->second);
            const double lengthRatio = static_cast<double>(m_lengths[i]) / m_averageLength;
            const double denominator =
                tf + m_config.k1 * (1.0 - m_config.b + m_config.b * lengthRatio);
            result[i] += idfValue * (tf * (m_config.k1 + 1.0)) / denominator;
        }
    }
    return result;
}

std::vector<ScoredHit> SparseRanker::search(const QString& query, int k) const
{
    if (k <= 0) {
        throw std::invalid_argument("SparseRanker::search requires k > 0");
    }

    std::vector<ScoredHit> hits;
    if (m_corpus.empty()) {
        return hits;
    }

    const std::vector<double> raw = scores(query);
    std::vector<size_t> order(raw.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&raw](size_t lhs, size_t rhs) {
        return raw[lhs] > raw[rhs];
    });

    for (const size_t index : order) {
        if (static_cast<int>(hits.size()) >= k) {
            break;
        }
        const double score = raw[index];
        // Sorted descending: nothing after this can pass the floor either.
        if (score <= 0.0 || score < m_config.minScore) {
            break;
        }
        ScoredHit hit;
        hit.passage = m_corpus[index];
        hit.key = hit.passage.key();
        hit.score = score;
        hit.rank = static_cast<int>(hits.size()) + 1;
        hits.push_back(std::move(hit));
    }

    LOG_DEBUG(crRetrieval, "SparseRanker: %d hits (k=%d)", static_cast<int>(hits.size()), k);
    return hits;
}

int SparseRanker::passageCount() const
{
    return static_cast<int>(m_corpus.size());
}

double SparseRanker::averageLength() const
{
    return m_averageLength;
}

double SparseRanker::idf(const QString& term) const
{
    const auto it = m_idf.find(term.toLower());
    return it != m_idf.end() ? it->second : 0.0;
}

const Bm25Config& SparseRanker::config() const
{
    return m_config;
}

} // namespace cr
