#pragma once

#include <QString>

namespace cr {

struct RagSettings {
    // Retrieval
    bool hybridRetrieval = true;
    int denseTopK = 6;
    int sparseTopK = 20;
    double minCosineSimilarity = 0.15;
    double bm25MinScore = 0.1;

    // BM25 (Okapi)
    double bm25K1 = 1.5;
    double bm25B = 0.75;
    double bm25Epsilon = 0.25;

    // Fusion
    int rrfK = 60;
    int fusedTopK = 3;

    // Context assembly
    int maxContextChars = 2500;
    int maxContextCitations = 3;

    // Guardrails
    int maxAnswerCitations = 3;
    int streamSuppressionBatch = 5;

    // Generation retry policy
    int generationMaxRetries = 2;
    int generationBackoffMs = 1000;

    // User-visible terminal messages
    QString refusalMessage = QStringLiteral(
        "I cannot provide a verified answer from the documents. "
        "Please consult the document owners directly.");
    QString degradedMessage = QStringLiteral(
        "The answer engine had a temporary issue processing your request. "
        "Please try again, or ask a slightly shorter question.");
};

} // namespace cr
