#pragma once

#include "core/answer/context_assembler.h"
#include "core/answer/fragment_stream.h"
#include "core/shared/retrieval_types.h"
#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace cr {

class EmbeddingProvider;
class GenerationProvider;
class IndexGenerationHandle;

enum class AnswerOutcome {
    Answered,    // generated with at least one citation
    Unverified,  // generated without citations; refusal text appended
    Refused,     // no evidence retrieved; generation never invoked
    Degraded,    // generation failed
};

struct AnswerOptions {
    std::optional<QString> refusalOverride;
    bool showCitations = true;
};

struct GeneratedAnswer {
    AnswerOutcome outcome = AnswerOutcome::Refused;
    QString rawText;       // model output before guarding; empty unless generated
    QString text;          // final user-visible answer
    QStringList citations; // distinct markers kept in text
    std::vector<FusedHit> hits;
    QString context;
};

struct RetrievalResult {
    std::vector<ScoredHit> denseHits;
    std::vector<ScoredHit> sparseHits;
    std::vector<FusedHit> hits;
    bool usedFallback = false;
    bool denseDegraded = false;  // dense side unready or query embedding failed
};

// Drives retrieve -> assemble -> generate -> guard for one question. All
// failures are absorbed here and surface as one of the configured messages.
// Safe to call concurrently: every query reads one generation snapshot.
class AnswerOrchestrator {
public:
    // Throws std::invalid_argument for invalid settings or a null handle or
    // generator. A null embedder means sparse-only retrieval.
    AnswerOrchestrator(const IndexGenerationHandle* indexes,
                       EmbeddingProvider* embedder,
                       GenerationProvider* generator,
                       RagSettings settings = {});

    RetrievalResult retrieve(const QString& question) const;

    GeneratedAnswer answer(const QString& question, const AnswerOptions& options = {}) const;

    // Retrieval and assembly run before returning; generation starts on the
    // first pull. Citation limits are not applied while streaming. With
    // citations hidden, markers are stripped in batches.
    FragmentStream answerStream(const QString& question, const AnswerOptions& options = {}) const;

    const RagSettings& settings() const { return m_settings; }

    static QString systemInstruction(int maxCitations);
    static QString buildPrompt(const QString& question, const QString& context, int maxCitations);

private:
    const IndexGenerationHandle* m_indexes = nullptr;  // Borrowed
    EmbeddingProvider* m_embedder = nullptr;           // Borrowed
    GenerationProvider* m_generator = nullptr;         // Borrowed
    RagSettings m_settings;
    ContextAssembler m_assembler;
};

} // namespace cr
