#include "core/answer/answer_orchestrator.h"
#include "core/answer/citation_guard.h"
#include "core/answer/generation_provider.h"
#include "core/retrieval/dense_ranker.h"
#include "core/retrieval/index_generation.h"
#include "core/retrieval/rank_fusion.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <memory>
#include <stdexcept>
#include <utility>

namespace cr {

namespace {

ContextConfig contextConfigFor(const RagSettings& settings)
{
    if (const auto invalid = SettingsManager::validate(settings)) {
        throw std::invalid_argument("AnswerOrchestrator: invalid setting "
                                    + invalid->toStdString());
    }
    ContextConfig config;
    config.maxChars = settings.maxContextChars;
    config.maxCitations = settings.maxContextCitations;
    return config;
}

} // namespace

AnswerOrchestrator::AnswerOrchestrator(const IndexGenerationHandle* indexes,
                                       EmbeddingProvider* embedder,
                                       GenerationProvider* generator,
                                       RagSettings settings)
    : m_indexes(indexes)
    , m_embedder(embedder)
    , m_generator(generator)
    , m_settings(std::move(settings))
    , m_assembler(contextConfigFor(m_settings))
{
    if (!m_indexes) {
        throw std::invalid_argument("AnswerOrchestrator requires an index generation handle");
    }
    if (!m_generator) {
        throw std::invalid_argument("AnswerOrchestrator requires a generation provider");
    }
}

RetrievalResult AnswerOrchestrator::retrieve(const QString& question) const
{
    RetrievalResult result;
    const std::shared_ptr<const IndexGeneration> generation = m_indexes->current();
    if (!generation) {
        LOG_WARN(crRetrieval, "No index generation published; nothing to retrieve");
        return result;
    }

    DenseRankerConfig denseConfig;
    denseConfig.minSimilarity = m_settings.minCosineSimilarity;
    const DenseRanker dense(m_embedder, generation->denseIndex.get(), denseConfig);
    result.denseHits = dense.search(question, m_settings.denseTopK, &result.denseDegraded);

    // Dense-only mode still degrades to sparse when the dense side cannot
    // serve this query.
    const bool runSparse = m_settings.hybridRetrieval || result.denseDegraded;
    if (runSparse && generation->sparseRanker) {
        result.sparseHits = generation->sparseRanker->search(question, m_settings.sparseTopK);
    }

    FusionConfig fusionConfig;
    fusionConfig.rrfK = m_settings.rrfK;
    fusionConfig.fusedTopK = m_settings.fusedTopK;
    result.hits = RankFusion::fuse(result.denseHits, result.sparseHits, fusionConfig);

    if (result.hits.empty()) {
        if (!result.denseHits.empty()) {
            result.hits = RankFusion::fromSingleList(result.denseHits, HitSource::Dense, fusionConfig);
            result.usedFallback = true;
        } else if (!result.sparseHits.empty()) {
            result.hits = RankFusion::fromSingleList(result.sparseHits, HitSource::Sparse, fusionConfig);
            result.usedFallback = true;
        }
    }

    LOG_DEBUG(crRetrieval, "Retrieve: generation=%s dense=%d sparse=%d hits=%d fallback=%d "
              "denseDegraded=%d",
              qUtf8Printable(generation->generationId),
              static_cast<int>(result.denseHits.size()),
              static_cast<int>(result.sparseHits.size()),
              static_cast<int>(result.hits.size()),
              result.usedFallback ? 1 : 0, result.denseDegraded ? 1 : 0);
    return result;
}

GeneratedAnswer AnswerOrchestrator::answer(const QString& question, const AnswerOptions& options) const
{
    GeneratedAnswer result;
    const QString refusal = options.refusalOverride.value_or(m_settings.refusalMessage);

    RetrievalResult retrieval = retrieve(question);
    result.hits = std::move(retrieval.hits);
    if (result.hits.empty()) {
        LOG_INFO(crAnswer, "No passages retrieved; refusing without generation");
        result.outcome = AnswerOutcome::Refused;
        result.text = refusal;
        return result;
    }

    const AssembledContext context = m_assembler.assemble(result.hits);
    if (context.isEmpty()) {
        LOG_INFO(crAnswer, "Assembled context is empty; refusing without generation");
        result.outcome = AnswerOutcome::Refused;
        result.text = refusal;
        return result;
    }
    result.context = context.text;

    const int maxCitations = m_settings.maxAnswerCitations;
    try {
        result.rawText = m_generator->complete(systemInstruction(maxCitations),
                                               buildPrompt(question, context.text, maxCitations));
    } catch (const GenerationError& e) {
        LOG_WARN(crAnswer, "Generation failed: %s", e.what());
        result.outcome = AnswerOutcome::Degraded;
        result.text = m_settings.degradedMessage;
        return result;
    } catch (const std::exception& e) {
        LOG_WARN(crAnswer, "Generation raised unexpected error: %s", e.what());
        result.outcome = AnswerOutcome::Degraded;
        result.text = m_settings.degradedMessage;
        return result;
    } catch (...) {
        LOG_WARN(crAnswer, "Generation raised a non-standard exception");
        result.outcome = AnswerOutcome::Degraded;
        result.text = m_settings.degradedMessage;
        return result;
    }

    QString guarded = result.rawText.trimmed();
    if (!CitationGuard::hasCitation(guarded)) {
        LOG_WARN(crAnswer, "Generated answer carries no citation; appending refusal text");
        result.outcome = AnswerOutcome::Unverified;
        guarded = guarded.isEmpty() ? refusal : guarded + QStringLiteral("\n\n") + refusal;
    } else {
        result.outcome = AnswerOutcome::Answered;
        guarded = CitationGuard::limitCitations(guarded, maxCitations, &result.citations).trimmed();
    }

    result.text = options.showCitations ? guarded : CitationGuard::stripCitations(guarded);
    return result;
}

FragmentStream AnswerOrchestrator::answerStream(const QString& question,
                                                const AnswerOptions& options) const
{
    const QString refusal = options.refusalOverride.value_or(m_settings.refusalMessage);

    const RetrievalResult retrieval = retrieve(question);
    if (retrieval.hits.empty()) {
        LOG_INFO(crAnswer, "No passages retrieved; streaming refusal");
        return FragmentStream::single(refusal);
    }

    const AssembledContext context = m_assembler.assemble(retrieval.hits);
    if (context.isEmpty()) {
        LOG_INFO(crAnswer, "Assembled context is empty; streaming refusal");
        return FragmentStream::single(refusal);
    }

    struct StreamState {
        GenerationProvider* generator = nullptr;
        QString systemInstruction;
        QString prompt;
        QString degradedMessage;
        FragmentStream upstream;
        bool started = false;
        bool done = false;
    };
    auto state = std::make_shared<StreamState>();
    state->generator = m_generator;
    state->systemInstruction = systemInstruction(m_settings.maxAnswerCitations);
    state->prompt = buildPrompt(question, context.text, m_settings.maxAnswerCitations);
    state->degradedMessage = m_settings.degradedMessage;

    FragmentStream generated([state]() -> std::optional<QString> {
        if (state->done) {
            return std::nullopt;
        }
        try {
            if (!state->started) {
                state->started = true;
                state->upstream = state->generator->completeStream(state->systemInstruction,
                                                                   state->prompt);
            }
            std::optional<QString> fragment = state->upstream.next();
            if (!fragment) {
                state->done = true;
            }
            return fragment;
        } catch (const GenerationError& e) {
            LOG_WARN(crAnswer, "Streaming generation failed: %s", e.what());
        } catch (const std::exception& e) {
            LOG_WARN(crAnswer, "Streaming generation raised unexpected error: %s", e.what());
        } catch (...) {
            LOG_WARN(crAnswer, "Streaming generation raised a non-standard exception");
        }
        state->done = true;
        return state->degradedMessage;
    });

    if (!options.showCitations) {
        return CitationGuard::suppressCitations(std::move(generated),
                                                m_settings.streamSuppressionBatch);
    }
    return generated;
}

QString AnswerOrchestrator::systemInstruction(int maxCitations)
{
    return QStringLiteral(
               "You are a document assistant.\n"
               "Follow these rules strictly:\n"
               "1) Use ONLY the provided CONTEXT. Do not use outside knowledge.\n"
               "2) Include 1-%1 citations in the exact form: [source: filename §Section].\n"
               "3) If the answer is not clearly supported, say you don't know and suggest "
               "contacting the document owners.")
        .arg(maxCitations);
}

QString AnswerOrchestrator::buildPrompt(const QString& question, const QString& context,
                                        int maxCitations)
{
    return QStringLiteral(
               "USER QUESTION:\n%1\n\n"
               "CONTEXT (from the documents):\n%2\n\n"
               "INSTRUCTIONS:\n"
               "- Answer ONLY based on the context above.\n"
               "- If not supported, say you don't know.\n"
               "- Always add 1-%3 citations like [source: filename §Section].\n")
        .arg(question, context, QString::number(maxCitations));
}

} // namespace cr
