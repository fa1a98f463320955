#include <QtTest/QtTest>
#include "core/answer/answer_orchestrator.h"
#include "core/retrieval/index_generation.h"
#include "fake_providers.h"

#include <memory>
#include <stdexcept>

using cr::test::HashBagEmbedder;
using cr::test::InMemoryDenseIndex;
using cr::test::ScriptedGenerationProvider;
using cr::test::makePassage;

namespace {

const QString kQuestion = QStringLiteral("How many days of annual leave do employees receive?");
const QString kAnnualText = QStringLiteral("Employees receive twenty days of annual leave each year.");

} // namespace

class TestAnswerOrchestrator : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRefusesWithoutGeneration();
    void testRefusesWithoutEvidence();
    void testRefusalOverride();
    void testAnswersWithLimitedCitations();
    void testAppendsRefusalWhenUncited();
    void testDegradesOnGenerationFailure();
    void testDegradesOnForeignGenerationFailure();
    void testHiddenCitationsAreStripped();
    void testHybridRetrievalIsBounded();
    void testDenseOnlyModeSkipsSparse();
    void testDenseOnlyModeFallsBackToSparse();
    void testDenseOnlyModeFallsBackWhenEmbeddingFails();
    void testStreamRefusalIsSingleFragment();
    void testStreamIsLazy();
    void testStreamFailureMidwayDegrades();
    void testStreamFailureAtStartDegrades();
    void testStreamForeignFailureDegrades();
    void testStreamHiddenCitations();
    void testRejectsInvalidConstruction();
    void testPromptEmbedsQuestionAndContext();

private:
    void publishCorpus(const std::vector<cr::Passage>& corpus);
    static std::vector<cr::Passage> policyCorpus();

    std::unique_ptr<HashBagEmbedder> m_embedder;
    std::shared_ptr<InMemoryDenseIndex> m_dense;
    std::unique_ptr<ScriptedGenerationProvider> m_generator;
    std::unique_ptr<cr::IndexGenerationHandle> m_handle;
};

std::vector<cr::Passage> TestAnswerOrchestrator::policyCorpus()
{
    return {
        makePassage(QStringLiteral("leave.md"), {QStringLiteral("Leave"), QStringLiteral("Annual")}, 0,
                    kAnnualText),
        makePassage(QStringLiteral("leave.md"), {QStringLiteral("Leave"), QStringLiteral("Sick")}, 0,
                    QStringLiteral("Sick leave requires a doctor note after three days.")),
        makePassage(QStringLiteral("travel.md"), {QStringLiteral("Booking")}, 0,
                    QStringLiteral("Book flights through the corporate travel portal.")),
        makePassage(QStringLiteral("security.md"), {}, 0,
                    QStringLiteral("Rotate passwords every ninety days.")),
    };
}

void TestAnswerOrchestrator::init()
{
    m_embedder = std::make_unique<HashBagEmbedder>();
    m_dense = std::make_shared<InMemoryDenseIndex>(m_embedder->dimensions());
    m_generator = std::make_unique<ScriptedGenerationProvider>();
    m_handle = std::make_unique<cr::IndexGenerationHandle>();
}

void TestAnswerOrchestrator::cleanup()
{
    m_handle.reset();
    m_generator.reset();
    m_dense.reset();
    m_embedder.reset();
}

void TestAnswerOrchestrator::publishCorpus(const std::vector<cr::Passage>& corpus)
{
    for (const cr::Passage& passage : corpus) {
        m_dense->add(passage, m_embedder->embed(passage.text));
    }
    auto generation = std::make_shared<cr::IndexGeneration>();
    generation->generationId = QStringLiteral("test");
    generation->denseIndex = m_dense;
    generation->sparseRanker = std::make_shared<const cr::SparseRanker>(corpus);
    m_handle->publish(generation);
}

void TestAnswerOrchestrator::testRefusesWithoutGeneration()
{
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());
    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Refused);
    QCOMPARE(answer.text, cr::RagSettings{}.refusalMessage);
    QCOMPARE(m_generator->totalCalls(), 0);
}

void TestAnswerOrchestrator::testRefusesWithoutEvidence()
{
    publishCorpus({});
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::RetrievalResult retrieval = orchestrator.retrieve(kQuestion);
    QVERIFY(retrieval.denseHits.empty());
    QVERIFY(retrieval.sparseHits.empty());
    QVERIFY(retrieval.hits.empty());

    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Refused);
    QCOMPARE(answer.text, orchestrator.settings().refusalMessage);
    QVERIFY(answer.hits.empty());
    QVERIFY(answer.rawText.isEmpty());
    QCOMPARE(m_generator->totalCalls(), 0);
}

void TestAnswerOrchestrator::testRefusalOverride()
{
    publishCorpus(policyCorpus());
    m_dense->setReady(false);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::AnswerOptions options;
    options.refusalOverride = QStringLiteral("Please ask the people team.");
    const cr::GeneratedAnswer answer = orchestrator.answer(QStringLiteral("zebra quantum"), options);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Refused);
    QCOMPARE(answer.text, QStringLiteral("Please ask the people team."));
    QCOMPARE(m_generator->totalCalls(), 0);
}

void TestAnswerOrchestrator::testAnswersWithLimitedCitations()
{
    publishCorpus(policyCorpus());
    m_generator->setResponse(QStringLiteral(
        "  Employees receive twenty days [source: leave.md §Leave > Annual]. "
        "See also [source: a.md], [source: b.md] and [source: c.md].  "));
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Answered);
    QCOMPARE(m_generator->completeCalls(), 1);
    QCOMPARE(static_cast<int>(answer.citations.size()), 3);
    QCOMPARE(answer.citations.first(), QStringLiteral("[source: leave.md §Leave > Annual]"));
    QVERIFY(answer.text.contains(QStringLiteral("[source: b.md]")));
    QVERIFY(!answer.text.contains(QStringLiteral("c.md")));
    QVERIFY(answer.text.endsWith(QStringLiteral("and .")));
    QVERIFY(answer.rawText.contains(QStringLiteral("[source: c.md]")));
    QVERIFY(!answer.hits.empty());
    QVERIFY(answer.context.contains(QStringLiteral("[source: leave.md §Leave > Annual]")));
    QVERIFY(answer.context.size() <= orchestrator.settings().maxContextChars);
}

void TestAnswerOrchestrator::testAppendsRefusalWhenUncited()
{
    publishCorpus(policyCorpus());
    m_generator->setResponse(QStringLiteral("Twenty days per year."));
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Unverified);
    QCOMPARE(answer.text, QStringLiteral("Twenty days per year.\n\n") + orchestrator.settings().refusalMessage);
    QVERIFY(answer.citations.isEmpty());

    m_generator->setResponse(QStringLiteral("   "));
    const cr::GeneratedAnswer blank = orchestrator.answer(kQuestion);
    QVERIFY(blank.outcome == cr::AnswerOutcome::Unverified);
    QCOMPARE(blank.text, orchestrator.settings().refusalMessage);
}

void TestAnswerOrchestrator::testDegradesOnGenerationFailure()
{
    publishCorpus(policyCorpus());
    m_generator->failNext(1, 500);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Degraded);
    QCOMPARE(answer.text, orchestrator.settings().degradedMessage);
    QCOMPARE(m_generator->completeCalls(), 1);
    QVERIFY(!answer.context.isEmpty());
}

void TestAnswerOrchestrator::testDegradesOnForeignGenerationFailure()
{
    publishCorpus(policyCorpus());
    m_generator->setForeignFailures(true);
    m_generator->failNext(1, 500);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::GeneratedAnswer answer;
    bool escaped = false;
    try {
        answer = orchestrator.answer(kQuestion);
    } catch (const cr::test::ForeignFailure&) {
        escaped = true;
    }
    QVERIFY(!escaped);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Degraded);
    QCOMPARE(answer.text, orchestrator.settings().degradedMessage);
    QCOMPARE(m_generator->completeCalls(), 1);
}

void TestAnswerOrchestrator::testHiddenCitationsAreStripped()
{
    publishCorpus(policyCorpus());
    m_generator->setResponse(QStringLiteral("Twenty days [source: leave.md §Leave > Annual]  per year."));
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::AnswerOptions options;
    options.showCitations = false;
    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion, options);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Answered);
    QCOMPARE(answer.text, QStringLiteral("Twenty days per year."));
    QCOMPARE(static_cast<int>(answer.citations.size()), 1);
}

void TestAnswerOrchestrator::testHybridRetrievalIsBounded()
{
    publishCorpus(policyCorpus());
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::RetrievalResult retrieval = orchestrator.retrieve(kQuestion);
    QVERIFY(!retrieval.sparseHits.empty());
    QVERIFY(!retrieval.hits.empty());
    QVERIFY(!retrieval.usedFallback);
    QVERIFY(static_cast<int>(retrieval.hits.size()) <= orchestrator.settings().fusedTopK);
    QCOMPARE(retrieval.hits.front().passage.text, kAnnualText);
    for (size_t i = 0; i < retrieval.hits.size(); ++i) {
        QCOMPARE(retrieval.hits[i].rank, static_cast<int>(i) + 1);
    }
}

void TestAnswerOrchestrator::testDenseOnlyModeSkipsSparse()
{
    publishCorpus(policyCorpus());
    cr::RagSettings settings;
    settings.hybridRetrieval = false;
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get(),
                                              settings);

    const cr::RetrievalResult retrieval = orchestrator.retrieve(kAnnualText);
    QVERIFY(retrieval.sparseHits.empty());
    QVERIFY(!retrieval.denseHits.empty());
    QCOMPARE(retrieval.hits.front().passage.text, kAnnualText);
    QVERIFY(retrieval.hits.front().denseScore.has_value());
    QVERIFY(!retrieval.hits.front().sparseScore.has_value());
}

void TestAnswerOrchestrator::testDenseOnlyModeFallsBackToSparse()
{
    publishCorpus(policyCorpus());
    m_dense->setReady(false);
    cr::RagSettings settings;
    settings.hybridRetrieval = false;
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get(),
                                              settings);

    const cr::RetrievalResult retrieval = orchestrator.retrieve(kQuestion);
    QVERIFY(retrieval.denseHits.empty());
    QVERIFY(!retrieval.sparseHits.empty());
    QVERIFY(!retrieval.hits.empty());
    QCOMPARE(retrieval.hits.front().passage.text, kAnnualText);
}

void TestAnswerOrchestrator::testDenseOnlyModeFallsBackWhenEmbeddingFails()
{
    publishCorpus(policyCorpus());
    cr::RagSettings settings;
    settings.hybridRetrieval = false;
    m_generator->setResponse(QStringLiteral("Twenty days [source: leave.md §Leave > Annual]"));
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get(),
                                              settings);

    m_embedder->setThrowing(true);
    const cr::RetrievalResult retrieval = orchestrator.retrieve(kQuestion);
    QVERIFY(retrieval.denseDegraded);
    QVERIFY(retrieval.denseHits.empty());
    QVERIFY(!retrieval.sparseHits.empty());
    QCOMPARE(retrieval.hits.front().passage.text, kAnnualText);

    m_embedder->setThrowing(false);
    m_embedder->setFailing(true);
    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(answer.outcome == cr::AnswerOutcome::Answered);
    QCOMPARE(m_generator->completeCalls(), 1);

    m_embedder->setFailing(false);
    QVERIFY(!orchestrator.retrieve(kAnnualText).denseDegraded);
}

void TestAnswerOrchestrator::testStreamRefusalIsSingleFragment()
{
    publishCorpus({});
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::FragmentStream stream = orchestrator.answerStream(kQuestion);
    QCOMPARE(stream.next().value_or(QString()), orchestrator.settings().refusalMessage);
    QVERIFY(!stream.next().has_value());
    QCOMPARE(m_generator->totalCalls(), 0);
}

void TestAnswerOrchestrator::testStreamIsLazy()
{
    publishCorpus(policyCorpus());
    m_generator->setStreamFragments({QStringLiteral("Twenty "), QStringLiteral("days "),
                                     QStringLiteral("[source: leave.md §Leave > Annual]")});
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    {
        cr::FragmentStream stream = orchestrator.answerStream(kQuestion);
        QCOMPARE(m_generator->streamCalls(), 0);
        QCOMPARE(m_generator->fragmentsPulled(), 0);

        QCOMPARE(stream.next().value_or(QString()), QStringLiteral("Twenty "));
        QCOMPARE(m_generator->streamCalls(), 1);
        QCOMPARE(m_generator->fragmentsPulled(), 1);
    }
    QCOMPARE(m_generator->fragmentsPulled(), 1);
    QCOMPARE(m_generator->completeCalls(), 0);

    cr::FragmentStream full = orchestrator.answerStream(kQuestion);
    QCOMPARE(full.collect(),
             QStringLiteral("Twenty days [source: leave.md §Leave > Annual]"));
}

void TestAnswerOrchestrator::testStreamFailureMidwayDegrades()
{
    publishCorpus(policyCorpus());
    m_generator->setStreamFragments({QStringLiteral("Twenty "), QStringLiteral("days")});
    m_generator->setStreamFailAfter(1);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::FragmentStream stream = orchestrator.answerStream(kQuestion);
    QCOMPARE(stream.next().value_or(QString()), QStringLiteral("Twenty "));
    QCOMPARE(stream.next().value_or(QString()), orchestrator.settings().degradedMessage);
    QVERIFY(!stream.next().has_value());
}

void TestAnswerOrchestrator::testStreamFailureAtStartDegrades()
{
    publishCorpus(policyCorpus());
    m_generator->setStreamFailOnStart(true);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    cr::FragmentStream stream = orchestrator.answerStream(kQuestion);
    QCOMPARE(stream.next().value_or(QString()), orchestrator.settings().degradedMessage);
    QVERIFY(!stream.next().has_value());
    QCOMPARE(m_generator->streamCalls(), 1);
}

void TestAnswerOrchestrator::testStreamForeignFailureDegrades()
{
    publishCorpus(policyCorpus());
    m_generator->setForeignFailures(true);
    m_generator->setStreamFragments({QStringLiteral("Twenty "), QStringLiteral("days")});
    m_generator->setStreamFailAfter(1);
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    QStringList midway;
    QStringList atStart;
    bool escaped = false;
    try {
        cr::FragmentStream stream = orchestrator.answerStream(kQuestion);
        while (std::optional<QString> fragment = stream.next()) {
            midway.append(*fragment);
        }

        m_generator->setStreamFailOnStart(true);
        cr::FragmentStream refused = orchestrator.answerStream(kQuestion);
        while (std::optional<QString> fragment = refused.next()) {
            atStart.append(*fragment);
        }
    } catch (const cr::test::ForeignFailure&) {
        escaped = true;
    }

    QVERIFY(!escaped);
    QCOMPARE(midway, QStringList({QStringLiteral("Twenty "), orchestrator.settings().degradedMessage}));
    QCOMPARE(atStart, QStringList{orchestrator.settings().degradedMessage});
    QCOMPARE(m_generator->streamCalls(), 2);
}

void TestAnswerOrchestrator::testStreamHiddenCitations()
{
    publishCorpus(policyCorpus());
    m_generator->setStreamFragments({QStringLiteral("Twenty "), QStringLiteral("days "),
                                     QStringLiteral("[source: leave"), QStringLiteral(".md]"),
                                     QStringLiteral(" yearly.")});
    cr::RagSettings settings;
    settings.streamSuppressionBatch = 2;
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get(),
                                              settings);

    cr::AnswerOptions options;
    options.showCitations = false;
    cr::FragmentStream stream = orchestrator.answerStream(kQuestion, options);
    QCOMPARE(stream.collect(), QStringLiteral("Twenty days  yearly."));
}

void TestAnswerOrchestrator::testRejectsInvalidConstruction()
{
    cr::RagSettings invalid;
    invalid.maxContextChars = 0;

    bool thrown = false;
    try {
        cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get(),
                                            invalid);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    QVERIFY(thrown);

    // A missing embedder is allowed: retrieval is sparse-only.
    publishCorpus(policyCorpus());
    const cr::AnswerOrchestrator sparseOnly(m_handle.get(), nullptr, m_generator.get());
    QVERIFY(!sparseOnly.retrieve(kQuestion).hits.empty());
}

void TestAnswerOrchestrator::testPromptEmbedsQuestionAndContext()
{
    publishCorpus(policyCorpus());
    m_generator->setResponse(QStringLiteral("Twenty days [source: leave.md §Leave > Annual]."));
    const cr::AnswerOrchestrator orchestrator(m_handle.get(), m_embedder.get(), m_generator.get());

    const cr::GeneratedAnswer answer = orchestrator.answer(kQuestion);
    QVERIFY(m_generator->lastPrompt().contains(kQuestion));
    QVERIFY(m_generator->lastPrompt().contains(answer.context));
    QVERIFY(m_generator->lastSystemInstruction().contains(QStringLiteral("1-3 citations")));
    QCOMPARE(m_generator->lastSystemInstruction(), cr::AnswerOrchestrator::systemInstruction(3));
}

QTEST_MAIN(TestAnswerOrchestrator)
#include "test_answer_orchestrator.moc"
