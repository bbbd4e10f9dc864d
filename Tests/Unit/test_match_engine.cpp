#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "catalog_fixture.h"
#include "core/index/catalog_store.h"
#include "core/match/match_engine.h"

#include <chrono>
#include <thread>

using pm::test::makeProduct;

namespace {

constexpr double kNow = 1750000000.0;
constexpr double kDay = 86400.0;

pm::TrainingExample makeExample(int64_t id, const QString& productId, const QString& text,
                                pm::MatchQuality quality = pm::MatchQuality::Excellent,
                                double approvedAt = kNow - kDay)
{
    pm::TrainingExample example;
    example.id = id;
    example.scope = pm::defaultScope();
    example.queryText = text;
    example.normalizedText = pm::TextNormalizer::normalize(text);
    example.productId = productId;
    example.quality = quality;
    example.confidence = 1.0;
    example.approvedAt = approvedAt;
    return example;
}

pm::SnapshotPtr buildSnapshot(std::vector<pm::TrainingExample> examples = {})
{
    pm::CatalogSnapshot::Contents contents;
    contents.scope = pm::defaultScope();
    contents.products = pm::test::fastenerCatalog();
    contents.examples = std::move(examples);
    return pm::CatalogSnapshot::build(std::move(contents), 1);
}

bool scoresInUnitRange(const pm::MatchCandidate& c)
{
    for (const double v : {c.scores.trigram, c.scores.fuzzy, c.scores.alias, c.scores.learned,
                           c.scores.vector, c.finalScore}) {
        if (v < 0.0 || v > 1.0) {
            return false;
        }
    }
    return true;
}

class SlowProvider : public pm::EmbeddingProvider {
public:
    std::optional<std::vector<float>> embed(const QString&) override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return std::vector<float>{1.0f, 0.0f};
    }
};

} // namespace

class TestMatchEngine : public QObject {
    Q_OBJECT

private slots:
    void init();

    // Tiers in isolation
    void testTrainingExactTier();
    void testTrainingGoodTier();
    void testTrainingTiersIgnoreLowQualityAndStale();
    void testTrainingExactMatchesLiteralText();
    void testAlgorithmicTier();
    void testAlgorithmicRespectsThreshold();
    void testFallbackRaisesToThreshold();

    // match()
    void testBlankQueryReturnsEmpty();
    void testMissingStoreIsCatalogUnavailable();
    void testTrainingExactIsExclusive();
    void testUnrelatedQueryHasNoTier();
    void testResultsBoundedAndOrdered();
    void testLimitAndThresholdClamped();
    void testRepeatedQueryServedFromCache();
    void testApplyTrainingExamplePublishesNewVersion();
    void testTimeoutDiscardsCandidates();

    // matchBatch()
    void testBatchPreservesInputOrder();
    void testBatchWorkerCount();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<pm::CatalogStore> m_store;
};

void TestMatchEngine::init()
{
    m_store.reset();
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = pm::test::openSeededStore(m_dir->path() + "/catalog.db", pm::test::fastenerCatalog());
    QVERIFY(m_store.has_value());
}

void TestMatchEngine::testTrainingExactTier()
{
    pm::MatchEngine engine(nullptr);
    engine.setClock([] { return kNow; });
    auto snapshot = buildSnapshot({makeExample(11, QStringLiteral("p-cap-g8"),
                                               QStringLiteral("gr 8 hx hd cap scr 5/16-18x2-1/2"))});

    const auto candidates = engine.runTier(pm::MatchTier::TrainingExact,
                                           pm::prepareQuery(QStringLiteral("GR 8 HX HD CAP SCR 5/16-18X2-1/2")),
                                           *snapshot, 10, 0.3);
    QCOMPARE(candidates.size(), size_t(1));
    const pm::MatchCandidate& c = candidates.front();
    QCOMPARE(c.productId, QStringLiteral("p-cap-g8"));
    QCOMPARE(c.finalScore, 1.0);
    QCOMPARE(c.scores.trigram, 1.0);
    QCOMPARE(c.scores.vector, 1.0);
    QCOMPARE(c.matchedVia(), QStringLiteral("training_exact"));
    QVERIFY(c.trainingExampleId.has_value());
    QCOMPARE(*c.trainingExampleId, int64_t(11));
}

void TestMatchEngine::testTrainingGoodTier()
{
    pm::MatchEngine engine(nullptr);
    engine.setClock([] { return kNow; });
    auto snapshot = buildSnapshot({makeExample(3, QStringLiteral("p-gloves"),
                                               QStringLiteral("nitrile gloves large"))});

    // 19 of 22 trigrams shared.
    const auto query = pm::prepareQuery(QStringLiteral("nitrile glove large"));
    QVERIFY(engine.runTier(pm::MatchTier::TrainingExact, query, *snapshot, 10, 0.3).empty());

    const auto candidates = engine.runTier(pm::MatchTier::TrainingGood, query, *snapshot, 10, 0.3);
    QCOMPARE(candidates.size(), size_t(1));
    const double similarity = 19.0 / 22.0;
    const double expected = 0.85 + (similarity - 0.80) / 0.15 * 0.10;
    QVERIFY(qAbs(candidates.front().finalScore - expected) < 1e-9);
    QVERIFY(candidates.front().finalScore >= 0.85);
    QVERIFY(candidates.front().finalScore < 0.95);
    QCOMPARE(candidates.front().matchedVia(), QStringLiteral("training_good"));
}

void TestMatchEngine::testTrainingExactMatchesLiteralText()
{
    pm::MatchEngine engine(nullptr);
    engine.setClock([] { return kNow; });

    // Normalized form written before abbreviation expansion existed.
    pm::TrainingExample legacy = makeExample(21, QStringLiteral("p-cap-g5"),
                                             QStringLiteral("gr 5 hx hd cap scr 5/16-18"));
    legacy.normalizedText = QStringLiteral("gr 5 hx hd cap scr");
    auto snapshot = buildSnapshot({legacy});

    const auto query = pm::prepareQuery(QStringLiteral("GR 5 HX HD CAP SCR 5/16-18"));
    QVERIFY(query.normalized != legacy.normalizedText);

    const auto candidates = engine.runTier(pm::MatchTier::TrainingExact, query, *snapshot, 10, 0.3);
    QCOMPARE(candidates.size(), size_t(1));
    QCOMPARE(candidates.front().productId, QStringLiteral("p-cap-g5"));
    QCOMPARE(*candidates.front().trainingExampleId, int64_t(21));
}

void TestMatchEngine::testTrainingTiersIgnoreLowQualityAndStale()
{
    pm::MatchEngine engine(nullptr);
    engine.setClock([] { return kNow; });
    const auto query = pm::prepareQuery(QStringLiteral("safety goggles"));

    auto fair = buildSnapshot({makeExample(1, QStringLiteral("p-goggles"),
                                           QStringLiteral("safety goggles"),
                                           pm::MatchQuality::Fair)});
    QVERIFY(engine.runTier(pm::MatchTier::TrainingExact, query, *fair, 10, 0.3).empty());

    auto stale = buildSnapshot({makeExample(2, QStringLiteral("p-goggles"),
                                            QStringLiteral("safety goggles"),
                                            pm::MatchQuality::Excellent,
                                            kNow - 400 * kDay)});
    QVERIFY(engine.runTier(pm::MatchTier::TrainingExact, query, *stale, 10, 0.3).empty());

    auto orphan = buildSnapshot({makeExample(3, QStringLiteral("p-retired"),
                                             QStringLiteral("safety goggles"))});
    QVERIFY(engine.runTier(pm::MatchTier::TrainingExact, query, *orphan, 10, 0.3).empty());
}

void TestMatchEngine::testAlgorithmicTier()
{
    pm::MatchEngine engine(nullptr);
    auto snapshot = buildSnapshot();

    const auto candidates = engine.runTier(pm::MatchTier::Algorithmic,
                                           pm::prepareQuery(QStringLiteral("Safety Goggles Clear Lens")),
                                           *snapshot, 10, 0.3);
    QVERIFY(!candidates.empty());
    const pm::MatchCandidate& top = candidates.front();
    QCOMPARE(top.productId, QStringLiteral("p-goggles"));
    QCOMPARE(top.scores.trigram, 1.0);
    QCOMPARE(top.scores.fuzzy, 1.0);
    // Default weights: trigram 0.40 + fuzzy 0.25.
    QVERIFY(qAbs(top.finalScore - 0.65) < 1e-9);
    QVERIFY(!top.dominantSignal.isEmpty());
    QVERIFY(top.reasoning.contains(QStringLiteral("dominant signal")));
    for (const auto& c : candidates) {
        QVERIFY(c.finalScore >= 0.3);
        QCOMPARE(c.matchedVia(), QStringLiteral("algorithmic"));
    }
}

void TestMatchEngine::testAlgorithmicRespectsThreshold()
{
    pm::MatchEngine engine(nullptr);
    auto snapshot = buildSnapshot();
    QVERIFY(engine.runTier(pm::MatchTier::Algorithmic,
                           pm::prepareQuery(QStringLiteral("Safety Goggles Clear Lens")),
                           *snapshot, 10, 0.99).empty());
}

void TestMatchEngine::testFallbackRaisesToThreshold()
{
    pm::MatchEngine engine(nullptr);
    auto snapshot = buildSnapshot();
    const auto query = pm::prepareQuery(QStringLiteral("gs-010"));

    QVERIFY(engine.runTier(pm::MatchTier::Algorithmic, query, *snapshot, 10, 0.3).empty());

    const auto candidates = engine.runTier(pm::MatchTier::FallbackFuzzy, query, *snapshot, 10, 0.3);
    QVERIFY(!candidates.empty());
    QStringList ids;
    for (const auto& c : candidates) {
        ids.append(c.productId);
        QCOMPARE(c.finalScore, 0.3);
        QCOMPARE(c.matchedVia(), QStringLiteral("fallback_fuzzy"));
        QVERIFY(c.reasoning.contains(QStringLiteral("relaxed")));
    }
    QVERIFY(ids.contains(QStringLiteral("p-goggles")));
}

void TestMatchEngine::testBlankQueryReturnsEmpty()
{
    pm::MatchEngine engine(nullptr);
    pm::MatchQuery query;
    query.text = QStringLiteral("   ");
    const auto outcome = engine.match(query);
    QVERIFY(outcome.ok());
    QVERIFY(outcome.candidates.empty());
    QVERIFY(!outcome.tier.has_value());
}

void TestMatchEngine::testMissingStoreIsCatalogUnavailable()
{
    pm::MatchEngine engine(nullptr);
    pm::MatchQuery query;
    query.text = QStringLiteral("safety goggles");
    const auto outcome = engine.match(query);
    QVERIFY(outcome.status == pm::MatchStatus::CatalogUnavailable);
    QVERIFY(outcome.candidates.empty());
}

void TestMatchEngine::testTrainingExactIsExclusive()
{
    auto example = makeExample(0, QStringLiteral("p-cap-g8"), QStringLiteral("cap screw gr8 5/16"));
    example.approvedAt = kNow - kDay;
    QVERIFY(m_store->upsertTrainingExample(example).has_value());

    pm::MatchEngine engine(&*m_store);
    engine.setClock([] { return kNow; });

    pm::MatchQuery query;
    query.text = QStringLiteral("Cap Screw GR8 5/16");
    const auto outcome = engine.match(query);
    QVERIFY(outcome.ok());
    QVERIFY(outcome.tier == pm::MatchTier::TrainingExact);
    QCOMPARE(outcome.candidates.size(), size_t(1));
    for (const auto& c : outcome.candidates) {
        QVERIFY(c.tier == pm::MatchTier::TrainingExact);
        QCOMPARE(c.finalScore, 1.0);
    }
    QCOMPARE(outcome.candidates.front().sku, QStringLiteral("56X212C8"));
}

void TestMatchEngine::testUnrelatedQueryHasNoTier()
{
    pm::MatchEngine engine(&*m_store);
    pm::MatchQuery query;
    query.text = QStringLiteral("zzzz");
    const auto outcome = engine.match(query);
    QVERIFY(outcome.ok());
    QVERIFY(outcome.candidates.empty());
    QVERIFY(!outcome.tier.has_value());
}

void TestMatchEngine::testResultsBoundedAndOrdered()
{
    pm::MatchEngine engine(&*m_store);
    const QStringList texts = {
        QStringLiteral("hex head cap screw 5/16-18"),
        QStringLiteral("flat washer"),
        QStringLiteral("3M"),
        QStringLiteral("gs-010"),
    };

    for (const QString& text : texts) {
        for (const int limit : {1, 2, 10}) {
            pm::MatchQuery query;
            query.text = text;
            query.limit = limit;
            query.threshold = 0.2;
            const auto outcome = engine.match(query);
            QVERIFY(outcome.ok());
            QVERIFY(static_cast<int>(outcome.candidates.size()) <= limit);
            for (size_t i = 0; i < outcome.candidates.size(); ++i) {
                const auto& c = outcome.candidates[i];
                QVERIFY(scoresInUnitRange(c));
                QVERIFY(outcome.tier == c.tier);
                if (i > 0) {
                    QVERIFY(outcome.candidates[i - 1].finalScore >= c.finalScore);
                }
            }
        }
    }
}

void TestMatchEngine::testLimitAndThresholdClamped()
{
    QCOMPARE(pm::MatchEngine::clampLimit(0), 1);
    QCOMPARE(pm::MatchEngine::clampLimit(-5), 1);
    QCOMPARE(pm::MatchEngine::clampLimit(1000), 100);
    QCOMPARE(pm::MatchEngine::clampThreshold(-0.5), 0.0);
    QCOMPARE(pm::MatchEngine::clampThreshold(1.5), 1.0);

    pm::MatchEngine engine(&*m_store);
    pm::MatchQuery query;
    query.text = QStringLiteral("hex head cap screw");
    query.limit = 0;
    query.threshold = -1.0;
    const auto outcome = engine.match(query);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.candidates.size(), size_t(1));
}

void TestMatchEngine::testRepeatedQueryServedFromCache()
{
    pm::MatchEngine engine(&*m_store);
    pm::MatchQuery query;
    query.text = QStringLiteral("duct tape silver");

    const auto first = engine.match(query);
    QVERIFY(!first.fromCache);
    QVERIFY(!first.candidates.empty());

    query.text = QStringLiteral("  DUCT TAPE   silver ");
    const auto second = engine.match(query);
    QVERIFY(second.fromCache);
    QCOMPARE(second.snapshotVersion, first.snapshotVersion);
    QCOMPARE(second.candidates.size(), first.candidates.size());
    QCOMPARE(second.candidates.front().productId, first.candidates.front().productId);
}

void TestMatchEngine::testApplyTrainingExamplePublishesNewVersion()
{
    pm::MatchEngine engine(&*m_store);
    engine.setClock([] { return kNow; });

    pm::MatchQuery query;
    query.text = QStringLiteral("eye protection clear");
    const auto before = engine.match(query);
    QVERIFY(before.tier != pm::MatchTier::TrainingExact);

    auto stored = m_store->upsertTrainingExample(
        makeExample(0, QStringLiteral("p-goggles"), QStringLiteral("eye protection clear")));
    QVERIFY(stored.has_value());
    engine.applyTrainingExample(*stored);

    const auto after = engine.match(query);
    QVERIFY(!after.fromCache);
    QVERIFY(after.snapshotVersion > before.snapshotVersion);
    QVERIFY(after.tier == pm::MatchTier::TrainingExact);
    QCOMPARE(after.candidates.front().productId, QStringLiteral("p-goggles"));
}

void TestMatchEngine::testTimeoutDiscardsCandidates()
{
    pm::MatchEngineOptions options;
    options.embeddingEnabled = true;
    pm::MatchEngine engine(&*m_store, options, std::make_shared<SlowProvider>());
    QVERIFY(engine.snapshot(pm::defaultScope()) != nullptr);

    pm::MatchQuery query;
    query.text = QStringLiteral("safety goggles");
    query.timeoutMs = 50;
    const auto outcome = engine.match(query);
    QVERIFY(outcome.status == pm::MatchStatus::TimedOut);
    QVERIFY(outcome.candidates.empty());
    QVERIFY(!outcome.tier.has_value());

    // A timed-out result is never cached.
    query.timeoutMs = 0;
    QVERIFY(!engine.match(query).fromCache);
}

void TestMatchEngine::testBatchPreservesInputOrder()
{
    pm::MatchEngineOptions options;
    options.batchWorkers = 4;
    pm::MatchEngine engine(&*m_store, options);

    const QStringList texts = {
        QStringLiteral("nitrile gloves large"),
        QString(),
        QStringLiteral("flat washer 5/16"),
        QStringLiteral("zzzz"),
        QStringLiteral("duct tape"),
        QStringLiteral("safety goggles"),
    };
    const auto results = engine.matchBatch(texts, 3, 0.3);
    QCOMPARE(results.size(), size_t(texts.size()));

    for (int i = 0; i < texts.size(); ++i) {
        const auto& r = results[static_cast<size_t>(i)];
        QCOMPARE(r.queryIndex, i);
        QCOMPARE(r.queryText, texts.at(i));
        QVERIFY(r.outcome.ok());
        QVERIFY(r.outcome.candidates.size() <= 3);
    }
    QCOMPARE(results[0].outcome.candidates.front().productId, QStringLiteral("p-gloves"));
    QVERIFY(results[1].outcome.candidates.empty());
    QCOMPARE(results[2].outcome.candidates.front().productId, QStringLiteral("p-washer"));
    QVERIFY(results[3].outcome.candidates.empty());
    QCOMPARE(results[5].outcome.candidates.front().productId, QStringLiteral("p-goggles"));

    QVERIFY(engine.matchBatch({}).empty());
}

void TestMatchEngine::testBatchWorkerCount()
{
    pm::MatchEngineOptions three;
    three.batchWorkers = 3;
    pm::MatchEngine engine(nullptr, three);
    QCOMPARE(engine.batchWorkerCount(10), 3);
    QCOMPARE(engine.batchWorkerCount(2), 2);
    QCOMPARE(engine.batchWorkerCount(0), 1);

    pm::MatchEngineOptions many;
    many.batchWorkers = 50;
    pm::MatchEngine wide(nullptr, many);
    QCOMPARE(wide.batchWorkerCount(100), 8);

    pm::MatchEngine automatic(nullptr);
    QVERIFY(automatic.batchWorkerCount(100) >= 1);
    QVERIFY(automatic.batchWorkerCount(100) <= 8);
}

QTEST_MAIN(TestMatchEngine)
#include "test_match_engine.moc"
