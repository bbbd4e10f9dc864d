#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "catalog_fixture.h"
#include "core/feedback/feedback_recorder.h"
#include "core/index/catalog_store.h"
#include "core/match/match_engine.h"

namespace {

constexpr double kNow = 1750000000.0;

pm::FeedbackRecorder::Approval approval(const QString& text, const QString& productId,
                                        pm::MatchQuality quality = pm::MatchQuality::Excellent)
{
    pm::FeedbackRecorder::Approval a;
    a.lineItemText = text;
    a.productId = productId;
    a.quality = quality;
    a.confidence = 1.0;
    return a;
}

} // namespace

class TestFeedbackRecorder : public QObject {
    Q_OBJECT

private slots:
    void init()
    {
        m_store.reset();
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
        m_store = pm::test::openSeededStore(m_dir->path() + "/catalog.db",
                                            pm::test::fastenerCatalog());
        QVERIFY(m_store.has_value());
    }

    void testApprovalStoresTrainingExample()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        recorder.setClock([] { return kNow; });

        auto a = approval(QStringLiteral("  Nitrile Gloves LG  "), QStringLiteral("p-gloves"),
                          pm::MatchQuality::Good);
        a.scores = pm::SignalScores{0.7, 0.6, 0.0, 0.0, 0.0};
        a.finalScore = 0.55;

        auto stored = recorder.recordApproval(a);
        QVERIFY(stored.has_value());
        QVERIFY(stored->id > 0);
        QCOMPARE(stored->queryText, QStringLiteral("Nitrile Gloves LG"));
        QCOMPARE(stored->productSku, QStringLiteral("NG-200"));
        QCOMPARE(stored->productName, QStringLiteral("Nitrile Gloves Large"));
        QCOMPARE(stored->approvedAt, kNow);
        QCOMPARE(stored->finalScore, 0.55);
        QCOMPARE(stored->scores.trigram, 0.7);
        QVERIFY(stored->quality == pm::MatchQuality::Good);
    }

    void testRepeatedApprovalIsIdempotent()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        auto first = recorder.recordApproval(approval(QStringLiteral("duct tape 48mm"),
                                                      QStringLiteral("p-tape")));
        auto second = recorder.recordApproval(approval(QStringLiteral("DUCT TAPE  48mm"),
                                                       QStringLiteral("p-tape")));
        QVERIFY(first.has_value());
        QVERIFY(second.has_value());
        QCOMPARE(second->id, first->id);
        QCOMPARE(m_store->loadTrainingExamples(pm::defaultScope())->size(), size_t(1));
        QCOMPARE(m_store->loadAliases(pm::defaultScope())->size(), size_t(1));
    }

    void testRejectsInvalidApprovals()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        QVERIFY(!recorder.recordApproval(approval(QStringLiteral("   "),
                                                  QStringLiteral("p-tape"))).has_value());
        QVERIFY(!recorder.recordApproval(approval(QStringLiteral("duct tape"),
                                                  QString())).has_value());
        QVERIFY(!recorder.recordApproval(approval(QStringLiteral("duct tape"),
                                                  QStringLiteral("p-unknown"))).has_value());

        auto wrongScope = approval(QStringLiteral("duct tape"), QStringLiteral("p-tape"));
        wrongScope.scope = QStringLiteral("other-tenant");
        QVERIFY(!recorder.recordApproval(wrongScope).has_value());

        pm::FeedbackRecorder detached(nullptr);
        QVERIFY(!detached.recordApproval(approval(QStringLiteral("duct tape"),
                                                  QStringLiteral("p-tape"))).has_value());
        QCOMPARE(m_store->loadTrainingExamples(pm::defaultScope())->size(), size_t(0));
    }

    void testHighQualityApprovalCreatesAlias()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        auto a = approval(QStringLiteral("SG Goggles Clr"), QStringLiteral("p-goggles"));
        a.finalScore = 0.72;
        QVERIFY(recorder.recordApproval(a).has_value());

        auto aliases = m_store->loadAliases(pm::defaultScope());
        QVERIFY(aliases.has_value());
        QCOMPARE(aliases->size(), size_t(1));
        QCOMPARE(aliases->front().productId, QStringLiteral("p-goggles"));
        QCOMPARE(aliases->front().competitorName, QStringLiteral("SG Goggles Clr"));
        QCOMPARE(aliases->front().confidence, 0.72);
    }

    void testAliasConfidenceFallsBackToApproval()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        auto a = approval(QStringLiteral("flat washer 5/16 zinc"), QStringLiteral("p-washer"),
                          pm::MatchQuality::Good);
        a.confidence = 0.6;
        QVERIFY(recorder.recordApproval(a).has_value());
        QCOMPARE(m_store->loadAliases(pm::defaultScope())->front().confidence, 0.6);
    }

    void testNoAliasForLowQualityOrShortText()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        QVERIFY(recorder.recordApproval(approval(QStringLiteral("duct tape silver"),
                                                 QStringLiteral("p-tape"),
                                                 pm::MatchQuality::Fair)).has_value());
        QVERIFY(recorder.recordApproval(approval(QStringLiteral("tpe"),
                                                 QStringLiteral("p-tape"))).has_value());
        QCOMPARE(m_store->loadAliases(pm::defaultScope())->size(), size_t(0));
        QCOMPARE(m_store->loadTrainingExamples(pm::defaultScope())->size(), size_t(2));

        QVERIFY(!pm::FeedbackRecorder::qualifiesForAlias(
            approval(QStringLiteral(" ab "), QStringLiteral("p-tape"))));
        QVERIFY(pm::FeedbackRecorder::qualifiesForAlias(
            approval(QStringLiteral("abcd"), QStringLiteral("p-tape"))));
    }

    void testApprovalVisibleToNextMatch()
    {
        pm::MatchEngine engine(&*m_store);
        engine.setClock([] { return kNow; });
        pm::FeedbackRecorder recorder(&*m_store, &engine);

        pm::MatchQuery query;
        query.text = QStringLiteral("ppe eye shield clr");
        const auto before = engine.match(query);
        QVERIFY(before.tier != pm::MatchTier::TrainingExact);

        auto stored = recorder.recordApproval(approval(query.text, QStringLiteral("p-goggles")));
        QVERIFY(stored.has_value());
        QCOMPARE(stored->approvedAt, kNow);

        const auto after = engine.match(query);
        QVERIFY(after.tier == pm::MatchTier::TrainingExact);
        QCOMPARE(after.candidates.front().productId, QStringLiteral("p-goggles"));
        QCOMPARE(*after.candidates.front().trainingExampleId, stored->id);
    }

    void testTouchReference()
    {
        pm::FeedbackRecorder recorder(&*m_store);
        recorder.setClock([] { return kNow; });
        auto stored = recorder.recordApproval(approval(QStringLiteral("nitrile gloves"),
                                                       QStringLiteral("p-gloves")));
        QVERIFY(stored.has_value());

        QVERIFY(recorder.touchReference(stored->id));
        auto reloaded = m_store->getTrainingExample(stored->id);
        QVERIFY(reloaded.has_value());
        QCOMPARE(reloaded->timesReferenced, 1);
        QCOMPARE(reloaded->lastReferencedAt.value_or(0.0), kNow);

        QVERIFY(!recorder.touchReference(999999));
    }

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<pm::CatalogStore> m_store;
};

QTEST_MAIN(TestFeedbackRecorder)
#include "test_feedback_recorder.moc"
