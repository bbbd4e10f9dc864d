#include <QtTest/QtTest>
#include "core/signals/edit_distance.h"

class TestEditDistance : public QObject {
    Q_OBJECT

private slots:
    void testLevenshtein();
    void testFuzzyScore();
    void testFuzzyCutoff();
    void testFuzzyEmptyInput();
    void testCompositeScore();
};

void TestEditDistance::testLevenshtein()
{
    QCOMPARE(pm::EditDistance::levenshtein(QStringLiteral("kitten"), QStringLiteral("sitting")), 3);
    QCOMPARE(pm::EditDistance::levenshtein(QString(), QStringLiteral("abc")), 3);
    QCOMPARE(pm::EditDistance::levenshtein(QStringLiteral("bolt"), QStringLiteral("bolt")), 0);
}

void TestEditDistance::testFuzzyScore()
{
    QCOMPARE(pm::EditDistance::fuzzyScore(QStringLiteral("hex bolt"), QStringLiteral("hex bolt")), 1.0);
    QCOMPARE(pm::EditDistance::fuzzyScore(QStringLiteral("kitten"), QStringLiteral("sitting")),
             1.0 - 3.0 / 7.0);
    // No shared characters: distance equals the longer length.
    QCOMPARE(pm::EditDistance::fuzzyScore(QStringLiteral("zzzz"), QStringLiteral("bolt")), 0.0);
}

void TestEditDistance::testFuzzyCutoff()
{
    const QString longText(20, QLatin1Char('a'));
    const QString shortText(10, QLatin1Char('a'));
    QCOMPARE(pm::EditDistance::fuzzyScore(longText, shortText), 0.0);
    QCOMPARE(pm::EditDistance::fuzzyScore(longText, shortText, 12), 0.5);
    QCOMPARE(pm::EditDistance::kDefaultCutoff, 8);
}

void TestEditDistance::testFuzzyEmptyInput()
{
    QCOMPARE(pm::EditDistance::fuzzyScore(QString(), QStringLiteral("bolt")), 0.0);
    QCOMPARE(pm::EditDistance::fuzzyScore(QStringLiteral("bolt"), QString()), 0.0);
}

void TestEditDistance::testCompositeScore()
{
    QCOMPARE(pm::EditDistance::compositeScore(QStringLiteral("hex bolt"), QStringLiteral("hex bolt")), 1.0);
    QCOMPARE(pm::EditDistance::compositeScore(QString(), QStringLiteral("hex bolt")), 0.0);

    // "hex bolt" inside "hex bolt long": edit 1-5/13, overlap 2/3, substring 8/13.
    const double expected = 0.5 * (1.0 - 5.0 / 13.0) + 0.3 * (2.0 / 3.0) + 0.2 * (8.0 / 13.0);
    QVERIFY(qAbs(pm::EditDistance::compositeScore(QStringLiteral("hex bolt"),
                                                  QStringLiteral("hex bolt long")) - expected) < 1e-9);

    const double unrelated =
        pm::EditDistance::compositeScore(QStringLiteral("safety goggles"), QStringLiteral("hex bolt"));
    QVERIFY(unrelated >= 0.0);
    QVERIFY(unrelated < 0.4);
}

QTEST_MAIN(TestEditDistance)
#include "test_edit_distance.moc"
