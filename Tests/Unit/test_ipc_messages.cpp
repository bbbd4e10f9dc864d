#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtEndian>
#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"

#include <cstring>

namespace {

QByteArray rawFrame(const QByteArray& payload)
{
    QByteArray frame(4, '\0');
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    std::memcpy(frame.data(), &len, 4);
    frame.append(payload);
    return frame;
}

} // namespace

class TestIpcMessages : public QObject {
    Q_OBJECT

private slots:
    // ── Encode/Decode ────────────────────────────────────────────
    void testEncodeDecodeMatchRequest();
    void testEncodeDecodeResponse();
    void testEncodeDecodeError();
    void testFrameHeaderIsBigEndianLength();

    // ── Envelope builders ────────────────────────────────────────
    void testMakeRequestEmptyParams();
    void testRequestAccessors();
    void testMakeErrorStructure();
    void testErrorCodeStrings_data();
    void testErrorCodeStrings();

    // ── Decode edge cases ────────────────────────────────────────
    void testDecodeIncompleteHeader();
    void testDecodePartialMessage();
    void testDecodeConsecutiveFrames();
    void testDecodeMalformedJsonIsSkippable();
    void testDecodeNonObjectPayloadIsSkippable();
    void testDecodeRejectsOversizedLength();

    // ── Content ──────────────────────────────────────────────────
    void testUnicodeLineItemSurvives();
};

void TestIpcMessages::testEncodeDecodeMatchRequest()
{
    auto req = pm::IpcMessage::makeRequest(42, QStringLiteral("match"),
        QJsonObject{{QStringLiteral("query"), QStringLiteral("gr. 8 hx hd cap scr")},
                    {QStringLiteral("limit"), 5}});
    QByteArray encoded = pm::IpcMessage::encode(req);
    QVERIFY(!encoded.isEmpty());

    auto decoded = pm::IpcMessage::decode(encoded);
    QVERIFY(decoded.has_value());
    QVERIFY(decoded->valid);
    QCOMPARE(decoded->bytesConsumed, static_cast<int>(encoded.size()));

    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(decoded->json[QStringLiteral("id")].toInteger(), 42);
    QCOMPARE(decoded->json[QStringLiteral("method")].toString(), QStringLiteral("match"));
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject()[QStringLiteral("limit")].toInt(), 5);
}

void TestIpcMessages::testEncodeDecodeResponse()
{
    QJsonObject result;
    result[QStringLiteral("results")] = QJsonArray();
    result[QStringLiteral("snapshotVersion")] = 3;

    auto decoded = pm::IpcMessage::decode(
        pm::IpcMessage::encode(pm::IpcMessage::makeResponse(99, result)));

    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("response"));
    QCOMPARE(decoded->json[QStringLiteral("id")].toInteger(), 99);
    QCOMPARE(decoded->json[QStringLiteral("result")].toObject()
                 [QStringLiteral("snapshotVersion")].toInt(), 3);
}

void TestIpcMessages::testEncodeDecodeError()
{
    auto decoded = pm::IpcMessage::decode(pm::IpcMessage::encode(
        pm::IpcMessage::makeError(7, pm::IpcErrorCode::ServiceUnavailable,
                                  QStringLiteral("Catalog unavailable"))));

    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("error"));
    QCOMPARE(decoded->json[QStringLiteral("id")].toInteger(), 7);

    auto errObj = decoded->json[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(),
             static_cast<int>(pm::IpcErrorCode::ServiceUnavailable));
    QCOMPARE(errObj[QStringLiteral("message")].toString(), QStringLiteral("Catalog unavailable"));
}

void TestIpcMessages::testFrameHeaderIsBigEndianLength()
{
    const QByteArray encoded = pm::IpcMessage::encode(QJsonObject{{QStringLiteral("a"), 1}});
    const QByteArray payload = QByteArrayLiteral("{\"a\":1}");
    QCOMPARE(encoded, rawFrame(payload));
}

void TestIpcMessages::testMakeRequestEmptyParams()
{
    auto req = pm::IpcMessage::makeRequest(1, QStringLiteral("ping"));
    QVERIFY(!req.contains(QStringLiteral("params")));
}

void TestIpcMessages::testRequestAccessors()
{
    auto req = pm::IpcMessage::makeRequest(123456789012LL, QStringLiteral("matchBatch"),
        QJsonObject{{QStringLiteral("limit"), 3}});

    QCOMPARE(pm::IpcMessage::requestId(req), uint64_t(123456789012LL));
    QCOMPARE(pm::IpcMessage::requestMethod(req), QStringLiteral("matchBatch"));
    QCOMPARE(pm::IpcMessage::requestParams(req)[QStringLiteral("limit")].toInt(), 3);

    QCOMPARE(pm::IpcMessage::requestId(QJsonObject()), uint64_t(0));
    QVERIFY(pm::IpcMessage::requestParams(QJsonObject()).isEmpty());
}

void TestIpcMessages::testMakeErrorStructure()
{
    auto err = pm::IpcMessage::makeError(3, pm::IpcErrorCode::Timeout,
                                         QStringLiteral("Match timed out"));

    QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("error"));
    QCOMPARE(err[QStringLiteral("id")].toInteger(), 3);

    auto errObj = err[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(), 2);
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("TIMEOUT"));
    QCOMPARE(errObj[QStringLiteral("message")].toString(), QStringLiteral("Match timed out"));
}

void TestIpcMessages::testErrorCodeStrings_data()
{
    QTest::addColumn<int>("code");
    QTest::addColumn<QString>("expected");

    QTest::newRow("invalid") << 1 << QStringLiteral("INVALID_PARAMS");
    QTest::newRow("timeout") << 2 << QStringLiteral("TIMEOUT");
    QTest::newRow("not found") << 4 << QStringLiteral("NOT_FOUND");
    QTest::newRow("internal") << 6 << QStringLiteral("INTERNAL_ERROR");
    QTest::newRow("unavailable") << 9 << QStringLiteral("SERVICE_UNAVAILABLE");
    QTest::newRow("retired") << 3 << QStringLiteral("UNKNOWN");
}

void TestIpcMessages::testErrorCodeStrings()
{
    QFETCH(int, code);
    QFETCH(QString, expected);
    QCOMPARE(pm::ipcErrorCodeToString(static_cast<pm::IpcErrorCode>(code)), expected);
}

void TestIpcMessages::testDecodeIncompleteHeader()
{
    QVERIFY(!pm::IpcMessage::decode(QByteArray()).has_value());
    QVERIFY(!pm::IpcMessage::decode(QByteArray(2, '\0')).has_value());
}

void TestIpcMessages::testDecodePartialMessage()
{
    QByteArray encoded = pm::IpcMessage::encode(
        pm::IpcMessage::makeRequest(1, QStringLiteral("reloadCatalog")));
    QVERIFY(!pm::IpcMessage::decode(encoded.left(encoded.size() - 1)).has_value());
}

void TestIpcMessages::testDecodeConsecutiveFrames()
{
    QByteArray combined = pm::IpcMessage::encode(
        pm::IpcMessage::makeRequest(1, QStringLiteral("first")));
    combined.append(pm::IpcMessage::encode(
        pm::IpcMessage::makeRequest(2, QStringLiteral("second"))));

    auto first = pm::IpcMessage::decode(combined);
    QVERIFY(first.has_value());
    QCOMPARE(first->json[QStringLiteral("method")].toString(), QStringLiteral("first"));
    QVERIFY(first->bytesConsumed < combined.size());

    auto second = pm::IpcMessage::decode(combined.mid(first->bytesConsumed));
    QVERIFY(second.has_value());
    QCOMPARE(second->json[QStringLiteral("method")].toString(), QStringLiteral("second"));
}

void TestIpcMessages::testDecodeMalformedJsonIsSkippable()
{
    const QByteArray frame = rawFrame(QByteArrayLiteral("{not json"));
    auto decoded = pm::IpcMessage::decode(frame);
    QVERIFY(decoded.has_value());
    QVERIFY(!decoded->valid);
    QCOMPARE(decoded->bytesConsumed, static_cast<int>(frame.size()));
}

void TestIpcMessages::testDecodeNonObjectPayloadIsSkippable()
{
    auto decoded = pm::IpcMessage::decode(rawFrame(QByteArrayLiteral("[1,2,3]")));
    QVERIFY(decoded.has_value());
    QVERIFY(!decoded->valid);
    QVERIFY(decoded->json.isEmpty());
}

void TestIpcMessages::testDecodeRejectsOversizedLength()
{
    QByteArray buf(4, '\0');
    const quint32 hugeLen = qToBigEndian(static_cast<quint32>(20 * 1024 * 1024));
    std::memcpy(buf.data(), &hugeLen, 4);
    buf.append(QByteArray(100, 'x'));

    QVERIFY(pm::IpcMessage::hasOversizedHeader(buf));
    QVERIFY(!pm::IpcMessage::decode(buf).has_value());
    QVERIFY(!pm::IpcMessage::hasOversizedHeader(pm::IpcMessage::encode(QJsonObject())));
}

void TestIpcMessages::testUnicodeLineItemSurvives()
{
    const QString text = QStringLiteral("Schraube M8 × 40 – verzinkt äöü");
    auto decoded = pm::IpcMessage::decode(pm::IpcMessage::encode(
        pm::IpcMessage::makeRequest(1, QStringLiteral("match"),
                                    QJsonObject{{QStringLiteral("query"), text}})));

    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject()[QStringLiteral("query")].toString(),
             text);
}

QTEST_MAIN(TestIpcMessages)
#include "test_ipc_messages.moc"
