#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace pm {

namespace {

quint32 readLength(const QByteArray& buffer)
{
    quint32 raw = 0;
    std::memcpy(&raw, buffer.constData(), IpcMessage::kHeaderSize);
    return qFromBigEndian(raw);
}

} // namespace

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(pmIpc, "Refusing to encode %d byte payload (limit %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(&len), kHeaderSize);
    frame.append(payload);
    return frame;
}

bool IpcMessage::hasOversizedHeader(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize) {
        return false;
    }
    return readLength(buffer) > static_cast<quint32>(kMaxMessageSize);
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize || hasOversizedHeader(buffer)) {
        return std::nullopt;
    }

    const int payloadLen = static_cast<int>(readLength(buffer));
    const int frameLen = kHeaderSize + payloadLen;
    if (buffer.size() < frameLen) {
        return std::nullopt;
    }

    DecodeResult result;
    result.bytesConsumed = frameLen;

    QJsonParseError parseError;
    const QJsonDocument doc =
        QJsonDocument::fromJson(buffer.mid(kHeaderSize, payloadLen), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(pmIpc, "Dropping frame with malformed JSON: %s",
                 qPrintable(parseError.errorString()));
        result.valid = false;
        return result;
    }
    if (!doc.isObject()) {
        LOG_WARN(pmIpc, "Dropping frame whose payload is not a JSON object");
        result.valid = false;
        return result;
    }

    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

QString IpcMessage::requestMethod(const QJsonObject& request)
{
    return request.value(QStringLiteral("method")).toString();
}

QJsonObject IpcMessage::requestParams(const QJsonObject& request)
{
    return request.value(QStringLiteral("params")).toObject();
}

} // namespace pm
