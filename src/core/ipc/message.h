#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace pm {

// Frame layout: 4-byte big-endian payload length followed by compact UTF-8 JSON.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    // A frame whose payload is not a JSON object still reports bytesConsumed
    // so the reader can skip it; `valid` is false in that case.
    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
        bool valid = true;
    };

    // nullopt while the buffer holds less than one full frame.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    // True when the buffer announces a frame larger than kMaxMessageSize.
    static bool hasOversizedHeader(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);

    static uint64_t requestId(const QJsonObject& request);
    static QString requestMethod(const QJsonObject& request);
    static QJsonObject requestParams(const QJsonObject& request);

    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace pm
