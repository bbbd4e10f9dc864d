#pragma once

#include <QString>

namespace pm {

// Numeric values are part of the wire format; retired codes are not reused.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    InternalError      = 6,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace pm
