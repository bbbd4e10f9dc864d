#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace pm {

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);

    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(pmIpc, "Cannot create socket directory %s", qPrintable(dir.path()));
        return 1;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(pmIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return 1;
    }

    // Readiness marker for whoever launched us.
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    const int rc = QCoreApplication::exec();
    m_server->close();
    return rc;
}

QString ServiceBase::runtimeDirectory()
{
    const QString fromEnv = qEnvironmentVariable("PARTMATCH_RUNTIME_DIR").trimmed();
    if (!fromEnv.isEmpty()) {
        return QDir::cleanPath(fromEnv);
    }
    return QStringLiteral("/tmp/partmatch-%1").arg(getuid());
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(runtimeDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::requestMethod(request);
    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(pmIpc, "Unknown method '%s' for '%s'",
             qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("service")] = m_serviceName;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(pmIpc, "Shutdown requested for '%s'", qPrintable(m_serviceName));

    // Queued so the reply is written before the loop exits.
    if (QCoreApplication* app = QCoreApplication::instance()) {
        QMetaObject::invokeMethod(app, &QCoreApplication::quit, Qt::QueuedConnection);
    }

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

} // namespace pm
