#pragma once

#include "core/ipc/socket_server.h"
#include <QString>
#include <memory>

namespace pm {

// Socket-bound service with the built-in ping/shutdown methods. Subclasses
// route their own methods from handleRequest() and fall back to this one.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens on socketPath(serviceName) and enters the event loop.
    int run();

    virtual QJsonObject handleRequest(const QJsonObject& request);

    const QString& serviceName() const { return m_serviceName; }

    static QString runtimeDirectory();
    static QString socketPath(const QString& serviceName);

protected:
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace pm
