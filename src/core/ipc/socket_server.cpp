#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace pm {

namespace {

bool socketHasLivePeer(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    const bool connected = probe.waitForConnected(150);
    if (connected) {
        probe.disconnectFromServer();
        if (probe.state() != QLocalSocket::UnconnectedState) {
            probe.waitForDisconnected(50);
        }
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(pmIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(pmIpc, "Cannot listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasLivePeer(socketPath)) {
        const QString err = QStringLiteral("Another match service owns %1").arg(socketPath);
        LOG_ERROR(pmIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(pmIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(pmIpc, "Cannot listen on %s after stale cleanup: %s",
                  qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(pmIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Bookkeeping is cleared before sockets disconnect so their callbacks see nothing to detach.
    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(pmIpc, "Closed %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

int SocketServer::clientCount() const
{
    return static_cast<int>(m_clients.size());
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

QJsonObject SocketServer::dispatch(const QJsonObject& incoming) const
{
    const QString type = incoming.value(QStringLiteral("type")).toString();
    const uint64_t id = IpcMessage::requestId(incoming);

    if (type != QLatin1String("request")) {
        LOG_WARN(pmIpc, "Rejecting message of type '%s'", qPrintable(type));
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Expected a request message"));
    }

    LOG_DEBUG(pmIpc, "Request id=%llu method=%s",
              static_cast<unsigned long long>(id),
              qPrintable(IpcMessage::requestMethod(incoming)));

    if (!m_handler) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(incoming);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        LOG_DEBUG(pmIpc, "Client connected (%d active)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());

    if (buffer.size() > kMaxReadBufferSize || IpcMessage::hasOversizedHeader(buffer)) {
        LOG_ERROR(pmIpc, "Client exceeded the %d byte frame limit, disconnecting",
                  IpcMessage::kMaxMessageSize);
        dropClient(client);
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client) {
        return;
    }
    if (detachClient(client)) {
        LOG_DEBUG(pmIpc, "Client disconnected (%d active)", clientCount());
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::dropClient(QLocalSocket* client)
{
    const bool tracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (tracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::writeFrame(QLocalSocket* client, const QJsonObject& json)
{
    const QByteArray frame = IpcMessage::encode(json);
    if (frame.isEmpty()) {
        LOG_WARN(pmIpc, "Reply could not be encoded; nothing sent");
        return;
    }
    client->write(frame);
    client->flush();
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const auto decoded = IpcMessage::decode(buffer);
        if (!decoded) {
            break;
        }
        buffer.remove(0, decoded->bytesConsumed);

        if (!decoded->valid) {
            writeFrame(client, IpcMessage::makeError(0, IpcErrorCode::InvalidParams,
                                                     QStringLiteral("Malformed message")));
            continue;
        }

        // The handler may run a shutdown that closes this server.
        const QJsonObject reply = dispatch(decoded->json);
        if (!reply.isEmpty() && m_readBuffers.contains(client)) {
            writeFrame(client, reply);
        }
    }
}

} // namespace pm
