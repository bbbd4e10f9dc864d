#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace pm {

// Local-socket front end. Each complete frame carrying a request is passed to
// the handler and the returned envelope is written back on the same socket.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const;

    void setRequestHandler(RequestHandler handler);

    // Runs one decoded message through the handler. Returns an empty object
    // when no reply should be sent.
    QJsonObject dispatch(const QJsonObject& incoming) const;

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + IpcMessage::kHeaderSize;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    void processBuffer(QLocalSocket* client);
    bool detachClient(QLocalSocket* client);
    void dropClient(QLocalSocket* client);
    static void writeFrame(QLocalSocket* client, const QJsonObject& json);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace pm
