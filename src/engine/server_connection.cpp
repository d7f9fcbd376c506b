#include "server_connection.hpp"

#include <QtNetwork/QHostAddress>

namespace nd::engine {

namespace {

QString peer_of(const QTcpSocket *socket) {
    return QStringLiteral("%1:%2").arg(socket->peerAddress().toString(), QString::number(socket->peerPort()));
}

}  // namespace

ServerConnection::ServerConnection(quint16 port, QObject *parent)
    : ConnectionEvents(parent), server_(new QTcpServer(this)), port_(port) {
    connect(server_, &QTcpServer::newConnection, this, &ServerConnection::handleNewConnection);
}

ServerConnection::~ServerConnection() {
    releaseClient();
    server_->close();
}

bool ServerConnection::start() {
    if (server_->isListening()) {
        server_->close();
    }
    if (!server_->listen(QHostAddress::Any, port_)) {
        const QString reason = server_->errorString();
        log(QStringLiteral("Failed to start server: %1").arg(reason));
        fail(reason);
        return false;
    }
    setStatus(ConnectionStatus::Listening);
    log(QStringLiteral("Listening on port %1...").arg(server_->serverPort()));
    return true;
}

void ServerConnection::stop() {
    releaseClient();
    const bool wasActive = server_->isListening() || status() != ConnectionStatus::Disconnected;
    server_->close();
    setStatus(ConnectionStatus::Disconnected);
    if (wasActive) {
        log(QStringLiteral("Server stopped."));
    }
}

SendResult ServerConnection::send(const Transaction &tx) {
    if (!client_ || client_->state() != QAbstractSocket::ConnectedState) {
        log(QStringLiteral("Cannot send: No client connected."));
        return SendResult::NotConnected;
    }
    return writeTransaction(client_, tx);
}

quint16 ServerConnection::localPort() const {
    return server_->isListening() ? server_->serverPort() : port_;
}

bool ServerConnection::hasClient() const {
    return !client_.isNull();
}

void ServerConnection::handleNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket *socket = server_->nextPendingConnection();
        if (!socket) {
            continue;
        }
        log(QStringLiteral("Accepted connection from %1").arg(peer_of(socket)));

        if (client_) {
            log(QStringLiteral("Closing previous client %1 (superseded).").arg(peer_of(client_)));
            releaseClient();
            setStatus(ConnectionStatus::Listening);
        }

        client_ = socket;
        connect(socket, &QTcpSocket::readyRead, this, [this, socket] {
            if (socket == client_) {
                drain(socket);
            }
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket] { onClientDisconnected(socket); });
        connect(socket, &QTcpSocket::errorOccurred, this,
                [this, socket](QAbstractSocket::SocketError error) { onClientError(socket, error); });
        setStatus(ConnectionStatus::Connected);

        if (socket == client_ && socket->bytesAvailable() > 0) {
            drain(socket);
        }
    }
}

void ServerConnection::onClientDisconnected(QTcpSocket *socket) {
    if (socket != client_) {
        return;
    }
    drain(socket);
    if (socket != client_) {
        return;
    }
    log(QStringLiteral("Remote closed the connection."));
    client_ = nullptr;
    socket->disconnect(this);
    socket->deleteLater();
    setStatus(ConnectionStatus::Disconnected);
}

void ServerConnection::onClientError(QTcpSocket *socket, QAbstractSocket::SocketError error) {
    // A peer reset also arrives as RemoteHostClosedError and is handled by onClientDisconnected().
    if (socket != client_ || error == QAbstractSocket::RemoteHostClosedError) {
        return;
    }
    const QString reason = socket->errorString();
    log(QStringLiteral("Read error: %1").arg(reason));
    releaseClient();
    fail(reason);
}

void ServerConnection::releaseClient() {
    if (!client_) {
        return;
    }
    QTcpSocket *socket = client_;
    client_ = nullptr;
    socket->disconnect(this);
    socket->abort();
    socket->deleteLater();
}

}  // namespace nd::engine
