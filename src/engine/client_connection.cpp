#include "client_connection.hpp"

#include <QtCore/QSignalBlocker>

namespace nd::engine {

ClientConnection::ClientConnection(QString host, quint16 port, QObject *parent)
    : ConnectionEvents(parent), host_(std::move(host)), port_(port) {
    connect(&socket_, &QTcpSocket::readyRead, this, &ClientConnection::onReadyRead);
    connect(&socket_, &QTcpSocket::disconnected, this, &ClientConnection::onDisconnected);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &ClientConnection::onErrorOccurred);
}

ClientConnection::~ClientConnection() {
    const QSignalBlocker blocker(&socket_);
    socket_.abort();
}

bool ClientConnection::start() {
    if (socket_.state() != QAbstractSocket::UnconnectedState) {
        const QSignalBlocker blocker(&socket_);
        socket_.abort();
    }

    setStatus(ConnectionStatus::Connecting);
    log(QStringLiteral("Connecting to %1:%2...").arg(host_, QString::number(port_)));
    socket_.connectToHost(host_, port_);
    if (!socket_.waitForConnected(kConnectTimeoutMs)) {
        const QString reason = socket_.errorString();
        {
            const QSignalBlocker blocker(&socket_);
            socket_.abort();
        }
        log(QStringLiteral("Failed to connect: %1").arg(reason));
        fail(reason);
        return false;
    }

    log(QStringLiteral("Connected."));
    setStatus(ConnectionStatus::Connected);
    // Bytes that arrived during the blocking connect do not raise readyRead again.
    if (socket_.bytesAvailable() > 0) {
        drain(&socket_);
    }
    return true;
}

void ClientConnection::stop() {
    {
        const QSignalBlocker blocker(&socket_);
        socket_.abort();
    }
    if (status() != ConnectionStatus::Disconnected) {
        setStatus(ConnectionStatus::Disconnected);
        log(QStringLiteral("Disconnected."));
    }
}

SendResult ClientConnection::send(const Transaction &tx) {
    if (socket_.state() != QAbstractSocket::ConnectedState) {
        log(QStringLiteral("Cannot send: Not connected."));
        return SendResult::NotConnected;
    }
    return writeTransaction(&socket_, tx);
}

quint16 ClientConnection::localPort() const {
    return socket_.localPort();
}

void ClientConnection::onReadyRead() {
    drain(&socket_);
}

void ClientConnection::onDisconnected() {
    if (status() != ConnectionStatus::Connected) {
        return;
    }
    drain(&socket_);
    log(QStringLiteral("Remote closed the connection."));
    setStatus(ConnectionStatus::Disconnected);
}

void ClientConnection::onErrorOccurred(QAbstractSocket::SocketError error) {
    // Connect failures are reported by start(); a remote close arrives through disconnected().
    // Qt also reports a peer reset (ECONNRESET) as RemoteHostClosedError, so a reset
    // ends as Disconnected rather than Error.
    if (status() != ConnectionStatus::Connected || error == QAbstractSocket::RemoteHostClosedError) {
        return;
    }
    const QString reason = socket_.errorString();
    log(QStringLiteral("Read error: %1").arg(reason));
    fail(reason);
}

}  // namespace nd::engine
