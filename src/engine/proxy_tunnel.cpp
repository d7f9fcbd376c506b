#include "proxy_tunnel.hpp"

#include "common/byte_codec.hpp"

#include <QtCore/QTimer>
#include <QtNetwork/QHostAddress>

namespace nd::engine {

namespace {

constexpr int kForwardChunkBytes = 8192;
constexpr int kDrainTimeoutMs = 30000;

}  // namespace

ProxyTunnel::ProxyTunnel(QTcpSocket *local, QString tunnelId, QString remoteHost, quint16 remotePort,
                         QObject *parent)
    : QObject(parent),
      local_(local),
      remote_(new QTcpSocket),
      tunnelId_(std::move(tunnelId)),
      remoteHost_(std::move(remoteHost)),
      remotePort_(remotePort) {
    if (local_) {
        peer_ = QStringLiteral("%1:%2").arg(local_->peerAddress().toString(), QString::number(local_->peerPort()));
    }
}

ProxyTunnel::~ProxyTunnel() {
    closeSockets();
}

QString ProxyTunnel::id() const {
    return tunnelId_;
}

QString ProxyTunnel::peer() const {
    return peer_;
}

bool ProxyTunnel::isFinished() const {
    return finished_;
}

void ProxyTunnel::start() {
    if (!local_) {
        finish();
        return;
    }
    connect(local_.data(), &QTcpSocket::readyRead, this, &ProxyTunnel::onLocalReadyRead);
    connect(local_.data(), &QTcpSocket::disconnected, this, &ProxyTunnel::onLocalDisconnected);
    connect(remote_.data(), &QTcpSocket::connected, this, &ProxyTunnel::onRemoteConnected);
    connect(remote_.data(), &QTcpSocket::readyRead, this, &ProxyTunnel::onRemoteReadyRead);
    connect(remote_.data(), &QTcpSocket::disconnected, this, &ProxyTunnel::onRemoteDisconnected);
    connect(remote_.data(), &QTcpSocket::errorOccurred, this, &ProxyTunnel::onRemoteError);
    remote_->connectToHost(remoteHost_, remotePort_);
}

void ProxyTunnel::stop() {
    if (finished_) {
        return;
    }
    finished_ = true;
    closeSockets();
}

void ProxyTunnel::onRemoteConnected() {
    remoteReady_ = true;
    emit logMessage(QStringLiteral("Connected to remote %1:%2 for client %3")
                        .arg(remoteHost_, QString::number(remotePort_), peer_));
    // The client may have written before the outbound leg was up.
    forward(local_.data(), remote_.data(), QStringLiteral("[%1 -> Remote]").arg(peer_));
    if (local_->state() != QAbstractSocket::ConnectedState) {
        finish();
    }
}

void ProxyTunnel::onLocalReadyRead() {
    if (!remoteReady_) {
        return;
    }
    forward(local_.data(), remote_.data(), QStringLiteral("[%1 -> Remote]").arg(peer_));
}

void ProxyTunnel::onRemoteReadyRead() {
    forward(remote_.data(), local_.data(), QStringLiteral("[Remote -> %1]").arg(peer_));
}

void ProxyTunnel::onLocalDisconnected() {
    if (!remoteReady_) {
        // Keep what the client sent; it is flushed once the remote leg connects.
        if (remote_->state() == QAbstractSocket::UnconnectedState) {
            finish();
        }
        return;
    }
    onLocalReadyRead();
    finish();
}

void ProxyTunnel::onRemoteDisconnected() {
    onRemoteReadyRead();
    finish();
}

void ProxyTunnel::onRemoteError(QAbstractSocket::SocketError error) {
    if (finished_) {
        return;
    }
    if (remoteReady_ && error == QAbstractSocket::RemoteHostClosedError) {
        return;
    }
    emit logMessage(QStringLiteral("Proxy Error (%1): %2").arg(peer_, remote_->errorString()));
    finish();
}

void ProxyTunnel::forward(QTcpSocket *from, QTcpSocket *to, const QString &prefix) {
    while (!finished_ && from->bytesAvailable() > 0) {
        const QByteArray chunk = from->read(kForwardChunkBytes);
        if (chunk.isEmpty()) {
            break;
        }
        if (to->write(chunk) != chunk.size()) {
            emit logMessage(QStringLiteral("Proxy Error (%1): %2").arg(peer_, to->errorString()));
            finish();
            return;
        }
        to->flush();
        emit logMessage(QStringLiteral("%1 Forwarded %2 bytes: %3 (Hex: %4)")
                            .arg(prefix, QString::number(chunk.size()), codec::ascii_preview(chunk),
                                 codec::to_hex_string(chunk)));
    }
}

void ProxyTunnel::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    closeSockets();
    emit logMessage(QStringLiteral("Connection closed for %1").arg(peer_));
    emit finished(tunnelId_);
}

void ProxyTunnel::closeSockets() {
    closeSocket(local_);
    closeSocket(remote_);
}

void ProxyTunnel::closeSocket(QScopedPointer<QTcpSocket> &socket) {
    if (!socket) {
        return;
    }
    socket->disconnect(this);
    if (socket->state() == QAbstractSocket::ConnectedState) {
        socket->flush();
        socket->disconnectFromHost();
    }
    if (socket->state() == QAbstractSocket::UnconnectedState) {
        return;
    }
    if (socket->bytesToWrite() == 0) {
        socket->abort();
        return;
    }
    // Still writing forwarded data: the socket outlives the tunnel until the
    // close handshake completes or the drain timeout expires.
    QTcpSocket *draining = socket.take();
    connect(draining, &QTcpSocket::disconnected, draining, &QObject::deleteLater);
    QTimer::singleShot(kDrainTimeoutMs, draining, [draining] {
        draining->abort();
        draining->deleteLater();
    });
}

}  // namespace nd::engine
