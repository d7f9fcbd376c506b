#include "proxy_connection.hpp"

#include "proxy_tunnel.hpp"

#include <QtCore/QUuid>
#include <QtNetwork/QHostAddress>

namespace nd::engine {

ProxyConnection::ProxyConnection(quint16 localPort, QString remoteHost, quint16 remotePort, QObject *parent)
    : ConnectionEvents(parent),
      server_(new QTcpServer(this)),
      localPort_(localPort),
      remoteHost_(std::move(remoteHost)),
      remotePort_(remotePort) {
    connect(server_, &QTcpServer::newConnection, this, &ProxyConnection::handleNewConnection);
}

ProxyConnection::~ProxyConnection() {
    closeTunnels();
    server_->close();
}

bool ProxyConnection::start() {
    if (server_->isListening()) {
        server_->close();
    }
    if (!server_->listen(QHostAddress::Any, localPort_)) {
        const QString reason = server_->errorString();
        log(QStringLiteral("Failed to start proxy: %1").arg(reason));
        fail(reason);
        return false;
    }
    setStatus(ConnectionStatus::Listening);
    log(QStringLiteral("Proxy started: Listening on %1 -> %2:%3")
            .arg(QString::number(server_->serverPort()), remoteHost_, QString::number(remotePort_)));
    return true;
}

void ProxyConnection::stop() {
    closeTunnels();
    const bool wasListening = server_->isListening();
    server_->close();
    setStatus(ConnectionStatus::Disconnected);
    if (wasListening) {
        log(QStringLiteral("Proxy stopped."));
    }
}

SendResult ProxyConnection::send(const Transaction &) {
    log(QStringLiteral("Manual send not supported in Proxy mode."));
    return SendResult::Unsupported;
}

quint16 ProxyConnection::localPort() const {
    return server_->isListening() ? server_->serverPort() : localPort_;
}

int ProxyConnection::activeTunnels() const {
    return static_cast<int>(tunnels_.size());
}

void ProxyConnection::handleNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket *socket = server_->nextPendingConnection();
        if (!socket) {
            continue;
        }
        socket->setParent(nullptr);
        const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        auto *tunnel = new ProxyTunnel(socket, id, remoteHost_, remotePort_, this);
        log(QStringLiteral("Accepted connection from %1").arg(tunnel->peer()));

        connect(tunnel, &ProxyTunnel::logMessage, this, &ProxyConnection::log);
        connect(tunnel, &ProxyTunnel::finished, this, &ProxyConnection::removeTunnel);
        tunnels_.emplace(id, tunnel);
        tunnel->start();
    }
}

void ProxyConnection::removeTunnel(const QString &id) {
    auto it = tunnels_.find(id);
    if (it == tunnels_.end()) {
        return;
    }
    ProxyTunnel *tunnel = it->second;
    tunnels_.erase(it);
    tunnel->disconnect(this);
    tunnel->deleteLater();
}

void ProxyConnection::closeTunnels() {
    for (auto &[id, tunnel] : tunnels_) {
        tunnel->disconnect(this);
        tunnel->stop();
        tunnel->deleteLater();
    }
    tunnels_.clear();
}

}  // namespace nd::engine
