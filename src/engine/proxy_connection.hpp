#pragma once

#include "connection_events.hpp"

#include <QtCore/QString>
#include <QtNetwork/QTcpServer>

#include <unordered_map>

namespace nd::engine {

class ProxyTunnel;

// Accepts any number of clients on the local port and splices each one to
// remoteHost:remotePort. Traffic is operator-transparent, so send() is not
// supported.
class ProxyConnection : public ConnectionEvents {
    Q_OBJECT

public:
    ProxyConnection(quint16 localPort, QString remoteHost, quint16 remotePort, QObject *parent = nullptr);
    ~ProxyConnection() override;

    bool start();
    void stop();
    SendResult send(const Transaction &tx);

    quint16 localPort() const;
    int activeTunnels() const;

private slots:
    void handleNewConnection();

private:
    void removeTunnel(const QString &id);
    void closeTunnels();

    QTcpServer *server_ = nullptr;
    std::unordered_map<QString, ProxyTunnel *> tunnels_;
    quint16 localPort_ = 0;
    QString remoteHost_;
    quint16 remotePort_ = 0;
};

}  // namespace nd::engine
