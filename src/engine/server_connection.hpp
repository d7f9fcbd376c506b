#pragma once

#include "connection_events.hpp"

#include <QtCore/QPointer>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

namespace nd::engine {

// Listens on all interfaces and talks to one client at a time: a newly
// accepted client supersedes the previous one.
class ServerConnection : public ConnectionEvents {
    Q_OBJECT

public:
    explicit ServerConnection(quint16 port, QObject *parent = nullptr);
    ~ServerConnection() override;

    bool start();
    void stop();
    SendResult send(const Transaction &tx);

    quint16 localPort() const;
    bool hasClient() const;

private slots:
    void handleNewConnection();

private:
    void onClientDisconnected(QTcpSocket *socket);
    void onClientError(QTcpSocket *socket, QAbstractSocket::SocketError error);
    void releaseClient();

    QTcpServer *server_ = nullptr;
    QPointer<QTcpSocket> client_;
    quint16 port_ = 0;
};

}  // namespace nd::engine
