#pragma once

#include "connection_events.hpp"

#include <QtCore/QString>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpSocket>

namespace nd::engine {

class ClientConnection : public ConnectionEvents {
    Q_OBJECT

public:
    ClientConnection(QString host, quint16 port, QObject *parent = nullptr);
    ~ClientConnection() override;

    // Blocks until the connection is established or refused.
    bool start();
    void stop();
    SendResult send(const Transaction &tx);

    quint16 localPort() const;

private slots:
    void onReadyRead();
    void onDisconnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);

private:
    QTcpSocket socket_;
    QString host_;
    quint16 port_ = 0;
};

}  // namespace nd::engine
