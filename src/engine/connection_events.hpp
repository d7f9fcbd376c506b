#pragma once

#include "connection_config.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QObject>
#include <QtCore/QString>

class QTcpSocket;

namespace nd::engine {

constexpr int kReadChunkBytes = 4096;
constexpr int kConnectTimeoutMs = 5000;

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Listening,
    Error,
};

enum class SendResult {
    Sent,
    NotConnected,
    Unsupported,
    Failed,
};

QString status_name(ConnectionStatus status);

// Notification surface shared by every connection role. statusChanged carries
// no payload; receivers re-read status().
class ConnectionEvents : public QObject {
    Q_OBJECT

public:
    ConnectionStatus status() const;

signals:
    void logMessage(QString message);
    void statusChanged();
    void errorOccurred(QString message);
    void dataReceived(QByteArray data);

protected:
    explicit ConnectionEvents(QObject *parent = nullptr);

    void setStatus(ConnectionStatus status);
    void log(const QString &message);
    void fail(const QString &message);

    // Applies the CR/LF flags, encodes and writes. Failures are logged and
    // leave the socket open.
    SendResult writeTransaction(QTcpSocket *socket, const Transaction &tx);

    // Reads everything pending in kReadChunkBytes slices.
    void drain(QTcpSocket *socket);

private:
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
};

}  // namespace nd::engine
