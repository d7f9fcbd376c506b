#include "connection_events.hpp"

#include "common/byte_codec.hpp"

#include <QtCore/QPointer>
#include <QtNetwork/QTcpSocket>

namespace nd::engine {

QString status_name(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::Disconnected:
        return QStringLiteral("Disconnected");
    case ConnectionStatus::Connecting:
        return QStringLiteral("Connecting");
    case ConnectionStatus::Connected:
        return QStringLiteral("Connected");
    case ConnectionStatus::Listening:
        return QStringLiteral("Listening");
    case ConnectionStatus::Error:
        return QStringLiteral("Error");
    }
    return QStringLiteral("Disconnected");
}

ConnectionEvents::ConnectionEvents(QObject *parent) : QObject(parent) {}

ConnectionStatus ConnectionEvents::status() const {
    return status_;
}

void ConnectionEvents::setStatus(ConnectionStatus status) {
    if (status_ == status) {
        return;
    }
    status_ = status;
    emit statusChanged();
}

void ConnectionEvents::log(const QString &message) {
    emit logMessage(message);
}

void ConnectionEvents::fail(const QString &message) {
    setStatus(ConnectionStatus::Error);
    emit errorOccurred(message);
}

SendResult ConnectionEvents::writeTransaction(QTcpSocket *socket, const Transaction &tx) {
    codec::FormatError error = codec::FormatError::None;
    QString reason;
    const auto bytes = codec::encode(compose_text(tx), tx.encoding, &error, &reason);
    if (!bytes.has_value()) {
        log(QStringLiteral("Send error: %1").arg(reason));
        return SendResult::Failed;
    }

    const qint64 written = socket->write(*bytes);
    if (written != bytes->size()) {
        log(QStringLiteral("Send error: %1").arg(socket->errorString()));
        return SendResult::Failed;
    }
    socket->flush();
    log(QStringLiteral("Sent (%1) %2 bytes:\n%3")
            .arg(codec::encoding_name(tx.encoding), QString::number(bytes->size()), codec::hex_dump(*bytes)));
    return SendResult::Sent;
}

void ConnectionEvents::drain(QTcpSocket *socket) {
    // A dataReceived subscriber may stop the connection and release the socket.
    QPointer<QTcpSocket> guard(socket);
    while (guard && guard->bytesAvailable() > 0) {
        const QByteArray chunk = guard->read(kReadChunkBytes);
        if (chunk.isEmpty()) {
            break;
        }
        emit dataReceived(chunk);
    }
}

}  // namespace nd::engine
