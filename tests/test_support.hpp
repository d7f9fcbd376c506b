#pragma once

#include "engine/connection_instance.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QStringList>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>
#include <QtTest/QTest>

#include <memory>

namespace nd::test {

constexpr int kWaitMs = 5000;

template <typename Predicate>
bool wait_until(Predicate predicate, int timeoutMs = kWaitMs) {
    return QTest::qWaitFor(predicate, timeoutMs);
}

// Records everything an instance reports.
struct InstanceProbe {
    explicit InstanceProbe(engine::ConnectionInstance &instance) {
        QObject::connect(&instance, &engine::ConnectionInstance::logged,
                         [this](const engine::LogEntry &entry) { logs.append(entry.message); });
        QObject::connect(&instance, &engine::ConnectionInstance::dataReceived,
                         [this](const QByteArray &data) { received.append(data); });
        QObject::connect(&instance, &engine::ConnectionInstance::errorOccurred,
                         [this](const QString &message) { errors.append(message); });
        QObject::connect(&instance, &engine::ConnectionInstance::statusChanged, [this] { ++statusChanges; });
    }

    int countLogs(const QString &needle) const {
        int count = 0;
        for (const auto &line : logs) {
            if (line.contains(needle)) {
                ++count;
            }
        }
        return count;
    }

    QStringList logs;
    QByteArray received;
    QStringList errors;
    int statusChanges = 0;
};

inline engine::Transaction ascii(const QString &data, bool newline = false) {
    engine::Transaction tx;
    tx.data = data;
    tx.encoding = codec::Encoding::Ascii;
    tx.appendNewline = newline;
    return tx;
}

inline engine::ConnectionConfig server_config(const QString &name, quint16 port = 0) {
    engine::ConnectionConfig config;
    config.name = name;
    config.role = engine::Role::Server;
    config.port = port;
    return config;
}

inline engine::ConnectionConfig client_config(const QString &name, quint16 port) {
    engine::ConnectionConfig config;
    config.name = name;
    config.role = engine::Role::Client;
    config.host = QStringLiteral("127.0.0.1");
    config.port = port;
    return config;
}

// A loopback port with nothing listening on it.
inline quint16 closed_port() {
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, 0)) {
        return 0;
    }
    const quint16 port = server.serverPort();
    server.close();
    return port;
}

// Accepts connections and keeps whatever they send.
class SinkServer : public QObject {
public:
    SinkServer() {
        QObject::connect(&server_, &QTcpServer::newConnection, this, [this] {
            while (QTcpSocket *socket = server_.nextPendingConnection()) {
                sockets_.append(socket);
                QObject::connect(socket, &QTcpSocket::readyRead, this, [this, socket] {
                    const QByteArray chunk = socket->readAll();
                    receivedBytes_ += chunk.size();
                    if (!discard_) {
                        received_.append(chunk);
                    }
                });
            }
        });
    }

    bool listen() { return server_.listen(QHostAddress::LocalHost, 0); }
    quint16 port() const { return server_.serverPort(); }
    const QByteArray &received() const { return received_; }
    qint64 receivedBytes() const { return receivedBytes_; }
    int connections() const { return sockets_.size(); }
    QTcpSocket *socket(int index) const { return sockets_.value(index); }
    bool hasPendingConnections() const { return server_.hasPendingConnections(); }
    void discardData() { discard_ = true; }

private:
    QTcpServer server_;
    QList<QTcpSocket *> sockets_;
    QByteArray received_;
    qint64 receivedBytes_ = 0;
    bool discard_ = false;
};

}  // namespace nd::test
