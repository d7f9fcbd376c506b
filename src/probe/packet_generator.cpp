#include "packet_generator.hpp"

#include "common/byte_codec.hpp"
#include "common/logger.hpp"

#include <QtCore/QThread>
#include <QtNetwork/QTcpSocket>

namespace nd::probe {

namespace {

constexpr int kConnectTimeoutMs = 5000;
constexpr int kWriteTimeoutMs = 5000;

}  // namespace

int run_packet_generator(const QString &host, quint16 port, const QString &hexPayload, int iterations, int delayMs,
                         const PacketLogFn &onLog, const std::atomic<bool> *cancelled) {
    const auto emitLog = [&onLog](const QString &line) {
        if (onLog) {
            onLog(line);
        }
    };
    const auto reportError = [&emitLog](const QString &line) {
        common::Logger::instance().warn(QStringLiteral("packetgen"), line);
        emitLog(line);
    };

    QString reason;
    const auto payload = codec::hex_to_bytes(hexPayload, nullptr, &reason);
    if (!payload.has_value()) {
        reportError(QStringLiteral("[PacketGen] Invalid hex data: %1").arg(reason));
        return 0;
    }

    QTcpSocket socket;
    emitLog(QStringLiteral("[PacketGen] Connecting to %1:%2...").arg(host, QString::number(port)));
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(kConnectTimeoutMs)) {
        reportError(QStringLiteral("[PacketGen] Error: %1").arg(socket.errorString()));
        return 0;
    }
    emitLog(QStringLiteral("[PacketGen] Connected. Sending %1 packets...").arg(iterations));

    int sent = 0;
    for (int i = 0; i < iterations; ++i) {
        if (cancelled && cancelled->load()) {
            break;
        }
        if (socket.write(*payload) != payload->size() ||
            (socket.bytesToWrite() > 0 && !socket.waitForBytesWritten(kWriteTimeoutMs))) {
            reportError(QStringLiteral("[PacketGen] Error: %1").arg(socket.errorString()));
            socket.abort();
            return sent;
        }
        ++sent;
        emitLog(QStringLiteral("[PacketGen] Sent packet %1/%2 (%3 bytes)")
                    .arg(i + 1)
                    .arg(iterations)
                    .arg(payload->size()));
        if (delayMs > 0 && i < iterations - 1) {
            QThread::msleep(static_cast<unsigned long>(delayMs));
        }
    }

    emitLog(QStringLiteral("[PacketGen] Done."));
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState && !socket.waitForDisconnected(kConnectTimeoutMs)) {
        socket.abort();
    }
    return sent;
}

}  // namespace nd::probe
