#include "throughput_tester.hpp"

#include "common/logger.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QElapsedTimer>
#include <QtCore/QRandomGenerator>
#include <QtNetwork/QTcpSocket>

#include <algorithm>

namespace nd::probe {

namespace {

constexpr int kConnectTimeoutMs = 5000;
constexpr int kWriteWaitMs = 50;

ThroughputResult failed(const QString &reason) {
    common::Logger::instance().warn(QStringLiteral("throughput"), reason);
    return ThroughputResult{};
}

QByteArray random_buffer() {
    QByteArray buffer(kThroughputBufferBytes, Qt::Uninitialized);
    QRandomGenerator *generator = QRandomGenerator::global();
    for (int i = 0; i < buffer.size(); i += 4) {
        const quint32 word = generator->generate();
        for (int b = 0; b < 4 && i + b < buffer.size(); ++b) {
            buffer[i + b] = static_cast<char>((word >> (8 * b)) & 0xff);
        }
    }
    return buffer;
}

}  // namespace

ThroughputResult run_throughput_test(const QString &host, quint16 port, int durationSeconds,
                                     const ThroughputProgressFn &onProgress, const std::atomic<bool> *cancelled) {
    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(kConnectTimeoutMs)) {
        return failed(QStringLiteral("Connect to %1:%2 failed: %3")
                          .arg(host, QString::number(port), socket.errorString()));
    }

    const QByteArray buffer = random_buffer();
    const qint64 durationMs = static_cast<qint64>(std::max(durationSeconds, 0)) * 1000;
    std::uint64_t totalBytes = 0;
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < durationMs) {
        if (cancelled && cancelled->load()) {
            break;
        }
        // Keep at most one buffer queued in user space so the loop follows the wire.
        if (socket.bytesToWrite() >= kThroughputBufferBytes) {
            if (!socket.waitForBytesWritten(kWriteWaitMs) && socket.state() != QAbstractSocket::ConnectedState) {
                return failed(QStringLiteral("Write to %1:%2 failed: %3")
                                  .arg(host, QString::number(port), socket.errorString()));
            }
            continue;
        }
        const qint64 written = socket.write(buffer);
        if (written < 0 || socket.state() != QAbstractSocket::ConnectedState) {
            return failed(QStringLiteral("Write to %1:%2 failed: %3")
                              .arg(host, QString::number(port), socket.errorString()));
        }
        totalBytes += static_cast<std::uint64_t>(written);
        if (onProgress) {
            onProgress(totalBytes);
        }
    }

    ThroughputResult result;
    result.totalBytes = totalBytes;
    result.elapsed = std::chrono::milliseconds(timer.elapsed());
    const double seconds = static_cast<double>(result.elapsed.count()) / 1000.0;
    result.bytesPerSecond = seconds > 0.0 ? static_cast<double>(totalBytes) / seconds : 0.0;
    result.success = true;
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState && !socket.waitForDisconnected(kConnectTimeoutMs)) {
        socket.abort();
    }
    return result;
}

}  // namespace nd::probe
