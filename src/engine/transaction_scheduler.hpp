#pragma once

#include "connection_config.hpp"

#include <QtCore/QObject>
#include <QtCore/QRandomGenerator>
#include <QtCore/QTimer>
#include <QtCore/QVector>

#include <functional>
#include <optional>

namespace nd::engine {

enum class ScheduleMode {
    FixedInterval,
    JitteredInterval,
    ReceiveTriggered,
};

ScheduleMode schedule_mode(const ConnectionConfig &config);
QString schedule_mode_name(ScheduleMode mode);

// Drives automatic sends through a cyclic cursor over the configured
// transactions. The mode is fixed at construction.
class TransactionScheduler : public QObject {
    Q_OBJECT

public:
    using SendFn = std::function<void(const Transaction &)>;

    TransactionScheduler(const ConnectionConfig &config, SendFn send, QObject *parent = nullptr);

    ScheduleMode mode() const;
    bool isRunning() const;
    int cursor() const;
    quint64 sentCount() const;

    // Idempotent. Resets the cursor; interval modes send the first
    // transaction before returning.
    void start();
    void stop();

    // Receive-triggered mode answers each inbound chunk with one send.
    void onDataReceived();

    // Wait before the next interval send: intervalMs minus a jitter drawn from
    // [jitterMinMs, jitterMaxMs]. May be zero or negative.
    qint64 nextDelayMs();

signals:
    void cursorChanged(int cursor);

private slots:
    void onTimeout();

private:
    void sendCurrent();
    void armTimer();

    QVector<Transaction> transactions_;
    ScheduleMode mode_;
    quint32 intervalMs_ = 0;
    quint32 jitterMinMs_ = 0;
    quint32 jitterMaxMs_ = 0;
    SendFn send_;
    QTimer timer_;
    QRandomGenerator random_;
    int cursor_ = 0;
    quint64 sentCount_ = 0;
    bool running_ = false;
};

}  // namespace nd::engine
