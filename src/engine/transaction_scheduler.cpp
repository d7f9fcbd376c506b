#include "transaction_scheduler.hpp"

#include <algorithm>
#include <limits>

namespace nd::engine {

ScheduleMode schedule_mode(const ConnectionConfig &config) {
    if (!config.intervalMs.has_value()) {
        return ScheduleMode::ReceiveTriggered;
    }
    if (config.jitterMinMs.has_value() && config.jitterMaxMs.has_value()) {
        return ScheduleMode::JitteredInterval;
    }
    return ScheduleMode::FixedInterval;
}

QString schedule_mode_name(ScheduleMode mode) {
    switch (mode) {
    case ScheduleMode::FixedInterval:
        return QStringLiteral("fixed interval");
    case ScheduleMode::JitteredInterval:
        return QStringLiteral("jittered interval");
    case ScheduleMode::ReceiveTriggered:
        return QStringLiteral("receive-triggered");
    }
    return QString();
}

TransactionScheduler::TransactionScheduler(const ConnectionConfig &config, SendFn send, QObject *parent)
    : QObject(parent),
      transactions_(config.autoTransactions),
      mode_(schedule_mode(config)),
      intervalMs_(config.intervalMs.value_or(0)),
      jitterMinMs_(config.jitterMinMs.value_or(0)),
      jitterMaxMs_(config.jitterMaxMs.value_or(0)),
      send_(std::move(send)),
      random_(QRandomGenerator::global()->generate()) {
    timer_.setSingleShot(true);
    timer_.setTimerType(Qt::PreciseTimer);
    connect(&timer_, &QTimer::timeout, this, &TransactionScheduler::onTimeout);
}

ScheduleMode TransactionScheduler::mode() const {
    return mode_;
}

bool TransactionScheduler::isRunning() const {
    return running_;
}

int TransactionScheduler::cursor() const {
    return cursor_;
}

quint64 TransactionScheduler::sentCount() const {
    return sentCount_;
}

void TransactionScheduler::start() {
    if (running_ || transactions_.isEmpty()) {
        return;
    }
    running_ = true;
    cursor_ = 0;
    emit cursorChanged(cursor_);
    if (mode_ == ScheduleMode::ReceiveTriggered) {
        return;
    }
    sendCurrent();
    if (running_) {
        armTimer();
    }
}

void TransactionScheduler::stop() {
    running_ = false;
    timer_.stop();
}

void TransactionScheduler::onDataReceived() {
    if (!running_ || mode_ != ScheduleMode::ReceiveTriggered) {
        return;
    }
    sendCurrent();
}

qint64 TransactionScheduler::nextDelayMs() {
    qint64 delay = intervalMs_;
    if (mode_ == ScheduleMode::JitteredInterval) {
        const quint32 span = jitterMaxMs_ - jitterMinMs_;
        const quint32 offset = span == std::numeric_limits<quint32>::max() ? random_.generate() : random_.bounded(span + 1);
        delay -= static_cast<qint64>(jitterMinMs_) + offset;
    }
    return delay;
}

void TransactionScheduler::onTimeout() {
    if (!running_) {
        return;
    }
    sendCurrent();
    if (running_) {
        armTimer();
    }
}

void TransactionScheduler::sendCurrent() {
    const Transaction tx = transactions_.at(cursor_);
    cursor_ = (cursor_ + 1) % static_cast<int>(transactions_.size());
    ++sentCount_;
    emit cursorChanged(cursor_);
    if (send_) {
        send_(tx);
    }
}

void TransactionScheduler::armTimer() {
    const qint64 delay = nextDelayMs();
    constexpr qint64 kMaxTimerMs = std::numeric_limits<int>::max();
    timer_.start(static_cast<int>(std::clamp<qint64>(delay, 0, kMaxTimerMs)));
}

}  // namespace nd::engine
