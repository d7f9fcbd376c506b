#include "connection_instance.hpp"

#include "common/byte_codec.hpp"
#include "common/logger.hpp"

#include <QtCore/QFile>

namespace nd::engine {

ConnectionInstance::ConnectionInstance(ConnectionConfig config, QObject *parent)
    : QObject(parent), config_(std::move(config)) {}

ConnectionInstance::~ConnectionInstance() {
    releaseConnection();
}

const ConnectionConfig &ConnectionInstance::config() const {
    return config_;
}

QString ConnectionInstance::name() const {
    return config_.name;
}

ConnectionStatus ConnectionInstance::status() const {
    return status_;
}

QString ConnectionInstance::lastError() const {
    return lastError_;
}

int ConnectionInstance::autoTransactionIndex() const {
    return scheduler_ ? scheduler_->cursor() : 0;
}

quint16 ConnectionInstance::localPort() const {
    return connection_ ? local_port(*connection_) : 0;
}

bool ConnectionInstance::isDisposed() const {
    return disposed_;
}

bool ConnectionInstance::start() {
    if (disposed_) {
        appendLog(QStringLiteral("Cannot start: instance has been disposed."));
        return false;
    }

    ConfigError configError = ConfigError::None;
    QString reason;
    if (!validate_config(config_, &configError, &reason)) {
        appendLog(QStringLiteral("Failed to start: %1").arg(reason));
        recordError(reason);
        setStatus(ConnectionStatus::Error);
        return false;
    }

    releaseConnection();
    lastError_.clear();
    connection_ = make_connection(config_);
    ConnectionEvents *events = events_of(*connection_);
    connect(events, &ConnectionEvents::logMessage, this, &ConnectionInstance::appendLog);
    connect(events, &ConnectionEvents::statusChanged, this, &ConnectionInstance::onConnectionStatusChanged);
    connect(events, &ConnectionEvents::errorOccurred, this, &ConnectionInstance::recordError);
    connect(events, &ConnectionEvents::dataReceived, this, &ConnectionInstance::onConnectionData);

    if (config_.role != Role::Proxy && !config_.autoTransactions.isEmpty()) {
        scheduler_ = std::make_unique<TransactionScheduler>(config_, [this](const Transaction &tx) {
            if (connection_) {
                send(*connection_, tx);
            }
        });
        appendLog(QStringLiteral("Auto transactions: %1 (%2)")
                      .arg(QString::number(config_.autoTransactions.size()), schedule_mode_name(scheduler_->mode())));
    }

    return engine::start(*connection_);
}

void ConnectionInstance::stop() {
    if (scheduler_) {
        scheduler_->stop();
    }
    if (connection_) {
        engine::stop(*connection_);
    }
    setStatus(ConnectionStatus::Disconnected);
}

SendResult ConnectionInstance::sendManual(const Transaction &tx) {
    if (!connection_) {
        appendLog(QStringLiteral("Cannot send: Not connected."));
        return SendResult::NotConnected;
    }
    return send(*connection_, tx);
}

void ConnectionInstance::dispose() {
    if (disposed_) {
        return;
    }
    stop();
    releaseConnection();
    disposed_ = true;
}

void ConnectionInstance::appendLog(const QString &message) {
    const QDateTime timestamp = QDateTime::currentDateTime();
    if (config_.dumpFilePath && !config_.dumpFilePath->trimmed().isEmpty()) {
        QFile dump(*config_.dumpFilePath);
        const QByteArray line =
            QStringLiteral("[%1] %2\n").arg(timestamp.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")), message).toUtf8();
        if (!dump.open(QIODevice::WriteOnly | QIODevice::Append) || dump.write(line) != line.size()) {
            // Reported to subscribers only; writing it to the dump would recurse.
            const QString failure = QStringLiteral("Dump Error: %1").arg(dump.errorString());
            emit logged(LogEntry{timestamp, config_.name, failure});
            common::Logger::instance().warn(config_.name, failure);
        }
    }
    emit logged(LogEntry{timestamp, config_.name, message});
    common::Logger::instance().info(config_.name, message);
}

void ConnectionInstance::setStatus(ConnectionStatus status) {
    if (status_ == status) {
        return;
    }
    status_ = status;
    emit statusChanged();
}

void ConnectionInstance::recordError(const QString &message) {
    lastError_ = message;
    common::Logger::instance().log(common::LogLevel::Error, config_.name, message);
    emit errorOccurred(message);
}

void ConnectionInstance::onConnectionStatusChanged() {
    if (!connection_) {
        return;
    }
    const ConnectionStatus status = events_of(*connection_)->status();
    if (scheduler_ && status != ConnectionStatus::Connected) {
        scheduler_->stop();
    }
    setStatus(status);
    if (scheduler_ && status == ConnectionStatus::Connected) {
        scheduler_->start();
    }
}

void ConnectionInstance::onConnectionData(const QByteArray &data) {
    appendLog(QStringLiteral("Received %1 bytes:\n%2").arg(QString::number(data.size()), codec::hex_dump(data)));
    emit dataReceived(data);
    if (scheduler_) {
        scheduler_->onDataReceived();
    }
}

void ConnectionInstance::releaseConnection() {
    if (scheduler_) {
        scheduler_->stop();
        scheduler_.reset();
    }
    if (!connection_) {
        return;
    }
    ConnectionEvents *events = events_of(*connection_);
    events->disconnect(this);
    engine::stop(*connection_);
    connection_.reset();
}

}  // namespace nd::engine
