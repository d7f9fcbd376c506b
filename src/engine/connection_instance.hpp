#pragma once

#include "connection.hpp"
#include "connection_config.hpp"
#include "transaction_scheduler.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <memory>
#include <optional>

namespace nd::engine {

struct LogEntry {
    QDateTime timestamp;
    QString connectionName;
    QString message;
};

// The unit a presentation layer manipulates: one Connection, its scheduler
// and its log sink. Must be used from the thread that created it.
class ConnectionInstance : public QObject {
    Q_OBJECT

public:
    explicit ConnectionInstance(ConnectionConfig config, QObject *parent = nullptr);
    ~ConnectionInstance() override;

    const ConnectionConfig &config() const;
    QString name() const;
    ConnectionStatus status() const;
    QString lastError() const;
    int autoTransactionIndex() const;
    quint16 localPort() const;
    bool isDisposed() const;

    // Returns false when the configuration is invalid or the socket could not
    // be connected/bound; lastError() then holds the reason.
    bool start();
    void stop();
    SendResult sendManual(const Transaction &tx);

    // Terminal: the instance cannot be started again.
    void dispose();

signals:
    void logged(nd::engine::LogEntry entry);
    void statusChanged();
    void errorOccurred(QString message);
    void dataReceived(QByteArray data);

private:
    void appendLog(const QString &message);
    void setStatus(ConnectionStatus status);
    void recordError(const QString &message);
    void onConnectionStatusChanged();
    void onConnectionData(const QByteArray &data);
    void releaseConnection();

    ConnectionConfig config_;
    std::optional<Connection> connection_;
    std::unique_ptr<TransactionScheduler> scheduler_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    QString lastError_;
    bool disposed_ = false;
};

}  // namespace nd::engine

Q_DECLARE_METATYPE(nd::engine::LogEntry)
