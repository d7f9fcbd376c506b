#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>

namespace nd::common {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

QString level_name(LogLevel level);

// Process-wide log hub. Engine components mirror their log lines here so a
// presentation layer can subscribe once instead of per connection.
class Logger : public QObject {
    Q_OBJECT

public:
    static Logger &instance();

    void log(LogLevel level, const QString &category, const QString &message);
    void info(const QString &category, const QString &message);
    void warn(const QString &category, const QString &message);

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

signals:
    void messageLogged(nd::common::LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    explicit Logger(QObject *parent = nullptr);

    mutable QMutex mutex_;
    LogLevel minimumLevel_ = LogLevel::Debug;
};

}  // namespace nd::common
