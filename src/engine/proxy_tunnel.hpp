#pragma once

#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtCore/QString>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpSocket>

namespace nd::engine {

// One proxied client: the accepted local socket spliced to a fresh outbound
// connection. The tunnel ends as soon as either side closes or fails.
class ProxyTunnel : public QObject {
    Q_OBJECT

public:
    ProxyTunnel(QTcpSocket *local, QString tunnelId, QString remoteHost, quint16 remotePort,
                QObject *parent = nullptr);
    ~ProxyTunnel() override;

    QString id() const;
    QString peer() const;
    bool isFinished() const;

public slots:
    void start();
    void stop();

signals:
    void logMessage(QString message);
    void finished(QString tunnelId);

private slots:
    void onRemoteConnected();
    void onLocalReadyRead();
    void onRemoteReadyRead();
    void onLocalDisconnected();
    void onRemoteDisconnected();
    void onRemoteError(QAbstractSocket::SocketError error);

private:
    void forward(QTcpSocket *from, QTcpSocket *to, const QString &prefix);
    void finish();
    void closeSockets();
    void closeSocket(QScopedPointer<QTcpSocket> &socket);

    QScopedPointer<QTcpSocket> local_;
    QScopedPointer<QTcpSocket> remote_;
    QString tunnelId_;
    QString remoteHost_;
    quint16 remotePort_ = 0;
    QString peer_;
    bool remoteReady_ = false;
    bool finished_ = false;
};

}  // namespace nd::engine
