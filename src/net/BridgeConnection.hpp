#pragma once

#include <QObject>
#include <QJsonObject>
#include <QTcpSocket>

namespace pp::core::net {

// Thin wrapper over QTcpSocket for line-delimited JSON messages.
class BridgeConnection : public QObject {
    Q_OBJECT
public:
    BridgeConnection(const QString& host, quint16 port, QObject* parent = nullptr);
    ~BridgeConnection() override;

    const QString& host() const noexcept { return host_; }
    quint16 port() const noexcept { return port_; }

    bool isConnected() const noexcept {
        return socket_.state() == QAbstractSocket::ConnectedState;
    }

    void connectToHost();
    void disconnectFromHost();

    // Returns false if the socket is not connected; nothing is queued.
    bool sendJson(const QJsonObject& obj);

signals:
    void connectionReady();
    void jsonReceived(const QJsonObject& obj);
    void disconnected();

private slots:
    void onReadyRead();
    void onConnected();
    void onDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    void processIncomingData();
    void handleJsonLine(const QByteArray& line);

    QString    host_;
    quint16    port_{0};
    QTcpSocket socket_;
    QByteArray buffer_;
};

} // namespace pp::core::net
