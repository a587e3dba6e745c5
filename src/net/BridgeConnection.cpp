#include "net/BridgeConnection.hpp"

#include <QJsonDocument>
#include <QDebug>

namespace pp::core::net {

BridgeConnection::BridgeConnection(const QString& host, quint16 port, QObject* parent)
    : QObject(parent)
    , host_(host)
    , port_(port) {

    socket_.setSocketOption(QAbstractSocket::LowDelayOption, 1);

    connect(&socket_, &QTcpSocket::readyRead, this, &BridgeConnection::onReadyRead);
    connect(&socket_, &QTcpSocket::connected, this, &BridgeConnection::onConnected);
    connect(&socket_, &QTcpSocket::disconnected, this, &BridgeConnection::onDisconnected);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &BridgeConnection::onSocketError);
}

BridgeConnection::~BridgeConnection() {
    // The socket aborts on destruction; its signals must not reach a half-destroyed wrapper.
    socket_.disconnect(this);
}

void BridgeConnection::connectToHost() {
    // Avoid spamming connectToHost() while Qt is in HostLookup/Connecting states.
    if (socket_.state() != QAbstractSocket::UnconnectedState) {
        return;
    }
    buffer_.clear();
    socket_.connectToHost(host_, port_);
}

void BridgeConnection::disconnectFromHost() {
    if (socket_.state() == QAbstractSocket::UnconnectedState) {
        return;
    }
    socket_.disconnectFromHost();
}

void BridgeConnection::onConnected() {
    qInfo() << "Bridge connected:" << host_ << port_;
    emit connectionReady();
}

bool BridgeConnection::sendJson(const QJsonObject& obj) {
    if (!isConnected()) {
        return false;
    }
    const auto payload = QJsonDocument(obj).toJson(QJsonDocument::Compact) + QByteArrayLiteral("\n");
    return socket_.write(payload) == payload.size();
}

void BridgeConnection::onReadyRead() {
    buffer_.append(socket_.readAll());
    processIncomingData();
}

void BridgeConnection::processIncomingData() {
    while (true) {
        const auto newlineIndex = buffer_.indexOf('\n');
        if (newlineIndex < 0) {
            break;
        }

        const QByteArray line = buffer_.left(newlineIndex);
        buffer_.remove(0, newlineIndex + 1);

        if (line.trimmed().isEmpty()) {
            continue;
        }
        handleJsonLine(line);
    }
}

void BridgeConnection::handleJsonLine(const QByteArray& line) {
    QJsonParseError err{};
    const auto      doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Failed to parse JSON from bridge:" << err.errorString()
                   << "line:" << QString::fromUtf8(line.left(200));
        return;
    }
    emit jsonReceived(doc.object());
}

void BridgeConnection::onDisconnected() {
    qInfo() << "Bridge disconnected:" << host_ << port_;
    emit disconnected();
}

void BridgeConnection::onSocketError(QAbstractSocket::SocketError error) {
    Q_UNUSED(error);
    qWarning() << "Bridge socket error:" << socket_.errorString();
}

} // namespace pp::core::net
