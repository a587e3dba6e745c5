#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QTimer>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

#include "app/IBridgePort.hpp"
#include "net/BridgeConnection.hpp"

namespace pp::core::net {

// IBridgePort over a single line-delimited JSON connection.
//
// Outgoing:
//   {"type":"call","id":N,"method":"...","params":{...}}
//   {"type":"subscribe","sub":N,"topic":"...","params":{...}}
//   {"type":"unsubscribe","sub":N}
// Incoming:
//   {"type":"result","id":N,"ok":true,"value":...,"error":"..."}
//   {"type":"event","sub":N,"data":...}
//   {"type":"error","sub":N,"message":"..."}
//   {"type":"done","sub":N}
//
// Watch streams survive a reconnect and are re-sent on connectionReady.
// Pending calls and compression progress streams fail when the link drops.
class JsonBridgeClient : public QObject, public app::IBridgePort {
    Q_OBJECT
public:
    JsonBridgeClient(const QString& host, quint16 port, QObject* parent = nullptr);
    ~JsonBridgeClient() override;

    // Connects and keeps reconnecting every reconnectInterval while the link is down.
    void start(std::chrono::milliseconds reconnectInterval = std::chrono::milliseconds(3000));
    void stop();

    bool isConnected() const noexcept { return connection_->isConnected(); }

    app::StartResult compressGame(const app::CompressionRequest& request,
                                  app::StreamHandlers<domain::CompressionProgress> handlers) override;
    void cancelCompression(app::CallDone done) override;
    void decompressGame(const std::string& gamePath, app::CallDone done) override;
    void hydrateGame(const std::string& gamePath,
                     const std::string& gameName,
                     domain::Platform platform,
                     app::HydrateDone done) override;
    void listGames(app::ListDone done) override;

    void updateAutomationConfig(const domain::AutomationConfig& config, app::CallDone done) override;
    void startAutoCompression(app::CallDone done) override;
    void stopAutoCompression(app::CallDone done) override;

    app::Subscription watchAutomationQueue(app::StreamHandlers<domain::AutomationQueue> handlers) override;
    app::Subscription watchAutoCompressionStatus(app::StreamHandlers<bool> handlers) override;
    app::Subscription watchSchedulerState(app::StreamHandlers<domain::SchedulerState> handlers) override;
    app::Subscription watchWatcherEvents(app::StreamHandlers<domain::WatcherEvent> handlers) override;

signals:
    void connectedChanged(bool connected);

private slots:
    void onConnectionReady();
    void onJsonReceived(const QJsonObject& obj);
    void onDisconnected();

private:
    using ResultHandler = std::function<void(bool ok, const QJsonValue& value, const QString& error)>;

    struct RawStream {
        QString     topic;
        QJsonObject params;
        bool        resubscribe{true};

        std::function<void(const QJsonValue&)> onEvent;
        std::function<void(const QString&)>    onError;
        std::function<void()>                  onDone;
    };

    void call(const QString& method, const QJsonObject& params, ResultHandler handler);
    void callSimple(const QString& method, const QJsonObject& params, app::CallDone done);

    app::Subscription openStream(RawStream stream);
    app::Subscription registerStream(quint64 subId, RawStream stream);
    void closeStream(quint64 subId);
    bool sendSubscribe(quint64 subId, const RawStream& stream);

    template <typename T>
    app::Subscription watch(const QString& topic,
                            app::StreamHandlers<T> handlers,
                            std::function<std::optional<T>(const QJsonValue&)> decode);

    void handleResult(const QJsonObject& obj);
    void handleStreamMessage(const QString& type, const QJsonObject& obj);

    std::unique_ptr<BridgeConnection> connection_;
    QTimer                            reconnectTimer_;

    quint64                                       nextId_{1};
    std::unordered_map<quint64, ResultHandler>    pendingCalls_;
    std::unordered_map<quint64, RawStream>        streams_;
};

} // namespace pp::core::net
