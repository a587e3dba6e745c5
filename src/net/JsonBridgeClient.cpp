#include "net/JsonBridgeClient.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPointer>

#include <vector>

#include "net/BridgeMappers.hpp"

namespace pp::core::net {

using namespace pp::core::domain;
using pp::core::app::CallDone;
using pp::core::app::CallResult;
using pp::core::app::StreamHandlers;
using pp::core::app::Subscription;

namespace {

const QString kNotConnected = QStringLiteral("bridge not connected");
const QString kSendFailed   = QStringLiteral("bridge write failed");
const QString kDisconnected = QStringLiteral("bridge disconnected");

quint64 idFrom(const QJsonObject& obj, const QString& key) {
    return obj.value(key).toVariant().toULongLong();
}

} // namespace

JsonBridgeClient::JsonBridgeClient(const QString& host, quint16 port, QObject* parent)
    : QObject(parent)
    , connection_(std::make_unique<BridgeConnection>(host, port)) {

    connect(connection_.get(), &BridgeConnection::connectionReady,
            this, &JsonBridgeClient::onConnectionReady);
    connect(connection_.get(), &BridgeConnection::jsonReceived,
            this, &JsonBridgeClient::onJsonReceived);
    connect(connection_.get(), &BridgeConnection::disconnected,
            this, &JsonBridgeClient::onDisconnected);

    connect(&reconnectTimer_, &QTimer::timeout, this, [this]() {
        if (!connection_->isConnected()) {
            connection_->connectToHost(); // best-effort reconnect
        }
    });
}

JsonBridgeClient::~JsonBridgeClient() {
    reconnectTimer_.stop();
    // No handler may run once the client is gone.
    pendingCalls_.clear();
    streams_.clear();
    connection_->disconnect(this);
}

void JsonBridgeClient::start(std::chrono::milliseconds reconnectInterval) {
    reconnectTimer_.setInterval(static_cast<int>(reconnectInterval.count()));
    reconnectTimer_.start();
    connection_->connectToHost();
}

void JsonBridgeClient::stop() {
    reconnectTimer_.stop();
    connection_->disconnectFromHost();
}

// ---------------------------------------------------------------------------
// Calls
// ---------------------------------------------------------------------------

void JsonBridgeClient::call(const QString& method, const QJsonObject& params, ResultHandler handler) {
    const quint64 id = nextId_++;

    QJsonObject msg;
    msg.insert(QStringLiteral("type"), QStringLiteral("call"));
    msg.insert(QStringLiteral("id"), static_cast<qint64>(id));
    msg.insert(QStringLiteral("method"), method);
    msg.insert(QStringLiteral("params"), params);

    if (!connection_->sendJson(msg)) {
        // Completions are always asynchronous, even for a dead link.
        QTimer::singleShot(0, this, [handler = std::move(handler)]() {
            handler(false, QJsonValue(), kNotConnected);
        });
        return;
    }
    pendingCalls_.emplace(id, std::move(handler));
}

void JsonBridgeClient::callSimple(const QString& method, const QJsonObject& params, CallDone done) {
    call(method, params, [done = std::move(done)](bool ok, const QJsonValue&, const QString& error) {
        if (!done) {
            return;
        }
        done(ok ? CallResult::success() : CallResult::failure(error.toStdString()));
    });
}

void JsonBridgeClient::cancelCompression(CallDone done) {
    callSimple(QStringLiteral("cancel_compression"), QJsonObject{}, std::move(done));
}

void JsonBridgeClient::decompressGame(const std::string& gamePath, CallDone done) {
    QJsonObject params;
    params.insert(QStringLiteral("game_path"), QString::fromStdString(gamePath));
    callSimple(QStringLiteral("decompress_game"), params, std::move(done));
}

void JsonBridgeClient::hydrateGame(const std::string& gamePath,
                                   const std::string& gameName,
                                   Platform platform,
                                   app::HydrateDone done) {
    QJsonObject params;
    params.insert(QStringLiteral("game_path"), QString::fromStdString(gamePath));
    params.insert(QStringLiteral("game_name"), QString::fromStdString(gameName));
    params.insert(QStringLiteral("platform"), platformToWire(platform));

    call(QStringLiteral("hydrate_game"), params,
         [done = std::move(done)](bool ok, const QJsonValue& value, const QString& error) {
             app::HydrateResult r;
             r.ok = ok;
             if (ok) {
                 r.game = gameFromJson(value);
             } else {
                 r.error = error.toStdString();
             }
             done(r);
         });
}

void JsonBridgeClient::listGames(app::ListDone done) {
    call(QStringLiteral("list_games"), QJsonObject{},
         [done = std::move(done)](bool ok, const QJsonValue& value, const QString& error) {
             app::ListGamesResult r;
             r.ok = ok;
             if (ok) {
                 r.games = gamesFromJson(value);
             } else {
                 r.error = error.toStdString();
             }
             done(r);
         });
}

void JsonBridgeClient::updateAutomationConfig(const AutomationConfig& config, CallDone done) {
    QJsonObject params;
    params.insert(QStringLiteral("config"), automationConfigToJson(config));
    callSimple(QStringLiteral("update_automation_config"), params, std::move(done));
}

void JsonBridgeClient::startAutoCompression(CallDone done) {
    callSimple(QStringLiteral("start_auto_compression"), QJsonObject{}, std::move(done));
}

void JsonBridgeClient::stopAutoCompression(CallDone done) {
    callSimple(QStringLiteral("stop_auto_compression"), QJsonObject{}, std::move(done));
}

// ---------------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------------

bool JsonBridgeClient::sendSubscribe(quint64 subId, const RawStream& stream) {
    QJsonObject msg;
    msg.insert(QStringLiteral("type"), QStringLiteral("subscribe"));
    msg.insert(QStringLiteral("sub"), static_cast<qint64>(subId));
    msg.insert(QStringLiteral("topic"), stream.topic);
    msg.insert(QStringLiteral("params"), stream.params);
    return connection_->sendJson(msg);
}

Subscription JsonBridgeClient::openStream(RawStream stream) {
    const quint64 subId = nextId_++;
    // A watch that cannot be sent now goes out again on connectionReady.
    if (connection_->isConnected() && !sendSubscribe(subId, stream)) {
        qWarning() << "Subscribe to" << stream.topic << "not sent; waiting for reconnect";
    }
    return registerStream(subId, std::move(stream));
}

Subscription JsonBridgeClient::registerStream(quint64 subId, RawStream stream) {
    streams_.emplace(subId, std::move(stream));

    QPointer<JsonBridgeClient> self(this);
    return Subscription([self, subId]() {
        if (self) {
            self->closeStream(subId);
        }
    });
}

void JsonBridgeClient::closeStream(quint64 subId) {
    if (streams_.erase(subId) == 0) {
        return;
    }
    QJsonObject msg;
    msg.insert(QStringLiteral("type"), QStringLiteral("unsubscribe"));
    msg.insert(QStringLiteral("sub"), static_cast<qint64>(subId));
    if (!connection_->sendJson(msg)) {
        qDebug() << "Unsubscribe" << subId << "not sent; link is down";
    }
}

template <typename T>
Subscription JsonBridgeClient::watch(const QString& topic,
                                     StreamHandlers<T> handlers,
                                     std::function<std::optional<T>(const QJsonValue&)> decode) {
    RawStream raw;
    raw.topic       = topic;
    raw.resubscribe = true;
    raw.onEvent = [topic, onEvent = handlers.onEvent, decode = std::move(decode)](const QJsonValue& data) {
        auto value = decode(data);
        if (!value) {
            qDebug() << "Dropping undecodable event on" << topic;
            return;
        }
        if (onEvent) {
            onEvent(*value);
        }
    };
    raw.onError = [onError = handlers.onError](const QString& message) {
        if (onError) {
            onError(message.toStdString());
        }
    };
    raw.onDone = handlers.onDone;
    return openStream(std::move(raw));
}

app::StartResult JsonBridgeClient::compressGame(const app::CompressionRequest& request,
                                                StreamHandlers<CompressionProgress> handlers) {
    app::StartResult result;

    RawStream raw;
    raw.topic = QStringLiteral("compress_game");
    raw.params.insert(QStringLiteral("game_path"), QString::fromStdString(request.gamePath));
    raw.params.insert(QStringLiteral("game_name"), QString::fromStdString(request.gameName));
    raw.params.insert(QStringLiteral("algorithm"), algorithmToWire(request.algorithm));
    // Re-sending would start a second compression run.
    raw.resubscribe = false;

    raw.onEvent = [onEvent = handlers.onEvent](const QJsonValue& data) {
        if (onEvent && data.isObject()) {
            onEvent(progressFromJson(data.toObject()));
        }
    };
    raw.onError = [onError = handlers.onError](const QString& message) {
        if (onError) {
            onError(message.toStdString());
        }
    };
    raw.onDone = handlers.onDone;

    const quint64 subId = nextId_++;
    if (!sendSubscribe(subId, raw)) {
        qWarning() << "Could not send compress_game for" << QString::fromStdString(request.gamePath);
        result.error = connection_->isConnected() ? kSendFailed.toStdString() : kNotConnected.toStdString();
        return result;
    }
    result.subscription = registerStream(subId, std::move(raw));
    result.ok = true;
    return result;
}

Subscription JsonBridgeClient::watchAutomationQueue(StreamHandlers<AutomationQueue> handlers) {
    return watch<AutomationQueue>(
        QStringLiteral("automation_queue"), std::move(handlers),
        [](const QJsonValue& data) -> std::optional<AutomationQueue> {
            if (!data.isArray()) {
                return std::nullopt;
            }
            return automationQueueFromJson(data);
        });
}

Subscription JsonBridgeClient::watchAutoCompressionStatus(StreamHandlers<bool> handlers) {
    return watch<bool>(
        QStringLiteral("auto_compression_status"), std::move(handlers),
        [](const QJsonValue& data) -> std::optional<bool> {
            if (!data.isBool()) {
                return std::nullopt;
            }
            return data.toBool();
        });
}

Subscription JsonBridgeClient::watchSchedulerState(StreamHandlers<SchedulerState> handlers) {
    return watch<SchedulerState>(
        QStringLiteral("scheduler_state"), std::move(handlers),
        [](const QJsonValue& data) {
            return schedulerStateFromWire(data.toString());
        });
}

Subscription JsonBridgeClient::watchWatcherEvents(StreamHandlers<WatcherEvent> handlers) {
    return watch<WatcherEvent>(
        QStringLiteral("watcher_events"), std::move(handlers),
        [](const QJsonValue& data) {
            return watcherEventFromJson(data);
        });
}

// ---------------------------------------------------------------------------
// Connection events
// ---------------------------------------------------------------------------

void JsonBridgeClient::onConnectionReady() {
    for (const auto& [subId, stream] : streams_) {
        if (stream.resubscribe && !sendSubscribe(subId, stream)) {
            qWarning() << "Resubscribe to" << stream.topic << "failed";
        }
    }
    emit connectedChanged(true);
}

void JsonBridgeClient::onDisconnected() {
    // Handlers may re-enter; detach everything before invoking any of them.
    auto calls = std::move(pendingCalls_);
    pendingCalls_.clear();

    std::vector<std::function<void(const QString&)>> streamErrors;
    for (auto it = streams_.begin(); it != streams_.end();) {
        if (it->second.resubscribe) {
            ++it;
            continue;
        }
        streamErrors.push_back(std::move(it->second.onError));
        it = streams_.erase(it);
    }

    QPointer<JsonBridgeClient> self(this);
    for (auto& [id, handler] : calls) {
        Q_UNUSED(id);
        handler(false, QJsonValue(), kDisconnected);
        if (!self) {
            return;
        }
    }
    for (auto& onError : streamErrors) {
        if (onError) {
            onError(kDisconnected);
        }
        if (!self) {
            return;
        }
    }
    emit connectedChanged(false);
}

void JsonBridgeClient::onJsonReceived(const QJsonObject& obj) {
    const QString type = obj.value(QStringLiteral("type")).toString();

    if (type == QStringLiteral("result")) {
        handleResult(obj);
        return;
    }

    if (type == QStringLiteral("event") || type == QStringLiteral("error") || type == QStringLiteral("done")) {
        handleStreamMessage(type, obj);
        return;
    }

    qDebug() << "Unknown message type:" << type << "payload:" << QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

void JsonBridgeClient::handleResult(const QJsonObject& obj) {
    const auto it = pendingCalls_.find(idFrom(obj, QStringLiteral("id")));
    if (it == pendingCalls_.end()) {
        return;
    }
    auto handler = std::move(it->second);
    pendingCalls_.erase(it);

    const bool ok = obj.value(QStringLiteral("ok")).toBool(false);
    QString error = obj.value(QStringLiteral("error")).toString();
    if (!ok && error.isEmpty()) {
        error = QStringLiteral("unknown bridge error");
    }
    handler(ok, obj.value(QStringLiteral("value")), error);
}

void JsonBridgeClient::handleStreamMessage(const QString& type, const QJsonObject& obj) {
    const quint64 subId = idFrom(obj, QStringLiteral("sub"));
    const auto it = streams_.find(subId);
    if (it == streams_.end()) {
        // Late message for a cancelled subscription.
        return;
    }

    if (type == QStringLiteral("event")) {
        // Copy: the handler may cancel its own subscription.
        auto onEvent = it->second.onEvent;
        if (onEvent) {
            onEvent(obj.value(QStringLiteral("data")));
        }
        return;
    }

    RawStream stream = std::move(it->second);
    streams_.erase(it);

    if (type == QStringLiteral("error")) {
        QString message = obj.value(QStringLiteral("message")).toString();
        if (message.isEmpty()) {
            message = QStringLiteral("stream failed");
        }
        if (stream.onError) {
            stream.onError(message);
        }
        return;
    }

    if (stream.onDone) {
        stream.onDone();
    }
}

} // namespace pp::core::net
