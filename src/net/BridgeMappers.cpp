#include "net/BridgeMappers.hpp"

#include <QDebug>
#include <QJsonArray>

#include <chrono>
#include <cstdint>

namespace pp::core::net {

using namespace pp::core::domain;

namespace {

std::optional<TimePoint> timeFromMs(const QJsonValue& v) {
    if (!v.isDouble()) {
        return std::nullopt;
    }
    const auto ms = static_cast<qint64>(v.toDouble());
    if (ms <= 0) {
        return std::nullopt;
    }
    return TimePoint{std::chrono::milliseconds(ms)};
}

std::int64_t int64From(const QJsonObject& o, const QString& key) {
    return static_cast<std::int64_t>(o.value(key).toVariant().toLongLong());
}

std::optional<std::string> optionalString(const QJsonObject& o, const QString& key) {
    const auto v = o.value(key);
    if (!v.isString()) {
        return std::nullopt;
    }
    return v.toString().toStdString();
}

QJsonArray toJsonArray(const std::vector<std::string>& items) {
    QJsonArray arr;
    for (const auto& s : items) {
        arr.push_back(QString::fromStdString(s));
    }
    return arr;
}

} // namespace

QString platformToWire(Platform p) {
    switch (p) {
        case Platform::Steam:          return QStringLiteral("steam");
        case Platform::EpicGames:      return QStringLiteral("epic_games");
        case Platform::GogGalaxy:      return QStringLiteral("gog_galaxy");
        case Platform::UbisoftConnect: return QStringLiteral("ubisoft_connect");
        case Platform::EaApp:          return QStringLiteral("ea_app");
        case Platform::BattleNet:      return QStringLiteral("battle_net");
        case Platform::XboxGamePass:   return QStringLiteral("xbox_game_pass");
        case Platform::Custom:         return QStringLiteral("custom");
    }
    return QStringLiteral("custom");
}

std::optional<Platform> platformFromWire(const QString& s) {
    if (s == QLatin1String("steam"))           return Platform::Steam;
    if (s == QLatin1String("epic_games"))      return Platform::EpicGames;
    if (s == QLatin1String("gog_galaxy"))      return Platform::GogGalaxy;
    if (s == QLatin1String("ubisoft_connect")) return Platform::UbisoftConnect;
    if (s == QLatin1String("ea_app"))          return Platform::EaApp;
    if (s == QLatin1String("battle_net"))      return Platform::BattleNet;
    if (s == QLatin1String("xbox_game_pass"))  return Platform::XboxGamePass;
    if (s == QLatin1String("custom"))          return Platform::Custom;
    return std::nullopt;
}

QString algorithmToWire(CompressionAlgorithm a) {
    return QString::fromStdString(to_string(a));
}

std::optional<AutomationJobStatus> automationStatusFromWire(const QString& s) {
    if (s == QLatin1String("pending"))            return AutomationJobStatus::Pending;
    if (s == QLatin1String("waiting_for_settle")) return AutomationJobStatus::WaitingForSettle;
    if (s == QLatin1String("waiting_for_idle"))   return AutomationJobStatus::WaitingForIdle;
    if (s == QLatin1String("compressing"))        return AutomationJobStatus::Compressing;
    if (s == QLatin1String("completed"))          return AutomationJobStatus::Completed;
    if (s == QLatin1String("failed"))             return AutomationJobStatus::Failed;
    if (s == QLatin1String("skipped"))            return AutomationJobStatus::Skipped;
    return std::nullopt;
}

std::optional<SchedulerState> schedulerStateFromWire(const QString& s) {
    if (s == QLatin1String("idle"))             return SchedulerState::Idle;
    if (s == QLatin1String("settling"))         return SchedulerState::Settling;
    if (s == QLatin1String("waiting_for_idle")) return SchedulerState::WaitingForIdle;
    if (s == QLatin1String("safety_check"))     return SchedulerState::SafetyCheck;
    if (s == QLatin1String("compressing"))      return SchedulerState::Compressing;
    if (s == QLatin1String("paused"))           return SchedulerState::Paused;
    if (s == QLatin1String("backoff"))          return SchedulerState::Backoff;
    return std::nullopt;
}

std::optional<WatcherEventType> watcherEventTypeFromWire(const QString& s) {
    if (s == QLatin1String("installed"))   return WatcherEventType::Installed;
    if (s == QLatin1String("modified"))    return WatcherEventType::Modified;
    if (s == QLatin1String("uninstalled")) return WatcherEventType::Uninstalled;
    return std::nullopt;
}

CompressionProgress progressFromJson(const QJsonObject& o) {
    CompressionProgress p;
    p.gameName        = o.value(QStringLiteral("game_name")).toString().toStdString();
    p.filesTotal      = int64From(o, QStringLiteral("files_total"));
    p.filesProcessed  = int64From(o, QStringLiteral("files_processed"));
    p.bytesOriginal   = int64From(o, QStringLiteral("bytes_original"));
    p.bytesCompressed = int64From(o, QStringLiteral("bytes_compressed"));
    p.bytesSaved      = int64From(o, QStringLiteral("bytes_saved"));
    if (o.value(QStringLiteral("eta_ms")).isDouble()) {
        p.estimatedTimeRemaining = std::chrono::milliseconds(int64From(o, QStringLiteral("eta_ms")));
    }
    p.isComplete = o.value(QStringLiteral("is_complete")).toBool(false);
    return p;
}

std::optional<GameInfo> gameFromJson(const QJsonValue& v) {
    if (!v.isObject()) {
        return std::nullopt;
    }
    const auto o = v.toObject();

    GameInfo g;
    g.path = o.value(QStringLiteral("path")).toString().toStdString();
    if (g.path.empty()) {
        return std::nullopt;
    }
    g.name      = o.value(QStringLiteral("name")).toString().toStdString();
    g.platform  = platformFromWire(o.value(QStringLiteral("platform")).toString()).value_or(Platform::Custom);
    g.sizeBytes = int64From(o, QStringLiteral("size_bytes"));
    if (o.value(QStringLiteral("compressed_size")).isDouble()) {
        g.compressedSize = int64From(o, QStringLiteral("compressed_size"));
    }
    g.isCompressed    = o.value(QStringLiteral("is_compressed")).toBool(false);
    g.isDirectStorage = o.value(QStringLiteral("is_directstorage")).toBool(false);
    g.excluded        = o.value(QStringLiteral("excluded")).toBool(false);
    g.lastPlayed      = timeFromMs(o.value(QStringLiteral("last_played_ms")));
    return g;
}

GameList gamesFromJson(const QJsonValue& v) {
    GameList out;
    if (!v.isArray()) {
        return out;
    }
    const auto arr = v.toArray();
    out.reserve(static_cast<size_t>(arr.size()));
    for (const auto& item : arr) {
        if (auto g = gameFromJson(item)) {
            out.push_back(std::move(*g));
        }
    }
    return out;
}

std::optional<AutomationJob> automationJobFromJson(const QJsonValue& v) {
    if (!v.isObject()) {
        return std::nullopt;
    }
    const auto o = v.toObject();

    const auto status = automationStatusFromWire(o.value(QStringLiteral("status")).toString());
    if (!status) {
        qDebug() << "Skipping automation job with unknown status:" << o.value(QStringLiteral("status")).toString();
        return std::nullopt;
    }

    AutomationJob j;
    j.gamePath = o.value(QStringLiteral("game_path")).toString().toStdString();
    j.gameName = optionalString(o, QStringLiteral("game_name"));
    j.status   = *status;

    const auto kind = o.value(QStringLiteral("kind")).toString();
    if (kind == QLatin1String("reconcile")) {
        j.kind = AutomationJobKind::Reconcile;
    } else if (kind == QLatin1String("opportunistic")) {
        j.kind = AutomationJobKind::Opportunistic;
    } else {
        j.kind = AutomationJobKind::NewInstall;
    }

    if (const auto queued = timeFromMs(o.value(QStringLiteral("queued_at_ms"))); queued.has_value()) {
        j.queuedAt = *queued;
    }
    j.startedAt = timeFromMs(o.value(QStringLiteral("started_at_ms")));
    j.error     = optionalString(o, QStringLiteral("error"));
    return j;
}

AutomationQueue automationQueueFromJson(const QJsonValue& v) {
    AutomationQueue out;
    if (!v.isArray()) {
        return out;
    }
    for (const auto& item : v.toArray()) {
        if (auto j = automationJobFromJson(item)) {
            out.push_back(std::move(*j));
        }
    }
    return out;
}

std::optional<WatcherEvent> watcherEventFromJson(const QJsonValue& v) {
    if (!v.isObject()) {
        return std::nullopt;
    }
    const auto o = v.toObject();

    const auto type = watcherEventTypeFromWire(o.value(QStringLiteral("type")).toString());
    if (!type) {
        return std::nullopt;
    }

    WatcherEvent e;
    e.type     = *type;
    e.gamePath = o.value(QStringLiteral("game_path")).toString().toStdString();
    e.gameName = optionalString(o, QStringLiteral("game_name"));
    if (const auto ts = timeFromMs(o.value(QStringLiteral("timestamp_ms"))); ts.has_value()) {
        e.timestamp = *ts;
    }
    return e;
}

QJsonObject automationConfigToJson(const AutomationConfig& c) {
    QJsonObject o;
    o.insert(QStringLiteral("cpu_threshold_percent"), c.cpuThresholdPercent);
    o.insert(QStringLiteral("idle_duration_seconds"), static_cast<qint64>(c.idleDurationSeconds));
    o.insert(QStringLiteral("cooldown_seconds"),      static_cast<qint64>(c.cooldownSeconds));
    o.insert(QStringLiteral("watch_paths"),           toJsonArray(c.watchPaths));
    o.insert(QStringLiteral("excluded_paths"),        toJsonArray(c.excludedPaths));
    o.insert(QStringLiteral("algorithm"),             algorithmToWire(c.algorithm));
    return o;
}

} // namespace pp::core::net
