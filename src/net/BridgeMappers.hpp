#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

#include "domain/domain_model.hpp"

namespace pp::core::net {

// JSON <-> domain conversion for the bridge wire format.
// Keys are snake_case, timestamps are milliseconds since the Unix epoch,
// enums travel as snake_case strings.

QString platformToWire(domain::Platform p);
std::optional<domain::Platform> platformFromWire(const QString& s);

QString algorithmToWire(domain::CompressionAlgorithm a);

std::optional<domain::AutomationJobStatus> automationStatusFromWire(const QString& s);
std::optional<domain::SchedulerState> schedulerStateFromWire(const QString& s);
std::optional<domain::WatcherEventType> watcherEventTypeFromWire(const QString& s);

domain::CompressionProgress progressFromJson(const QJsonObject& o);

std::optional<domain::GameInfo> gameFromJson(const QJsonValue& v);
domain::GameList gamesFromJson(const QJsonValue& v);

std::optional<domain::AutomationJob> automationJobFromJson(const QJsonValue& v);
domain::AutomationQueue automationQueueFromJson(const QJsonValue& v);

std::optional<domain::WatcherEvent> watcherEventFromJson(const QJsonValue& v);

QJsonObject automationConfigToJson(const domain::AutomationConfig& c);

} // namespace pp::core::net
