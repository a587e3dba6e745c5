#include "infra/SettingsRepository.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

#include "app/SettingsStore.hpp"

namespace pp::core::infra {

using pp::core::domain::AppSettings;

namespace {

std::vector<std::string> stringList(const QJsonValue& v) {
    std::vector<std::string> out;
    if (!v.isArray()) {
        return out;
    }
    const auto arr = v.toArray();
    out.reserve(static_cast<size_t>(arr.size()));
    for (const auto& item : arr) {
        if (item.isString()) {
            out.push_back(item.toString().toStdString());
        }
    }
    return out;
}

} // namespace

ParseSettingsResult parseSettingsJson(const QByteArray& json) {
    ParseSettingsResult result;

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(json, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = parseErr.error != QJsonParseError::NoError
            ? parseErr.errorString().toStdString()
            : std::string("root is not an object");
        return result;
    }

    const auto o = doc.object();
    const AppSettings defaults;
    AppSettings s;

    s.schemaVersion = o.value(QStringLiteral("schemaVersion")).toInt(1);
    s.algorithm = domain::algorithm_from_string(
                      o.value(QStringLiteral("algorithm")).toString().toStdString())
                      .value_or(domain::kDefaultAlgorithm);
    s.autoCompress        = o.value(QStringLiteral("autoCompress")).toBool(defaults.autoCompress);
    s.cpuThreshold        = o.value(QStringLiteral("cpuThreshold")).toDouble(defaults.cpuThreshold);
    s.idleDurationMinutes = o.value(QStringLiteral("idleDurationMinutes")).toInt(defaults.idleDurationMinutes);
    s.cooldownMinutes     = o.value(QStringLiteral("cooldownMinutes")).toInt(defaults.cooldownMinutes);
    s.customFolders       = stringList(o.value(QStringLiteral("customFolders")));
    s.excludedPaths       = stringList(o.value(QStringLiteral("excludedPaths")));
    s.notificationsEnabled = o.value(QStringLiteral("notificationsEnabled")).toBool(defaults.notificationsEnabled);
    s.themeVariant = o.value(QStringLiteral("themeVariant"))
                         .toString(QString::fromStdString(defaults.themeVariant))
                         .toStdString();
    s.directStorageOverrideEnabled =
        o.value(QStringLiteral("directStorageOverrideEnabled")).toBool(false);
    if (o.value(QStringLiteral("steamGridDbApiKey")).isString()) {
        s.steamGridDbApiKey = o.value(QStringLiteral("steamGridDbApiKey")).toString().toStdString();
    }
    s.inventoryAdvancedScanEnabled =
        o.value(QStringLiteral("inventoryAdvancedScanEnabled")).toBool(false);

    result.settings = pp::core::app::validated(std::move(s));
    result.ok = true;
    return result;
}

SettingsRepository::SettingsRepository(std::string path)
    : path_(std::move(path)) {
}

AppSettings SettingsRepository::load() const {
    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Settings file not found, using defaults:" << QString::fromStdString(path_);
        return AppSettings{};
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open settings file, using defaults:" << QString::fromStdString(path_);
        return AppSettings{};
    }

    const auto parsed = parseSettingsJson(file.readAll());
    if (!parsed.ok) {
        qWarning() << "Invalid settings file, using defaults:" << QString::fromStdString(parsed.error);
        return AppSettings{};
    }
    return parsed.settings;
}

} // namespace pp::core::infra
