#include "app/AutomationSettingsSync.hpp"

#include <QDebug>
#include <QPointer>
#include <QString>

#include "app/IBridgePort.hpp"
#include "app/SettingsStore.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

AutomationSettingsSync::AutomationSettingsSync(IBridgePort& bridge, SettingsStore& settings, QObject* parent)
    : QObject(parent)
    , bridge_(bridge)
    , settings_(settings) {
}

void AutomationSettingsSync::start() {
    if (started_) {
        return;
    }
    started_ = true;
    connect(&settings_, &SettingsStore::settingsChanged, this, &AutomationSettingsSync::onSettingsChanged);
    onSettingsChanged();
}

AutomationSettingsSync::Projection AutomationSettingsSync::project(
    const std::optional<AppSettings>& settings) {
    Projection p;
    if (!settings) {
        return p;
    }
    p.autoCompress        = settings->autoCompress;
    p.cpuThreshold        = settings->cpuThreshold;
    p.idleDurationMinutes = settings->idleDurationMinutes;
    p.cooldownMinutes     = settings->cooldownMinutes;
    p.customFolders       = settings->customFolders;
    p.excludedPaths       = settings->excludedPaths;
    p.algorithm           = settings->algorithm;
    return p;
}

AutomationConfig AutomationSettingsSync::buildConfig(const Projection& p) {
    const AppSettings defaults;

    AutomationConfig c;
    c.cpuThresholdPercent = p.cpuThreshold.value_or(defaults.cpuThreshold);
    c.idleDurationSeconds = static_cast<std::int64_t>(p.idleDurationMinutes.value_or(defaults.idleDurationMinutes)) * 60;
    c.cooldownSeconds     = static_cast<std::int64_t>(p.cooldownMinutes.value_or(defaults.cooldownMinutes)) * 60;
    c.watchPaths          = p.customFolders.value_or(std::vector<std::string>{});
    c.excludedPaths       = p.excludedPaths.value_or(std::vector<std::string>{});
    c.algorithm           = p.algorithm.value_or(kDefaultAlgorithm);
    return c;
}

bool AutomationSettingsSync::differsFromLast(const Projection& next) const {
    if (!last_) {
        return true;
    }
    const Projection& prev = *last_;
    return prev.autoCompress != next.autoCompress ||
           prev.cpuThreshold != next.cpuThreshold ||
           prev.idleDurationMinutes != next.idleDurationMinutes ||
           prev.cooldownMinutes != next.cooldownMinutes ||
           prev.customFolders != next.customFolders ||
           prev.excludedPaths != next.excludedPaths ||
           prev.algorithm != next.algorithm;
}

void AutomationSettingsSync::onSettingsChanged() {
    onProjection(project(settings_.settings()));
}

void AutomationSettingsSync::onProjection(const Projection& next) {
    if (!differsFromLast(next)) {
        return;
    }
    last_ = next;
    apply(next);
}

void AutomationSettingsSync::apply(const Projection& p) {
    if (!p.autoCompress.has_value()) {
        return;
    }

    QPointer<AutomationSettingsSync> self(this);

    if (!*p.autoCompress) {
        qInfo() << "Automation disabled, stopping backend scheduler";
        bridge_.stopAutoCompression([self](const CallResult& result) {
            if (!result.ok) {
                qWarning() << "Stop automation failed:" << QString::fromStdString(result.error);
                if (self) {
                    emit self->syncFailed(QString::fromStdString(result.error));
                }
            }
        });
        return;
    }

    const AutomationConfig config = buildConfig(p);
    qInfo() << "Pushing automation config: cpu" << config.cpuThresholdPercent
            << "idle" << config.idleDurationSeconds << "s"
            << "cooldown" << config.cooldownSeconds << "s"
            << "watch paths" << config.watchPaths.size();

    bridge_.updateAutomationConfig(config, [self, config](const CallResult& result) {
        if (!self) {
            return;
        }
        if (!result.ok) {
            // The next relevant settings change pushes again.
            qWarning() << "Automation config push failed:" << QString::fromStdString(result.error);
            emit self->syncFailed(QString::fromStdString(result.error));
            return;
        }
        self->lastPushed_ = config;
        emit self->configPushed(config);
    });

    bridge_.startAutoCompression([self](const CallResult& result) {
        if (!result.ok) {
            qWarning() << "Start automation failed:" << QString::fromStdString(result.error);
            if (self) {
                emit self->syncFailed(QString::fromStdString(result.error));
            }
        }
    });
}

} // namespace pp::core::app
