#pragma once

#include <QObject>

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace pp::core::app {

class IBridgePort;
class SettingsStore;

// Keeps backend automation in line with the automation-relevant subset of settings.
//
// Each watched field is compared on its own against the last seen value; a settings
// change that touches none of them (theme, notifications, API keys) is ignored.
// Reaction per change:
//  - settings not loaded: nothing
//  - autoCompress on:     push full config, then start automation
//  - autoCompress off:    stop automation
class AutomationSettingsSync final : public QObject {
    Q_OBJECT

public:
    // Automation-relevant projection of AppSettings; fields are empty while settings are unknown.
    struct Projection {
        std::optional<bool>                         autoCompress;
        std::optional<double>                       cpuThreshold;
        std::optional<int>                          idleDurationMinutes;
        std::optional<int>                          cooldownMinutes;
        std::optional<std::vector<std::string>>     customFolders;
        std::optional<std::vector<std::string>>     excludedPaths;
        std::optional<domain::CompressionAlgorithm> algorithm;
    };

    AutomationSettingsSync(IBridgePort& bridge, SettingsStore& settings, QObject* parent = nullptr);

    // Evaluates the current settings once and then follows every change.
    void start();

    // Feeds one projection through change detection. start() routes every settings
    // change here; settings clamping happens before, in SettingsStore.
    void onProjection(const Projection& next);

    // Last config the backend accepted.
    const std::optional<domain::AutomationConfig>& lastPushedConfig() const noexcept {
        return lastPushed_;
    }

    static Projection project(const std::optional<domain::AppSettings>& settings);
    static domain::AutomationConfig buildConfig(const Projection& p);

signals:
    void configPushed(const pp::core::domain::AutomationConfig& config);
    void syncFailed(const QString& message);

private:
    void onSettingsChanged();
    bool differsFromLast(const Projection& next) const;
    void apply(const Projection& p);

    IBridgePort&   bridge_;
    SettingsStore& settings_;

    bool                                    started_{false};
    std::optional<Projection>               last_;
    std::optional<domain::AutomationConfig> lastPushed_;
};

} // namespace pp::core::app
