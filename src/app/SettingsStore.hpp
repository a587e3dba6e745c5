#pragma once

#include <QObject>

#include <functional>
#include <optional>

#include "domain/domain_model.hpp"

namespace pp::core::app {

// Clamp settings to the ranges the backend accepts.
domain::AppSettings validated(domain::AppSettings settings);

// In-memory owner of the current settings. Empty until the first load.
// Persistence belongs to infra; this class only holds and broadcasts.
class SettingsStore final : public QObject {
    Q_OBJECT

public:
    explicit SettingsStore(QObject* parent = nullptr);

    const std::optional<domain::AppSettings>& settings() const noexcept {
        return settings_;
    }

    bool isLoaded() const noexcept { return settings_.has_value(); }

    // Replaces the whole settings object (after validation).
    void setSettings(domain::AppSettings settings);

    // Applies a mutation to the loaded settings. No-op before the first load.
    void update(const std::function<void(domain::AppSettings&)>& mutate);

    // Forget loaded settings (e.g. the settings file became unreadable).
    void unload();

    void setAutoCompress(bool enabled);
    void setAlgorithm(domain::CompressionAlgorithm algorithm);
    void setCpuThreshold(double percent);
    void setIdleDuration(int minutes);
    void setCooldown(int minutes);
    void addCustomFolder(const std::string& path);
    void removeCustomFolder(const std::string& path);
    void toggleGameExclusion(const std::string& gamePath);
    void setThemeVariant(const std::string& variant);

signals:
    void settingsChanged();

private:
    std::optional<domain::AppSettings> settings_;
};

} // namespace pp::core::app
