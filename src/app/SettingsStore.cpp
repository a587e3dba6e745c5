#include "app/SettingsStore.hpp"

#include <algorithm>

namespace pp::core::app {

using namespace pp::core::domain;

namespace {

std::optional<std::string> normalizedApiKey(const std::optional<std::string>& key) {
    if (!key) {
        return std::nullopt;
    }
    const auto first = key->find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = key->find_last_not_of(" \t\r\n");
    return key->substr(first, last - first + 1);
}

} // namespace

AppSettings validated(AppSettings s) {
    s.cpuThreshold        = std::clamp(s.cpuThreshold, 5.0, 20.0);
    s.idleDurationMinutes = std::clamp(s.idleDurationMinutes, 5, 30);
    s.cooldownMinutes     = std::clamp(s.cooldownMinutes, 1, 120);
    if (s.themeVariant.empty()) {
        s.themeVariant = "cinematicDesert";
    }
    if (s.schemaVersion <= 0) {
        s.schemaVersion = 1;
    }
    s.steamGridDbApiKey = normalizedApiKey(s.steamGridDbApiKey);
    return s;
}

SettingsStore::SettingsStore(QObject* parent)
    : QObject(parent) {
}

void SettingsStore::setSettings(AppSettings settings) {
    settings_ = validated(std::move(settings));
    emit settingsChanged();
}

void SettingsStore::update(const std::function<void(AppSettings&)>& mutate) {
    if (!settings_) {
        return;
    }
    AppSettings next = *settings_;
    mutate(next);
    settings_ = validated(std::move(next));
    emit settingsChanged();
}

void SettingsStore::unload() {
    if (!settings_) {
        return;
    }
    settings_.reset();
    emit settingsChanged();
}

void SettingsStore::setAutoCompress(bool enabled) {
    update([enabled](AppSettings& s) { s.autoCompress = enabled; });
}

void SettingsStore::setAlgorithm(CompressionAlgorithm algorithm) {
    update([algorithm](AppSettings& s) { s.algorithm = algorithm; });
}

void SettingsStore::setCpuThreshold(double percent) {
    update([percent](AppSettings& s) { s.cpuThreshold = percent; });
}

void SettingsStore::setIdleDuration(int minutes) {
    update([minutes](AppSettings& s) { s.idleDurationMinutes = minutes; });
}

void SettingsStore::setCooldown(int minutes) {
    update([minutes](AppSettings& s) { s.cooldownMinutes = minutes; });
}

void SettingsStore::addCustomFolder(const std::string& path) {
    const auto first = path.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return;
    }
    const auto last = path.find_last_not_of(" \t\r\n");
    const std::string normalized = path.substr(first, last - first + 1);

    if (settings_ && std::find(settings_->customFolders.begin(),
                               settings_->customFolders.end(),
                               normalized) != settings_->customFolders.end()) {
        return;
    }
    update([&normalized](AppSettings& s) { s.customFolders.push_back(normalized); });
}

void SettingsStore::removeCustomFolder(const std::string& path) {
    update([&path](AppSettings& s) {
        s.customFolders.erase(std::remove(s.customFolders.begin(), s.customFolders.end(), path),
                              s.customFolders.end());
    });
}

void SettingsStore::toggleGameExclusion(const std::string& gamePath) {
    update([&gamePath](AppSettings& s) {
        auto it = std::find(s.excludedPaths.begin(), s.excludedPaths.end(), gamePath);
        if (it != s.excludedPaths.end()) {
            s.excludedPaths.erase(it);
        } else {
            s.excludedPaths.push_back(gamePath);
        }
    });
}

void SettingsStore::setThemeVariant(const std::string& variant) {
    update([&variant](AppSettings& s) { s.themeVariant = variant; });
}

} // namespace pp::core::app
