#pragma once

#include <QByteArray>

#include <string>

#include "domain/domain_model.hpp"

namespace pp::core::infra {

struct ParseSettingsResult {
    bool                ok = false;
    domain::AppSettings settings;
    std::string         error;
};

// Parses the settings JSON document (camelCase keys). Missing keys take defaults,
// out-of-range values are clamped.
ParseSettingsResult parseSettingsJson(const QByteArray& json);

// Read-only access to the settings file written by the desktop shell.
class SettingsRepository {
public:
    explicit SettingsRepository(std::string path);

    const std::string& path() const noexcept { return path_; }

    // If the file is missing or invalid, returns defaults and logs a warning.
    domain::AppSettings load() const;

private:
    std::string path_;
};

} // namespace pp::core::infra
