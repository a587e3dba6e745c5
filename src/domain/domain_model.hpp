#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pp::core::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// --- Compression algorithm --------------------------------------------------

// Windows Overlay Filter algorithms understood by the backend.
enum class CompressionAlgorithm {
    Xpress4K  = 0,
    Xpress8K  = 1,
    Xpress16K = 2,
    Lzx       = 3
};

inline constexpr CompressionAlgorithm kDefaultAlgorithm = CompressionAlgorithm::Xpress8K;

// --- Platform ---------------------------------------------------------------

enum class Platform {
    Steam          = 0,
    EpicGames      = 1,
    GogGalaxy      = 2,
    UbisoftConnect = 3,
    EaApp          = 4,
    BattleNet      = 5,
    XboxGamePass   = 6,
    Custom         = 7
};

// --- Game (inventory entity) ------------------------------------------------

struct GameInfo {
    std::string                name;
    std::string                path;
    Platform                   platform{Platform::Custom};
    std::int64_t               sizeBytes{0};
    std::optional<std::int64_t> compressedSize;
    bool                       isCompressed{false};
    bool                       isDirectStorage{false};
    bool                       excluded{false};
    std::optional<TimePoint>   lastPlayed;

    std::int64_t bytesSaved() const {
        if (!compressedSize) {
            return 0;
        }
        const auto saved = sizeBytes - *compressedSize;
        return saved > 0 ? saved : 0;
    }

    double savingsRatio() const {
        if (sizeBytes == 0 || !isCompressed) {
            return 0.0;
        }
        return static_cast<double>(bytesSaved()) / static_cast<double>(sizeBytes);
    }

    bool operator==(const GameInfo& o) const {
        return path == o.path &&
               name == o.name &&
               platform == o.platform &&
               sizeBytes == o.sizeBytes &&
               compressedSize == o.compressedSize &&
               isCompressed == o.isCompressed &&
               isDirectStorage == o.isDirectStorage &&
               excluded == o.excluded &&
               lastPlayed == o.lastPlayed;
    }
    bool operator!=(const GameInfo& o) const { return !(*this == o); }
};

using GameList    = std::vector<GameInfo>;
// Lists are shared immutably; pointer identity is the change signal for views.
using GameListPtr = std::shared_ptr<const GameList>;

// --- Compression progress ---------------------------------------------------

struct CompressionProgress {
    std::string                              gameName;
    std::int64_t                             filesTotal{0};
    std::int64_t                             filesProcessed{0};
    std::int64_t                             bytesOriginal{0};
    std::int64_t                             bytesCompressed{0};
    std::int64_t                             bytesSaved{0};
    std::optional<std::chrono::milliseconds> estimatedTimeRemaining;
    bool                                     isComplete{false};

    double fraction() const {
        if (filesTotal == 0) {
            return 0.0;
        }
        return static_cast<double>(filesProcessed) / static_cast<double>(filesTotal);
    }

    int percent() const {
        const double p = fraction() * 100.0;
        if (p < 0.0) return 0;
        if (p > 100.0) return 100;
        return static_cast<int>(p);
    }
};

// --- Job --------------------------------------------------------------------

enum class JobKind {
    Compression   = 0,
    Decompression = 1
};

enum class JobStatus {
    Running   = 0,
    Completed = 1,
    Failed    = 2,
    Cancelled = 3
};

struct CompressionJob {
    std::string                        gamePath;
    std::string                        gameName;
    JobKind                            kind{JobKind::Compression};
    CompressionAlgorithm               algorithm{kDefaultAlgorithm};
    JobStatus                          status{JobStatus::Running};
    std::optional<CompressionProgress> progress;
    std::optional<std::string>         error;

    TimePoint                startedAt{Clock::now()};
    std::optional<TimePoint> finishedAt;

    bool isActive() const noexcept { return status == JobStatus::Running; }
};

inline constexpr std::size_t kHistoryLimit = 10;

// Active slot plus newest-first history of terminal jobs.
struct CompressionState {
    std::optional<CompressionJob> activeJob;
    std::vector<CompressionJob>   history;

    bool hasActiveJob() const noexcept { return activeJob && activeJob->isActive(); }
};

// --- Automation -------------------------------------------------------------

enum class SchedulerState {
    Idle           = 0,
    Settling       = 1,
    WaitingForIdle = 2,
    SafetyCheck    = 3,
    Compressing    = 4,
    Paused         = 5,
    Backoff        = 6
};

enum class AutomationJobStatus {
    Pending          = 0,
    WaitingForSettle = 1,
    WaitingForIdle   = 2,
    Compressing      = 3,
    Completed        = 4,
    Failed           = 5,
    Skipped          = 6
};

enum class AutomationJobKind {
    NewInstall    = 0,
    Reconcile     = 1,
    Opportunistic = 2
};

struct AutomationJob {
    std::string                gamePath;
    std::optional<std::string> gameName;
    AutomationJobKind          kind{AutomationJobKind::NewInstall};
    AutomationJobStatus        status{AutomationJobStatus::Pending};
    TimePoint                  queuedAt{Clock::now()};
    std::optional<TimePoint>   startedAt;
    std::optional<std::string> error;
};

using AutomationQueue = std::vector<AutomationJob>;

struct AutomationConfig {
    double                   cpuThresholdPercent{10.0};
    std::int64_t             idleDurationSeconds{300};
    std::int64_t             cooldownSeconds{300};
    std::vector<std::string> watchPaths;
    std::vector<std::string> excludedPaths;
    CompressionAlgorithm     algorithm{kDefaultAlgorithm};

    bool operator==(const AutomationConfig& o) const {
        return cpuThresholdPercent == o.cpuThresholdPercent &&
               idleDurationSeconds == o.idleDurationSeconds &&
               cooldownSeconds == o.cooldownSeconds &&
               watchPaths == o.watchPaths &&
               excludedPaths == o.excludedPaths &&
               algorithm == o.algorithm;
    }
    bool operator!=(const AutomationConfig& o) const { return !(*this == o); }
};

// --- Watcher ----------------------------------------------------------------

enum class WatcherEventType {
    Installed   = 0,
    Modified    = 1,
    Uninstalled = 2
};

struct WatcherEvent {
    WatcherEventType           type{WatcherEventType::Modified};
    std::string                gamePath;
    std::optional<std::string> gameName;
    TimePoint                  timestamp{Clock::now()};
};

// --- Settings ---------------------------------------------------------------

struct AppSettings {
    static constexpr int kCurrentSchemaVersion = 2;

    int                        schemaVersion{kCurrentSchemaVersion};
    CompressionAlgorithm       algorithm{kDefaultAlgorithm};
    bool                       autoCompress{false};
    double                     cpuThreshold{10.0};
    int                        idleDurationMinutes{5};
    int                        cooldownMinutes{5};
    std::vector<std::string>   customFolders;
    std::vector<std::string>   excludedPaths;
    bool                       notificationsEnabled{true};
    std::string                themeVariant{"cinematicDesert"};
    bool                       directStorageOverrideEnabled{false};
    std::optional<std::string> steamGridDbApiKey;
    bool                       inventoryAdvancedScanEnabled{false};
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(CompressionAlgorithm a) {
    switch (a) {
        case CompressionAlgorithm::Xpress4K:  return "xpress4k";
        case CompressionAlgorithm::Xpress8K:  return "xpress8k";
        case CompressionAlgorithm::Xpress16K: return "xpress16k";
        case CompressionAlgorithm::Lzx:       return "lzx";
    }
    return "xpress8k";
}

inline std::optional<CompressionAlgorithm> algorithm_from_string(const std::string& s) {
    if (s == "xpress4k")  return CompressionAlgorithm::Xpress4K;
    if (s == "xpress8k")  return CompressionAlgorithm::Xpress8K;
    if (s == "xpress16k") return CompressionAlgorithm::Xpress16K;
    if (s == "lzx")       return CompressionAlgorithm::Lzx;
    return std::nullopt;
}

inline std::string display_name(CompressionAlgorithm a) {
    switch (a) {
        case CompressionAlgorithm::Xpress4K:  return "XPRESS 4K (Fast)";
        case CompressionAlgorithm::Xpress8K:  return "XPRESS 8K (Balanced)";
        case CompressionAlgorithm::Xpress16K: return "XPRESS 16K (Better Ratio)";
        case CompressionAlgorithm::Lzx:       return "LZX (Maximum)";
    }
    return "";
}

inline std::string display_name(Platform p) {
    switch (p) {
        case Platform::Steam:          return "Steam";
        case Platform::EpicGames:      return "Epic Games";
        case Platform::GogGalaxy:      return "GOG Galaxy";
        case Platform::UbisoftConnect: return "Ubisoft Connect";
        case Platform::EaApp:          return "EA App";
        case Platform::BattleNet:      return "Battle.net";
        case Platform::XboxGamePass:   return "Xbox Game Pass";
        case Platform::Custom:         return "Custom";
    }
    return "Custom";
}

inline std::string to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Running:   return "Running";
        case JobStatus::Completed: return "Completed";
        case JobStatus::Failed:    return "Failed";
        case JobStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline std::string to_string(JobKind k) {
    switch (k) {
        case JobKind::Compression:   return "Compression";
        case JobKind::Decompression: return "Decompression";
    }
    return "Unknown";
}

inline std::string to_string(SchedulerState s) {
    switch (s) {
        case SchedulerState::Idle:           return "Idle";
        case SchedulerState::Settling:       return "Settling";
        case SchedulerState::WaitingForIdle: return "WaitingForIdle";
        case SchedulerState::SafetyCheck:    return "SafetyCheck";
        case SchedulerState::Compressing:    return "Compressing";
        case SchedulerState::Paused:         return "Paused";
        case SchedulerState::Backoff:        return "Backoff";
    }
    return "Unknown";
}

inline std::string to_string(WatcherEventType t) {
    switch (t) {
        case WatcherEventType::Installed:   return "Installed";
        case WatcherEventType::Modified:    return "Modified";
        case WatcherEventType::Uninstalled: return "Uninstalled";
    }
    return "Unknown";
}

} // namespace pp::core::domain
