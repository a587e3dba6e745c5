#pragma once

#include <QObject>
#include <QTimer>

#include <chrono>
#include <optional>
#include <string>

#include "app/Subscription.hpp"
#include "domain/domain_model.hpp"

namespace pp::core::app {

class IBridgePort;
class IGameCatalog;
class SettingsStore;
class CompletionReconciler;

struct JobCoordinatorOptions {
    // How long a Failed/Cancelled job stays in the active slot before it moves to history.
    std::chrono::milliseconds terminalDisplayDelay{3000};
};

// Owns the single active job slot and the bounded history of finished jobs.
//
// Lifecycle of the slot:
//   Idle -> Running (start) -> Completed | Failed | Cancelled -> Idle (demoted to history)
//
// Completed jobs are demoted right away; Failed/Cancelled ones after terminalDisplayDelay
// or when the next job starts, whichever comes first.
class JobCoordinator final : public QObject {
    Q_OBJECT

public:
    JobCoordinator(IBridgePort& bridge,
                   IGameCatalog* catalog = nullptr,
                   const SettingsStore* settings = nullptr,
                   JobCoordinatorOptions options = JobCoordinatorOptions(),
                   QObject* parent = nullptr);
    ~JobCoordinator() override;

    const domain::CompressionState& state() const noexcept { return state_; }
    const std::optional<domain::CompressionJob>& activeJob() const noexcept { return state_.activeJob; }
    const std::vector<domain::CompressionJob>& history() const noexcept { return state_.history; }
    bool hasActiveJob() const noexcept { return state_.hasActiveJob(); }

    std::optional<domain::CompressionProgress> activeProgress() const;
    std::optional<std::string> compressingGameName() const;
    bool isCompressing(const std::string& gamePath) const;

    // No-op while a job is running, regardless of the target.
    void startCompression(const std::string& gamePath,
                          const std::string& gameName,
                          std::optional<domain::CompressionAlgorithm> algorithm = std::nullopt);

    // Local-first: the job becomes Cancelled whether or not the backend acknowledges.
    void cancelCompression();

    void startDecompression(const std::string& gamePath, const std::string& gameName);

    // Stops timers and subscriptions. After this no late completion touches the state.
    void dispose();
    bool isDisposed() const noexcept { return disposed_; }

signals:
    void stateChanged();
    void jobFinished(const pp::core::domain::CompressionJob& job);

private:
    domain::CompressionAlgorithm resolveAlgorithm(
        std::optional<domain::CompressionAlgorithm> requested) const;

    bool beginJob(domain::CompressionJob job);
    bool acceptsResultFor(unsigned serial) const;

    void onProgress(const domain::CompressionProgress& progress);
    void onStreamDone();

    void completeJob();
    void failJob(const std::string& message);

    void scheduleDemotion();
    void demoteTerminalJob();
    void pushHistory(domain::CompressionJob job);

    void cancelSubscription();

    IBridgePort&          bridge_;
    IGameCatalog*         catalog_;
    const SettingsStore*  settings_;
    JobCoordinatorOptions options_;

    CompletionReconciler* reconciler_{nullptr}; // owned via QObject parent

    domain::CompressionState state_;
    Subscription             progressSubscription_;
    QTimer                   demotionTimer_;

    // Incremented per started job; late results for an older job are dropped.
    unsigned jobSerial_{0};
    bool     disposed_{false};
};

} // namespace pp::core::app
