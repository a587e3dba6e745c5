#pragma once

#include <QObject>

#include <cstddef>
#include <optional>
#include <string>

#include "app/Subscription.hpp"
#include "domain/domain_model.hpp"

namespace pp::core::app {

class IBridgePort;

// Re-exposes the backend's automation streams as observable state, so nothing else
// depends on bridge wire shapes.
//
// A stream error keeps the last received value and records the message; the stream
// is then considered closed until restart().
class AutomationRelay final : public QObject {
    Q_OBJECT

public:
    explicit AutomationRelay(IBridgePort& bridge, QObject* parent = nullptr);
    ~AutomationRelay() override;

    void start();
    void stop();
    void restart();

    const std::optional<domain::AutomationQueue>& queue() const noexcept { return queue_; }
    const std::optional<bool>& autoCompressionRunning() const noexcept { return running_; }
    const std::optional<domain::SchedulerState>& schedulerState() const noexcept { return schedulerState_; }
    const std::optional<domain::WatcherEvent>& lastWatcherEvent() const noexcept { return lastWatcherEvent_; }
    const std::optional<std::string>& lastError() const noexcept { return lastError_; }

    std::optional<domain::AutomationJob> activeAutomationJob() const;
    std::size_t pendingAutomationCount() const;

signals:
    void queueChanged();
    void runningChanged(bool running);
    void schedulerStateChanged();
    void watcherEventReceived(const pp::core::domain::WatcherEvent& event);
    void streamFailed(const QString& stream, const QString& message);

private:
    void recordError(const char* stream, const std::string& message);

    IBridgePort& bridge_;

    Subscription queueSub_;
    Subscription runningSub_;
    Subscription schedulerSub_;
    Subscription watcherSub_;

    std::optional<domain::AutomationQueue> queue_;
    std::optional<bool>                    running_;
    std::optional<domain::SchedulerState>  schedulerState_;
    std::optional<domain::WatcherEvent>    lastWatcherEvent_;
    std::optional<std::string>             lastError_;
    bool                                   started_{false};
};

} // namespace pp::core::app
