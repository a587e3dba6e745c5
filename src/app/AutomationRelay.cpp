#include "app/AutomationRelay.hpp"

#include <QDebug>
#include <QPointer>
#include <QString>

#include "app/AutomationQueueQueries.hpp"
#include "app/IBridgePort.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

AutomationRelay::AutomationRelay(IBridgePort& bridge, QObject* parent)
    : QObject(parent)
    , bridge_(bridge) {
}

AutomationRelay::~AutomationRelay() {
    stop();
}

void AutomationRelay::start() {
    if (started_) {
        return;
    }
    started_ = true;

    QPointer<AutomationRelay> self(this);

    StreamHandlers<AutomationQueue> queueHandlers;
    queueHandlers.onEvent = [self](const AutomationQueue& q) {
        if (!self) return;
        self->queue_ = q;
        emit self->queueChanged();
    };
    queueHandlers.onError = [self](const std::string& m) {
        if (self) self->recordError("automation queue", m);
    };
    queueSub_ = bridge_.watchAutomationQueue(std::move(queueHandlers));

    StreamHandlers<bool> runningHandlers;
    runningHandlers.onEvent = [self](const bool& running) {
        if (!self) return;
        if (self->running_ == running) return;
        self->running_ = running;
        emit self->runningChanged(running);
    };
    runningHandlers.onError = [self](const std::string& m) {
        if (self) self->recordError("automation status", m);
    };
    runningSub_ = bridge_.watchAutoCompressionStatus(std::move(runningHandlers));

    StreamHandlers<SchedulerState> schedulerHandlers;
    schedulerHandlers.onEvent = [self](const SchedulerState& s) {
        if (!self) return;
        self->schedulerState_ = s;
        emit self->schedulerStateChanged();
    };
    schedulerHandlers.onError = [self](const std::string& m) {
        if (self) self->recordError("scheduler state", m);
    };
    schedulerSub_ = bridge_.watchSchedulerState(std::move(schedulerHandlers));

    StreamHandlers<WatcherEvent> watcherHandlers;
    watcherHandlers.onEvent = [self](const WatcherEvent& e) {
        if (!self) return;
        self->lastWatcherEvent_ = e;
        emit self->watcherEventReceived(e);
    };
    watcherHandlers.onError = [self](const std::string& m) {
        if (self) self->recordError("watcher events", m);
    };
    watcherSub_ = bridge_.watchWatcherEvents(std::move(watcherHandlers));
}

void AutomationRelay::stop() {
    queueSub_.cancel();
    runningSub_.cancel();
    schedulerSub_.cancel();
    watcherSub_.cancel();
    started_ = false;
}

void AutomationRelay::restart() {
    stop();
    lastError_.reset();
    start();
}

std::optional<AutomationJob> AutomationRelay::activeAutomationJob() const {
    return app::activeAutomationJob(queue_);
}

std::size_t AutomationRelay::pendingAutomationCount() const {
    return app::pendingAutomationCount(queue_);
}

void AutomationRelay::recordError(const char* stream, const std::string& message) {
    qWarning() << "Bridge stream failed:" << stream << QString::fromStdString(message);
    lastError_ = message;
    emit streamFailed(QString::fromLatin1(stream), QString::fromStdString(message));
}

} // namespace pp::core::app
