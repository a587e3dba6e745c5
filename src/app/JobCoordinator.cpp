#include "app/JobCoordinator.hpp"

#include <QDebug>
#include <QPointer>
#include <QString>

#include "app/CompletionReconciler.hpp"
#include "app/IBridgePort.hpp"
#include "app/IGameCatalog.hpp"
#include "app/SettingsStore.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

namespace {

inline QString q(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

JobCoordinator::JobCoordinator(IBridgePort& bridge,
                               IGameCatalog* catalog,
                               const SettingsStore* settings,
                               JobCoordinatorOptions options,
                               QObject* parent)
    : QObject(parent)
    , bridge_(bridge)
    , catalog_(catalog)
    , settings_(settings)
    , options_(options) {
    if (catalog_) {
        reconciler_ = new CompletionReconciler(bridge_, *catalog_, this);
    } else {
        qWarning() << "JobCoordinator has no game catalog; completed jobs will not update the inventory";
    }

    demotionTimer_.setSingleShot(true);
    connect(&demotionTimer_, &QTimer::timeout, this, &JobCoordinator::demoteTerminalJob);
}

JobCoordinator::~JobCoordinator() {
    dispose();
}

void JobCoordinator::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    demotionTimer_.stop();
    cancelSubscription();
    if (reconciler_) {
        reconciler_->abandonPending();
    }
}

std::optional<CompressionProgress> JobCoordinator::activeProgress() const {
    if (!state_.activeJob) {
        return std::nullopt;
    }
    return state_.activeJob->progress;
}

std::optional<std::string> JobCoordinator::compressingGameName() const {
    if (!state_.activeJob) {
        return std::nullopt;
    }
    return state_.activeJob->gameName;
}

bool JobCoordinator::isCompressing(const std::string& gamePath) const {
    return state_.activeJob &&
           state_.activeJob->gamePath == gamePath &&
           state_.activeJob->isActive();
}

CompressionAlgorithm JobCoordinator::resolveAlgorithm(
    std::optional<CompressionAlgorithm> requested) const {
    if (requested) {
        return *requested;
    }
    if (settings_ && settings_->settings()) {
        return settings_->settings()->algorithm;
    }
    return kDefaultAlgorithm;
}

bool JobCoordinator::beginJob(CompressionJob job) {
    if (disposed_) {
        return false;
    }
    if (state_.hasActiveJob()) {
        qDebug() << "Job rejected, another job is running:" << q(job.gamePath);
        return false;
    }

    // A finished job still on display leaves the slot before it is reused.
    demoteTerminalJob();

    ++jobSerial_;
    state_.activeJob = std::move(job);
    return true;
}

bool JobCoordinator::acceptsResultFor(unsigned serial) const {
    return !disposed_ && serial == jobSerial_ && state_.hasActiveJob();
}

void JobCoordinator::startCompression(const std::string& gamePath,
                                      const std::string& gameName,
                                      std::optional<CompressionAlgorithm> algorithm) {
    CompressionJob job;
    job.gamePath  = gamePath;
    job.gameName  = gameName;
    job.kind      = JobKind::Compression;
    job.algorithm = resolveAlgorithm(algorithm);
    job.status    = JobStatus::Running;

    const CompressionAlgorithm algo = job.algorithm;
    if (!beginJob(std::move(job))) {
        return;
    }

    qInfo() << "Compression started:" << q(gameName) << "algorithm:" << q(to_string(algo));
    emit stateChanged();

    cancelSubscription();

    QPointer<JobCoordinator> self(this);
    const unsigned serial = jobSerial_;

    StreamHandlers<CompressionProgress> handlers;
    handlers.onEvent = [self, serial](const CompressionProgress& progress) {
        if (self && self->acceptsResultFor(serial)) {
            self->onProgress(progress);
        }
    };
    handlers.onError = [self, serial](const std::string& message) {
        if (self && self->acceptsResultFor(serial)) {
            self->failJob(message);
        }
    };
    handlers.onDone = [self, serial]() {
        if (self && self->acceptsResultFor(serial)) {
            self->onStreamDone();
        }
    };

    StartResult started = bridge_.compressGame({gamePath, gameName, algo}, std::move(handlers));
    if (!started.ok) {
        failJob("Failed to start: " + started.error);
        return;
    }

    if (acceptsResultFor(serial)) {
        progressSubscription_ = std::move(started.subscription);
    } else {
        started.subscription.cancel();
    }
}

void JobCoordinator::cancelCompression() {
    if (disposed_ || !state_.hasActiveJob()) {
        return;
    }

    // Unsubscribe first so a late progress event cannot revive the job.
    cancelSubscription();

    bridge_.cancelCompression([](const CallResult& result) {
        if (!result.ok) {
            qWarning() << "Backend cancel failed (ignored):" << q(result.error);
        }
    });

    state_.activeJob->status     = JobStatus::Cancelled;
    state_.activeJob->finishedAt = Clock::now();
    qInfo() << "Job cancelled:" << q(state_.activeJob->gameName);

    emit stateChanged();
    emit jobFinished(*state_.activeJob);

    scheduleDemotion();
}

void JobCoordinator::startDecompression(const std::string& gamePath, const std::string& gameName) {
    CompressionJob job;
    job.gamePath  = gamePath;
    job.gameName  = gameName;
    job.kind      = JobKind::Decompression;
    job.algorithm = CompressionAlgorithm::Xpress4K;
    job.status    = JobStatus::Running;

    if (!beginJob(std::move(job))) {
        return;
    }

    qInfo() << "Decompression started:" << q(gameName);
    emit stateChanged();

    QPointer<JobCoordinator> self(this);
    const unsigned serial = jobSerial_;

    bridge_.decompressGame(gamePath, [self, serial](const CallResult& result) {
        if (!self || !self->acceptsResultFor(serial)) {
            return;
        }
        if (result.ok) {
            self->completeJob();
        } else {
            self->failJob("Decompression failed: " + result.error);
        }
    });
}

void JobCoordinator::onProgress(const CompressionProgress& progress) {
    // Newest event wins; nothing is buffered.
    state_.activeJob->progress = progress;
    emit stateChanged();
}

void JobCoordinator::onStreamDone() {
    completeJob();
}

void JobCoordinator::completeJob() {
    cancelSubscription();
    if (!state_.activeJob) {
        return;
    }

    CompressionJob completed = *state_.activeJob;
    completed.status     = JobStatus::Completed;
    completed.finishedAt = Clock::now();

    qInfo() << to_string(completed.kind).c_str() << "completed:" << q(completed.gameName);

    if (reconciler_) {
        reconciler_->reconcile(completed.gamePath);
    } else {
        qWarning() << "Inventory not reconciled after" << q(completed.gamePath) << "(no catalog)";
    }

    state_.activeJob.reset();
    pushHistory(completed);

    emit stateChanged();
    emit jobFinished(completed);
}

void JobCoordinator::failJob(const std::string& message) {
    cancelSubscription();
    if (!state_.activeJob) {
        return;
    }

    state_.activeJob->status     = JobStatus::Failed;
    state_.activeJob->error      = message;
    state_.activeJob->finishedAt = Clock::now();
    qWarning() << "Job failed:" << q(state_.activeJob->gameName) << q(message);

    emit stateChanged();
    emit jobFinished(*state_.activeJob);

    scheduleDemotion();
}

void JobCoordinator::scheduleDemotion() {
    demotionTimer_.stop();
    demotionTimer_.start(options_.terminalDisplayDelay);
}

void JobCoordinator::demoteTerminalJob() {
    demotionTimer_.stop();
    if (disposed_ || !state_.activeJob || state_.activeJob->isActive()) {
        return;
    }

    CompressionJob job = std::move(*state_.activeJob);
    state_.activeJob.reset();
    pushHistory(std::move(job));

    emit stateChanged();
}

void JobCoordinator::pushHistory(CompressionJob job) {
    state_.history.insert(state_.history.begin(), std::move(job));
    if (state_.history.size() > kHistoryLimit) {
        state_.history.resize(kHistoryLimit);
    }
}

void JobCoordinator::cancelSubscription() {
    progressSubscription_.cancel();
}

} // namespace pp::core::app
