#include "app/CompletionReconciler.hpp"

#include <QDebug>
#include <QPointer>

#include <algorithm>

#include "app/IBridgePort.hpp"
#include "app/IGameCatalog.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

CompletionReconciler::CompletionReconciler(IBridgePort& bridge, IGameCatalog& catalog, QObject* parent)
    : QObject(parent)
    , bridge_(bridge)
    , catalog_(catalog) {
}

void CompletionReconciler::abandonPending() {
    ++generation_;
}

void CompletionReconciler::finish(ReconcileOutcome outcome, const Done& done) {
    if (outcome == ReconcileOutcome::Refreshed) {
        catalog_.refresh();
    }
    if (done) {
        done(outcome);
    }
}

void CompletionReconciler::reconcile(const std::string& gamePath, Done done) {
    const GameListPtr games = catalog_.games();
    if (!games) {
        finish(ReconcileOutcome::Refreshed, done);
        return;
    }

    const auto it = std::find_if(games->begin(), games->end(),
                                 [&gamePath](const GameInfo& g) { return g.path == gamePath; });
    if (it == games->end()) {
        finish(ReconcileOutcome::Refreshed, done);
        return;
    }

    QPointer<CompletionReconciler> self(this);
    const unsigned generation = generation_;

    bridge_.hydrateGame(it->path, it->name, it->platform,
                        [self, generation, done](const HydrateResult& result) {
        if (!self || self->generation_ != generation) {
            return;
        }

        if (result.ok && result.game.has_value()) {
            self->catalog_.updateGame(*result.game);
            self->finish(ReconcileOutcome::Hydrated, done);
            return;
        }

        if (!result.ok) {
            qDebug() << "Hydrate failed, refreshing catalog:" << QString::fromStdString(result.error);
        }
        self->finish(ReconcileOutcome::Refreshed, done);
    });
}

} // namespace pp::core::app
