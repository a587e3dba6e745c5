#pragma once

#include <QObject>

#include <functional>
#include <string>

namespace pp::core::app {

class IBridgePort;
class IGameCatalog;

enum class ReconcileOutcome {
    Hydrated  = 0, // catalog entry replaced by the backend's fresh copy
    Refreshed = 1  // fell back to a full catalog reload
};

// Brings the catalog up to date after a job finished successfully.
//
// Two steps, never zero:
//  1. hydrate the affected entry (only if the catalog is loaded and knows the path)
//  2. on failure or an empty answer, request a full refresh
class CompletionReconciler final : public QObject {
    Q_OBJECT

public:
    using Done = std::function<void(ReconcileOutcome)>;

    CompletionReconciler(IBridgePort& bridge, IGameCatalog& catalog, QObject* parent = nullptr);

    void reconcile(const std::string& gamePath, Done done = {});

    // Drops results of every reconcile still in flight.
    void abandonPending();

private:
    void finish(ReconcileOutcome outcome, const Done& done);

    IBridgePort&  bridge_;
    IGameCatalog& catalog_;
    unsigned      generation_{0};
};

} // namespace pp::core::app
