#include <gtest/gtest.h>

#include <memory>

#include "app/CompletionReconciler.hpp"
#include "app/IGameCatalog.hpp"
#include "support/FakeBridgePort.hpp"

using namespace pp::core;
using namespace pp::core::domain;
using pp::core::test::FakeBridgePort;
using pp::core::test::makeGame;

namespace {

class RecordingCatalog : public app::IGameCatalog {
public:
    GameListPtr games() const override { return games_; }

    void updateGame(const GameInfo& game) override { updates.push_back(game); }
    void refresh() override { ++refreshes; }

    void load(GameList games) { games_ = std::make_shared<const GameList>(std::move(games)); }

    std::vector<GameInfo> updates;
    int                   refreshes{0};

private:
    GameListPtr games_;
};

} // namespace

TEST(CompletionReconciler, RefreshesWhenCatalogNotLoaded) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    app::CompletionReconciler reconciler(bridge, catalog);

    std::optional<app::ReconcileOutcome> outcome;
    reconciler.reconcile("a", [&](app::ReconcileOutcome o) { outcome = o; });

    EXPECT_EQ(outcome, app::ReconcileOutcome::Refreshed);
    EXPECT_EQ(catalog.refreshes, 1);
    EXPECT_TRUE(bridge.hydrateCalls.empty());
}

TEST(CompletionReconciler, RefreshesWhenPathUnknown) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    catalog.load({makeGame("A", "a")});
    app::CompletionReconciler reconciler(bridge, catalog);

    reconciler.reconcile("elsewhere");

    EXPECT_EQ(catalog.refreshes, 1);
    EXPECT_TRUE(bridge.hydrateCalls.empty());
}

TEST(CompletionReconciler, HydratedEntryReplacesCatalogEntry) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    catalog.load({makeGame("A", "a", 1000, Platform::GogGalaxy)});
    app::CompletionReconciler reconciler(bridge, catalog);

    std::optional<app::ReconcileOutcome> outcome;
    reconciler.reconcile("a", [&](app::ReconcileOutcome o) { outcome = o; });

    ASSERT_EQ(bridge.hydrateCalls.size(), 1u);
    EXPECT_EQ(bridge.hydrateCalls[0].gameName, "A");
    EXPECT_EQ(bridge.hydrateCalls[0].platform, Platform::GogGalaxy);
    EXPECT_FALSE(outcome.has_value());

    GameInfo fresh = makeGame("A", "a", 1000, Platform::GogGalaxy);
    fresh.isCompressed   = true;
    fresh.compressedSize = 400;
    app::HydrateResult result;
    result.game = fresh;
    bridge.completeHydrate(result);

    EXPECT_EQ(outcome, app::ReconcileOutcome::Hydrated);
    ASSERT_EQ(catalog.updates.size(), 1u);
    EXPECT_EQ(catalog.updates[0].compressedSize, std::optional<std::int64_t>(400));
    EXPECT_EQ(catalog.refreshes, 0);
}

TEST(CompletionReconciler, EmptyHydrateFallsBackToRefresh) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    catalog.load({makeGame("A", "a")});
    app::CompletionReconciler reconciler(bridge, catalog);

    std::optional<app::ReconcileOutcome> outcome;
    reconciler.reconcile("a", [&](app::ReconcileOutcome o) { outcome = o; });
    bridge.completeHydrate(app::HydrateResult{});

    EXPECT_EQ(outcome, app::ReconcileOutcome::Refreshed);
    EXPECT_EQ(catalog.refreshes, 1);
    EXPECT_TRUE(catalog.updates.empty());
}

TEST(CompletionReconciler, FailedHydrateFallsBackToRefresh) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    catalog.load({makeGame("A", "a")});
    app::CompletionReconciler reconciler(bridge, catalog);

    reconciler.reconcile("a");
    app::HydrateResult failed;
    failed.ok    = false;
    failed.error = "scan failed";
    bridge.completeHydrate(failed);

    EXPECT_EQ(catalog.refreshes, 1);
}

TEST(CompletionReconciler, AbandonedReconcileDoesNothing) {
    FakeBridgePort bridge;
    RecordingCatalog catalog;
    catalog.load({makeGame("A", "a")});
    app::CompletionReconciler reconciler(bridge, catalog);

    bool called = false;
    reconciler.reconcile("a", [&](app::ReconcileOutcome) { called = true; });
    reconciler.abandonPending();
    bridge.completeHydrate(app::HydrateResult{});

    EXPECT_FALSE(called);
    EXPECT_EQ(catalog.refreshes, 0);
}
