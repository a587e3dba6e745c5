#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>

#include "net/BridgeMappers.hpp"

using namespace pp::core;
using namespace pp::core::domain;

namespace {

QJsonValue parse(const char* json) {
    const auto doc = QJsonDocument::fromJson(QByteArray(json));
    if (doc.isArray()) {
        return doc.array();
    }
    return doc.object();
}

} // namespace

TEST(BridgeMappers, ParsesGameEntry) {
    const auto game = net::gameFromJson(parse(R"({
        "name": "Hades", "path": "C:/Games/Hades", "platform": "epic_games",
        "size_bytes": 15000000000, "compressed_size": 6000000000,
        "is_compressed": true, "is_directstorage": false, "excluded": true,
        "last_played_ms": 1700000000000
    })"));

    ASSERT_TRUE(game.has_value());
    EXPECT_EQ(game->name, "Hades");
    EXPECT_EQ(game->platform, Platform::EpicGames);
    EXPECT_EQ(game->sizeBytes, 15000000000LL);
    EXPECT_EQ(game->compressedSize, std::optional<std::int64_t>(6000000000LL));
    EXPECT_TRUE(game->isCompressed);
    EXPECT_TRUE(game->excluded);
    ASSERT_TRUE(game->lastPlayed.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(game->lastPlayed->time_since_epoch()).count(),
              1700000000000LL);
}

TEST(BridgeMappers, GameWithoutPathIsRejected) {
    EXPECT_FALSE(net::gameFromJson(parse(R"({"name":"Nameless"})")).has_value());
    EXPECT_FALSE(net::gameFromJson(QJsonValue(42)).has_value());
}

TEST(BridgeMappers, UnknownPlatformBecomesCustom) {
    const auto game = net::gameFromJson(parse(R"({"path":"x","platform":"itch_io"})"));

    ASSERT_TRUE(game.has_value());
    EXPECT_EQ(game->platform, Platform::Custom);
    EXPECT_FALSE(game->compressedSize.has_value());
}

TEST(BridgeMappers, PlatformWireNamesRoundTrip) {
    for (const auto p : {Platform::Steam, Platform::EpicGames, Platform::GogGalaxy, Platform::UbisoftConnect,
                         Platform::EaApp, Platform::BattleNet, Platform::XboxGamePass, Platform::Custom}) {
        EXPECT_EQ(net::platformFromWire(net::platformToWire(p)), std::optional<Platform>(p));
    }
}

TEST(BridgeMappers, QueueSkipsEntriesWithUnknownStatus) {
    const auto queue = net::automationQueueFromJson(parse(R"([
        {"game_path":"a","status":"waiting_for_settle","kind":"reconcile","queued_at_ms":1000},
        {"game_path":"b","status":"exploded"},
        {"game_path":"c","game_name":"C","status":"compressing","started_at_ms":2000},
        {"game_path":"d","status":"failed","error":"access denied"}
    ])"));

    ASSERT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue[0].status, AutomationJobStatus::WaitingForSettle);
    EXPECT_EQ(queue[0].kind, AutomationJobKind::Reconcile);
    EXPECT_EQ(queue[1].gameName, std::optional<std::string>("C"));
    EXPECT_TRUE(queue[1].startedAt.has_value());
    EXPECT_EQ(queue[2].error, std::optional<std::string>("access denied"));
}

TEST(BridgeMappers, SchedulerStates) {
    EXPECT_EQ(net::schedulerStateFromWire(QStringLiteral("safety_check")),
              std::optional<SchedulerState>(SchedulerState::SafetyCheck));
    EXPECT_EQ(net::schedulerStateFromWire(QStringLiteral("backoff")),
              std::optional<SchedulerState>(SchedulerState::Backoff));
    EXPECT_FALSE(net::schedulerStateFromWire(QStringLiteral("sleeping")).has_value());
}

TEST(BridgeMappers, WatcherEvent) {
    const auto e = net::watcherEventFromJson(parse(R"({"type":"uninstalled","game_path":"C:/Old"})"));

    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->type, WatcherEventType::Uninstalled);
    EXPECT_EQ(e->gamePath, "C:/Old");
    EXPECT_FALSE(e->gameName.has_value());

    EXPECT_FALSE(net::watcherEventFromJson(parse(R"({"type":"renamed","game_path":"x"})")).has_value());
}

TEST(BridgeMappers, ProgressFields) {
    const auto p = net::progressFromJson(parse(R"({
        "game_name":"Hades","files_total":200,"files_processed":50,
        "bytes_original":1000,"bytes_compressed":400,"bytes_saved":600,"eta_ms":1500
    })").toObject());

    EXPECT_EQ(p.gameName, "Hades");
    EXPECT_EQ(p.percent(), 25);
    EXPECT_EQ(p.bytesSaved, 600);
    ASSERT_TRUE(p.estimatedTimeRemaining.has_value());
    EXPECT_EQ(p.estimatedTimeRemaining->count(), 1500);
    EXPECT_FALSE(p.isComplete);
}

TEST(BridgeMappers, AutomationConfigToJson) {
    AutomationConfig c;
    c.cpuThresholdPercent = 12.5;
    c.idleDurationSeconds = 120;
    c.cooldownSeconds     = 300;
    c.watchPaths          = {"D:/Games"};
    c.algorithm           = CompressionAlgorithm::Xpress16K;

    const QJsonObject o = net::automationConfigToJson(c);

    EXPECT_DOUBLE_EQ(o.value(QStringLiteral("cpu_threshold_percent")).toDouble(), 12.5);
    EXPECT_EQ(o.value(QStringLiteral("idle_duration_seconds")).toInt(), 120);
    EXPECT_EQ(o.value(QStringLiteral("cooldown_seconds")).toInt(), 300);
    EXPECT_EQ(o.value(QStringLiteral("watch_paths")).toArray().size(), 1);
    EXPECT_TRUE(o.value(QStringLiteral("excluded_paths")).toArray().isEmpty());
    EXPECT_EQ(o.value(QStringLiteral("algorithm")).toString(), QStringLiteral("xpress16k"));
}
