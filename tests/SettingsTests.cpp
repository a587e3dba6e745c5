#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "app/SettingsStore.hpp"
#include "infra/SettingsRepository.hpp"

using namespace pp::core;
using namespace pp::core::domain;

TEST(SettingsParsing, EmptyObjectYieldsDefaults) {
    const auto parsed = infra::parseSettingsJson("{}");

    ASSERT_TRUE(parsed.ok);
    EXPECT_EQ(parsed.settings.algorithm, CompressionAlgorithm::Xpress8K);
    EXPECT_FALSE(parsed.settings.autoCompress);
    EXPECT_DOUBLE_EQ(parsed.settings.cpuThreshold, 10.0);
    EXPECT_EQ(parsed.settings.idleDurationMinutes, 5);
    EXPECT_EQ(parsed.settings.cooldownMinutes, 5);
    EXPECT_EQ(parsed.settings.themeVariant, "cinematicDesert");
    EXPECT_FALSE(parsed.settings.steamGridDbApiKey.has_value());
}

TEST(SettingsParsing, ReadsAndClampsValues) {
    const auto parsed = infra::parseSettingsJson(R"({
        "algorithm": "lzx",
        "autoCompress": true,
        "cpuThreshold": 95,
        "idleDurationMinutes": 1,
        "cooldownMinutes": 500,
        "customFolders": ["D:/Games", 42, "E:/More"],
        "excludedPaths": ["D:/Games/Skip"],
        "themeVariant": "",
        "steamGridDbApiKey": "  key  "
    })");

    ASSERT_TRUE(parsed.ok);
    const AppSettings& s = parsed.settings;
    EXPECT_EQ(s.algorithm, CompressionAlgorithm::Lzx);
    EXPECT_TRUE(s.autoCompress);
    EXPECT_DOUBLE_EQ(s.cpuThreshold, 20.0);
    EXPECT_EQ(s.idleDurationMinutes, 5);
    EXPECT_EQ(s.cooldownMinutes, 120);
    EXPECT_EQ(s.customFolders, (std::vector<std::string>{"D:/Games", "E:/More"}));
    EXPECT_EQ(s.excludedPaths, std::vector<std::string>{"D:/Games/Skip"});
    EXPECT_EQ(s.themeVariant, "cinematicDesert");
    EXPECT_EQ(s.steamGridDbApiKey, std::optional<std::string>("key"));
}

TEST(SettingsParsing, UnknownAlgorithmFallsBackToDefault) {
    const auto parsed = infra::parseSettingsJson(R"({"algorithm":"zstd"})");

    ASSERT_TRUE(parsed.ok);
    EXPECT_EQ(parsed.settings.algorithm, kDefaultAlgorithm);
}

TEST(SettingsParsing, RejectsMalformedDocuments) {
    EXPECT_FALSE(infra::parseSettingsJson("{not json").ok);
    EXPECT_FALSE(infra::parseSettingsJson("[1,2]").ok);
}

TEST(SettingsRepository, MissingFileYieldsDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    infra::SettingsRepository repo(dir.filePath(QStringLiteral("nope.json")).toStdString());

    const AppSettings s = repo.load();

    EXPECT_EQ(s.algorithm, kDefaultAlgorithm);
    EXPECT_FALSE(s.autoCompress);
}

TEST(SettingsRepository, LoadsFileFromDisk) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(R"({"autoCompress":true,"cooldownMinutes":30})");
    f.close();

    const AppSettings s = infra::SettingsRepository(path.toStdString()).load();

    EXPECT_TRUE(s.autoCompress);
    EXPECT_EQ(s.cooldownMinutes, 30);
}

TEST(SettingsStore, MutationsBeforeLoadAreIgnored) {
    app::SettingsStore store;
    int changes = 0;
    QObject::connect(&store, &app::SettingsStore::settingsChanged, [&changes]() { ++changes; });

    store.setAutoCompress(true);

    EXPECT_FALSE(store.isLoaded());
    EXPECT_EQ(changes, 0);
}

TEST(SettingsStore, SettersValidateAndNotify) {
    app::SettingsStore store;
    store.setSettings(AppSettings{});
    int changes = 0;
    QObject::connect(&store, &app::SettingsStore::settingsChanged, [&changes]() { ++changes; });

    store.setIdleDuration(2);
    store.setCpuThreshold(12.5);

    EXPECT_EQ(store.settings()->idleDurationMinutes, 5);
    EXPECT_DOUBLE_EQ(store.settings()->cpuThreshold, 12.5);
    EXPECT_EQ(changes, 2);
}

TEST(SettingsStore, CustomFoldersAreTrimmedAndUnique) {
    app::SettingsStore store;
    store.setSettings(AppSettings{});

    store.addCustomFolder("  D:/Games ");
    store.addCustomFolder("D:/Games");
    store.addCustomFolder("   ");

    EXPECT_EQ(store.settings()->customFolders, std::vector<std::string>{"D:/Games"});

    store.removeCustomFolder("D:/Games");
    EXPECT_TRUE(store.settings()->customFolders.empty());
}

TEST(SettingsStore, ToggleExclusionFlipsMembership) {
    app::SettingsStore store;
    store.setSettings(AppSettings{});

    store.toggleGameExclusion("a");
    EXPECT_EQ(store.settings()->excludedPaths, std::vector<std::string>{"a"});

    store.toggleGameExclusion("a");
    EXPECT_TRUE(store.settings()->excludedPaths.empty());
}

TEST(SettingsStore, UnloadForgetsSettings) {
    app::SettingsStore store;
    store.setSettings(AppSettings{});

    store.unload();

    EXPECT_FALSE(store.isLoaded());
}
