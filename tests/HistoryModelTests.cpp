#include <gtest/gtest.h>

#include "app/JobCoordinator.hpp"
#include "support/FakeBridgePort.hpp"
#include "ui/HistoryModel.hpp"
#include "ui/UiFormatters.hpp"

using namespace pp::core;
using namespace pp::core::domain;
using pp::core::test::FakeBridgePort;
using pp::core::test::makeProgress;

TEST(HistoryModel, FollowsCoordinatorHistory) {
    FakeBridgePort bridge;
    app::JobCoordinator coordinator(bridge);
    ui::HistoryModel model;
    model.bind(coordinator);

    int resets = 0;
    QObject::connect(&model, &QAbstractItemModel::modelReset, [&resets]() { ++resets; });

    coordinator.startCompression("C:/Games/Hades", "Hades", CompressionAlgorithm::Lzx);
    bridge.progress.push(makeProgress(30, 100));
    EXPECT_EQ(model.rowCount(), 0);
    EXPECT_EQ(resets, 0);

    bridge.progress.finish();

    ASSERT_EQ(model.rowCount(), 1);
    EXPECT_EQ(resets, 1);
    EXPECT_EQ(model.columnCount(), ui::HistoryModel::ColumnCount);
    EXPECT_EQ(model.data(model.index(0, ui::HistoryModel::ColGame)).toString(), QStringLiteral("Hades"));
    EXPECT_EQ(model.data(model.index(0, ui::HistoryModel::ColStatus)).toString(), QStringLiteral("Completed"));
    EXPECT_EQ(model.data(model.index(0, ui::HistoryModel::ColAlgorithm)).toString(),
              QStringLiteral("LZX (Maximum)"));
    EXPECT_EQ(model.data(model.index(0, ui::HistoryModel::ColProgress)).toInt(), 30);
    EXPECT_FALSE(model.data(model.index(0, ui::HistoryModel::ColFinished)).toString().isEmpty());
    EXPECT_TRUE(model.data(model.index(0, ui::HistoryModel::ColError)).toString().isEmpty());

    ASSERT_TRUE(model.jobAtRow(0).has_value());
    EXPECT_EQ(model.jobAtRow(0)->gamePath, "C:/Games/Hades");
    EXPECT_FALSE(model.jobAtRow(1).has_value());
}

TEST(HistoryModel, DecompressionRowHasNoAlgorithm) {
    FakeBridgePort bridge;
    app::JobCoordinator coordinator(bridge);
    ui::HistoryModel model;
    model.bind(coordinator);

    coordinator.startDecompression("C:/Games/Hades", "Hades");
    bridge.completeDecompress(app::CallResult::success());

    ASSERT_EQ(model.rowCount(), 1);
    EXPECT_EQ(model.jobAtRow(0)->kind, JobKind::Decompression);
    EXPECT_TRUE(model.data(model.index(0, ui::HistoryModel::ColAlgorithm)).toString().isEmpty());
    EXPECT_EQ(ui::fmt::describeJob(*model.jobAtRow(0)), QStringLiteral("Decompression Hades: Completed"));
}

TEST(HistoryModel, HeadersAndInvalidIndexes) {
    ui::HistoryModel model;

    EXPECT_EQ(model.headerData(ui::HistoryModel::ColGame, Qt::Horizontal).toString(), QStringLiteral("Game"));
    EXPECT_EQ(model.headerData(ui::HistoryModel::ColError, Qt::Horizontal).toString(), QStringLiteral("Error"));
    EXPECT_FALSE(model.data(model.index(0, 0)).isValid());
}

TEST(UiFormatters, BytesAndProgress) {
    EXPECT_EQ(ui::fmt::formatBytes(512), QStringLiteral("512 B"));
    EXPECT_EQ(ui::fmt::formatBytes(1536), QStringLiteral("1.5 KB"));
    EXPECT_EQ(ui::fmt::formatBytes(3LL * 1024 * 1024 * 1024), QStringLiteral("3.0 GB"));

    EXPECT_TRUE(ui::fmt::formatProgress(std::nullopt).isEmpty());
    EXPECT_EQ(ui::fmt::formatProgress(makeProgress(42, 100)), QStringLiteral("42% (42/100 files)"));
}

TEST(UiFormatters, DescribeFailedJob) {
    CompressionJob job;
    job.gameName  = "Hades";
    job.algorithm = CompressionAlgorithm::Xpress4K;
    job.status    = JobStatus::Failed;
    job.error     = "disk full";

    EXPECT_EQ(ui::fmt::describeJob(job), QStringLiteral("Compression Hades [xpress4k]: Failed error=disk full"));
}
