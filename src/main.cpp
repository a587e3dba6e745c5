#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QString>

#include "app/AutomationRelay.hpp"
#include "app/AutomationSettingsSync.hpp"
#include "app/GameCatalog.hpp"
#include "app/InventoryStats.hpp"
#include "app/JobCoordinator.hpp"
#include "app/SettingsStore.hpp"
#include "infra/SettingsRepository.hpp"
#include "net/JsonBridgeClient.hpp"
#include "ui/HistoryModel.hpp"
#include "ui/UiFormatters.hpp"

using namespace pp::core;

namespace {

struct OneShotJob {
    domain::JobKind                             kind{domain::JobKind::Compression};
    std::string                                 path;
    std::string                                 name;
    std::optional<domain::CompressionAlgorithm> algorithm;
};

void logInventory(const app::GameCatalog& catalog) {
    const auto games = catalog.games();
    if (!games) {
        return;
    }
    const auto totals = app::totalSavings(*games);
    qInfo() << "Inventory:" << games->size() << "games,"
            << ui::fmt::formatBytes(totals.totalBytes) << "total,"
            << ui::fmt::formatBytes(totals.savedBytes) << "saved";
    for (const auto& [platform, count] : app::platformCounts(*games)) {
        qDebug() << "  " << QString::fromStdString(domain::display_name(platform)) << count;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pressplayd"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("PressPlay compression job coordinator"));
    parser.addHelpOption();

    const QCommandLineOption settingsOpt(QStringLiteral("settings"),
                                         QStringLiteral("Settings JSON file."),
                                         QStringLiteral("path"));
    const QCommandLineOption hostOpt(QStringLiteral("bridge-host"),
                                     QStringLiteral("Backend bridge host."),
                                     QStringLiteral("host"), QStringLiteral("127.0.0.1"));
    const QCommandLineOption portOpt(QStringLiteral("bridge-port"),
                                     QStringLiteral("Backend bridge port."),
                                     QStringLiteral("port"), QStringLiteral("47800"));
    const QCommandLineOption compressOpt(QStringLiteral("compress"),
                                         QStringLiteral("Compress one game and exit."),
                                         QStringLiteral("path"));
    const QCommandLineOption decompressOpt(QStringLiteral("decompress"),
                                           QStringLiteral("Decompress one game and exit."),
                                           QStringLiteral("path"));
    const QCommandLineOption nameOpt(QStringLiteral("name"),
                                     QStringLiteral("Display name for --compress/--decompress."),
                                     QStringLiteral("name"));
    const QCommandLineOption algorithmOpt(QStringLiteral("algorithm"),
                                          QStringLiteral("xpress4k, xpress8k, xpress16k or lzx."),
                                          QStringLiteral("algorithm"));
    parser.addOptions({settingsOpt, hostOpt, portOpt, compressOpt, decompressOpt, nameOpt, algorithmOpt});
    parser.process(app);

    bool portOk = false;
    const auto port = parser.value(portOpt).toUShort(&portOk);
    if (!portOk || port == 0) {
        qCritical() << "Invalid --bridge-port:" << parser.value(portOpt);
        return 2;
    }

    std::optional<OneShotJob> oneShot;
    if (parser.isSet(compressOpt) && parser.isSet(decompressOpt)) {
        qCritical() << "--compress and --decompress are mutually exclusive";
        return 2;
    }
    if (parser.isSet(compressOpt) || parser.isSet(decompressOpt)) {
        OneShotJob job;
        job.kind = parser.isSet(compressOpt) ? domain::JobKind::Compression : domain::JobKind::Decompression;
        job.path = parser.value(job.kind == domain::JobKind::Compression ? compressOpt : decompressOpt).toStdString();
        job.name = parser.isSet(nameOpt)
            ? parser.value(nameOpt).toStdString()
            : QFileInfo(QString::fromStdString(job.path)).fileName().toStdString();
        if (parser.isSet(algorithmOpt)) {
            job.algorithm = domain::algorithm_from_string(parser.value(algorithmOpt).toLower().toStdString());
            if (!job.algorithm) {
                qCritical() << "Unknown --algorithm:" << parser.value(algorithmOpt);
                return 2;
            }
        }
        oneShot = std::move(job);
    }

    const QString settingsPath = parser.isSet(settingsOpt)
        ? parser.value(settingsOpt)
        : QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("settings.json"));
    qDebug() << "Settings path:" << settingsPath;

    // --- Settings ---------------------------------------------------------

    infra::SettingsRepository settingsRepo(settingsPath.toStdString());
    app::SettingsStore settings;
    settings.setSettings(settingsRepo.load());

    QFileSystemWatcher settingsWatcher;
    if (QFileInfo::exists(settingsPath)) {
        settingsWatcher.addPath(settingsPath);
    }
    QObject::connect(&settingsWatcher, &QFileSystemWatcher::fileChanged, [&](const QString& path) {
        qInfo() << "Settings file changed, reloading:" << path;
        settings.setSettings(settingsRepo.load());
        // Editors often replace the file, which drops it from the watch list.
        if (!settingsWatcher.files().contains(path) && QFileInfo::exists(path)) {
            settingsWatcher.addPath(path);
        }
    });

    // --- Bridge and state owners -----------------------------------------

    net::JsonBridgeClient bridge(parser.value(hostOpt), port);

    app::GameCatalog catalog(bridge);
    app::AutomationRelay relay(bridge);
    app::AutomationSettingsSync sync(bridge, settings);
    app::JobCoordinator coordinator(bridge, &catalog, &settings);

    ui::HistoryModel history;
    history.bind(coordinator);

    QObject::connect(&catalog, &app::GameCatalog::changed, [&]() {
        if (catalog.lastError()) {
            qWarning() << QString::fromStdString(*catalog.lastError());
            return;
        }
        logInventory(catalog);
    });

    QObject::connect(&relay, &app::AutomationRelay::queueChanged, [&]() {
        const auto active = relay.activeAutomationJob();
        qInfo() << "Automation queue:" << relay.pendingAutomationCount() << "pending,"
                << "active:" << (active ? QString::fromStdString(active->gamePath) : QStringLiteral("-"));
    });
    QObject::connect(&relay, &app::AutomationRelay::runningChanged, [](bool running) {
        qInfo() << "Auto-compression" << (running ? "running" : "stopped");
    });
    QObject::connect(&relay, &app::AutomationRelay::schedulerStateChanged, [&]() {
        if (relay.schedulerState()) {
            qInfo() << "Scheduler:" << QString::fromStdString(domain::to_string(*relay.schedulerState()));
        }
    });
    QObject::connect(&relay, &app::AutomationRelay::watcherEventReceived, [&](const domain::WatcherEvent& e) {
        qInfo() << "Watcher:" << QString::fromStdString(domain::to_string(e.type))
                << QString::fromStdString(e.gamePath);
        if (e.type != domain::WatcherEventType::Modified) {
            catalog.refresh();
        }
    });
    QObject::connect(&relay, &app::AutomationRelay::streamFailed, [](const QString& stream, const QString& message) {
        qWarning() << "Automation stream" << stream << "failed:" << message;
    });

    QObject::connect(&sync, &app::AutomationSettingsSync::configPushed, [](const domain::AutomationConfig& c) {
        qInfo() << "Automation config pushed: cpu" << c.cpuThresholdPercent
                << "idle" << c.idleDurationSeconds << "s cooldown" << c.cooldownSeconds << "s";
    });
    QObject::connect(&sync, &app::AutomationSettingsSync::syncFailed, [](const QString& message) {
        qWarning() << "Automation sync failed:" << message;
    });

    QObject::connect(&coordinator, &app::JobCoordinator::stateChanged, [&]() {
        if (const auto& job = coordinator.activeJob(); job) {
            qDebug().noquote() << ui::fmt::describeJob(*job);
        }
    });
    QObject::connect(&coordinator, &app::JobCoordinator::jobFinished, [](const domain::CompressionJob& job) {
        qInfo().noquote() << "Finished:" << ui::fmt::describeJob(job);
    });

    // --- Startup ----------------------------------------------------------

    bool started = false;
    QObject::connect(&bridge, &net::JsonBridgeClient::connectedChanged, [&](bool connected) {
        if (!connected) {
            return;
        }
        catalog.refresh();
        if (started) {
            return;
        }
        started = true;
        relay.start();
        sync.start();

        if (!oneShot) {
            return;
        }
        if (oneShot->kind == domain::JobKind::Compression) {
            coordinator.startCompression(oneShot->path, oneShot->name, oneShot->algorithm);
        } else {
            coordinator.startDecompression(oneShot->path, oneShot->name);
        }
    });

    if (oneShot) {
        // Exit once the job has left the active slot.
        QObject::connect(&history, &QAbstractItemModel::modelReset, [&]() {
            const auto last = history.jobAtRow(0);
            if (!last || last->gamePath != oneShot->path || coordinator.activeJob()) {
                return;
            }
            const bool ok = last->status == domain::JobStatus::Completed;
            QCoreApplication::exit(ok ? 0 : 1);
        });
    }

    bridge.start();
    const int rc = app.exec();
    coordinator.dispose();
    return rc;
}
