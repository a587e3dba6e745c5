#include "ui/UiFormatters.hpp"

#include <QDateTime>
#include <QTimeZone>
#include <chrono>

namespace pp::core::ui::fmt {

using namespace pp::core::domain;

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch())
            .count());
}

QString formatLocalIso(TimePoint tp) {
    const auto ms = toUnixMs(tp);
    const QDateTime dt =
        QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc());
    return dt.toLocalTime().toString(Qt::ISODate);
}

QString formatBytes(std::int64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(kUnits[unit]));
}

QString formatJobStatus(JobStatus status) {
    return QString::fromStdString(to_string(status));
}

QString formatJobKind(JobKind kind) {
    return QString::fromStdString(to_string(kind));
}

QString formatAlgorithm(CompressionAlgorithm algorithm) {
    return QString::fromStdString(display_name(algorithm));
}

QString formatProgress(const std::optional<CompressionProgress>& progress) {
    if (!progress) {
        return {};
    }
    return QStringLiteral("%1% (%2/%3 files)")
        .arg(progress->percent())
        .arg(progress->filesProcessed)
        .arg(progress->filesTotal);
}

QString describeJob(const CompressionJob& job) {
    QString line = formatJobKind(job.kind) + QLatin1Char(' ') + QString::fromStdString(job.gameName);
    if (job.kind != JobKind::Decompression) {
        line += QStringLiteral(" [%1]").arg(QString::fromStdString(to_string(job.algorithm)));
    }
    line += QStringLiteral(": ") + formatJobStatus(job.status);

    const QString progress = formatProgress(job.progress);
    if (!progress.isEmpty()) {
        line += QLatin1Char(' ') + progress;
    }
    if (job.error) {
        line += QStringLiteral(" error=") + QString::fromStdString(*job.error);
    }
    return line;
}

} // namespace pp::core::ui::fmt
