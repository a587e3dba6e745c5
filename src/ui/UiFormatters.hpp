#pragma once

#include <QString>

#include <cstdint>

#include "domain/domain_model.hpp"

namespace pp::core::ui::fmt {

// Convert domain timepoint to milliseconds since Unix epoch.
qint64 toUnixMs(pp::core::domain::TimePoint tp);

// Format a domain timepoint as local ISO datetime (Qt::ISODate).
QString formatLocalIso(pp::core::domain::TimePoint tp);

// 1536 -> "1.5 KB", binary units up to TB.
QString formatBytes(std::int64_t bytes);

QString formatJobStatus(pp::core::domain::JobStatus status);
QString formatJobKind(pp::core::domain::JobKind kind);
QString formatAlgorithm(pp::core::domain::CompressionAlgorithm algorithm);

// "42% (420/1000 files)"; empty when no progress has arrived.
QString formatProgress(const std::optional<pp::core::domain::CompressionProgress>& progress);

// One log line describing the job: "Compression Foo [xpress8k]: Running 42% ...".
QString describeJob(const pp::core::domain::CompressionJob& job);

} // namespace pp::core::ui::fmt
