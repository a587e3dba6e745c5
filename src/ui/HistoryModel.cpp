#include "ui/HistoryModel.hpp"
#include "ui/UiFormatters.hpp"

#include "app/JobCoordinator.hpp"

#include <QString>

namespace pp::core::ui {

using pp::core::domain::CompressionJob;
using pp::core::domain::JobKind;

namespace {

bool sameJobs(const std::vector<CompressionJob>& a, const std::vector<CompressionJob>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].gamePath != b[i].gamePath ||
            a[i].status != b[i].status ||
            a[i].startedAt != b[i].startedAt ||
            a[i].finishedAt != b[i].finishedAt) {
            return false;
        }
    }
    return true;
}

} // namespace

HistoryModel::HistoryModel(QObject* parent)
    : QAbstractTableModel(parent) {
}

void HistoryModel::bind(pp::core::app::JobCoordinator& coordinator) {
    if (coordinator_) {
        coordinator_->disconnect(this);
    }
    coordinator_ = &coordinator;
    connect(&coordinator, &pp::core::app::JobCoordinator::stateChanged,
            this, &HistoryModel::syncFromCoordinator);
    syncFromCoordinator();
}

void HistoryModel::syncFromCoordinator() {
    if (!coordinator_) {
        return;
    }
    // stateChanged also fires for progress ticks; only history moves matter here.
    if (sameJobs(jobs_, coordinator_->history())) {
        return;
    }
    setJobs(coordinator_->history());
}

void HistoryModel::setJobs(const std::vector<CompressionJob>& jobs) {
    beginResetModel();
    jobs_ = jobs;
    endResetModel();
}

int HistoryModel::rowCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : static_cast<int>(jobs_.size());
}

int HistoryModel::columnCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : ColumnCount;
}

QVariant HistoryModel::displayData(const CompressionJob& job, Column col) const {
    switch (col) {
        case ColGame:
            return QString::fromStdString(job.gameName);

        case ColKind:
            return fmt::formatJobKind(job.kind);

        case ColAlgorithm:
            // Decompression carries a placeholder algorithm.
            if (job.kind == JobKind::Decompression) {
                return QString();
            }
            return fmt::formatAlgorithm(job.algorithm);

        case ColStatus:
            return fmt::formatJobStatus(job.status);

        case ColProgress:
            return job.progress ? QVariant(job.progress->percent()) : QVariant();

        case ColFinished:
            return job.finishedAt ? QVariant(fmt::formatLocalIso(*job.finishedAt)) : QVariant();

        case ColError:
            return job.error ? QString::fromStdString(*job.error) : QString();

        default:
            return {};
    }
}

QVariant HistoryModel::alignmentData(Column col) const {
    if (col == ColProgress) {
        return static_cast<int>(Qt::AlignRight | Qt::AlignVCenter);
    }
    return static_cast<int>(Qt::AlignLeft | Qt::AlignVCenter);
}

QVariant HistoryModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()) {
        return {};
    }

    const int row = index.row();
    if (row < 0 || row >= static_cast<int>(jobs_.size())) {
        return {};
    }

    const CompressionJob& job = jobs_[row];

    if (role == Qt::DisplayRole) {
        return displayData(job, static_cast<Column>(index.column()));
    }

    if (role == Qt::TextAlignmentRole) {
        return alignmentData(static_cast<Column>(index.column()));
    }

    return {};
}

QVariant HistoryModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case ColGame:
                return QStringLiteral("Game");
            case ColKind:
                return QStringLiteral("Kind");
            case ColAlgorithm:
                return QStringLiteral("Algorithm");
            case ColStatus:
                return QStringLiteral("Status");
            case ColProgress:
                return QStringLiteral("Progress %");
            case ColFinished:
                return QStringLiteral("Finished");
            case ColError:
                return QStringLiteral("Error");
            default:
                break;
        }
    }
    return QAbstractTableModel::headerData(section, orientation, role);
}

std::optional<CompressionJob> HistoryModel::jobAtRow(int row) const {
    if (row < 0 || row >= static_cast<int>(jobs_.size())) {
        return std::nullopt;
    }
    return jobs_[static_cast<size_t>(row)];
}

} // namespace pp::core::ui
