#pragma once

#include <QAbstractTableModel>
#include <QPointer>
#include <optional>
#include <vector>

#include "domain/domain_model.hpp"

namespace pp::core::app {
class JobCoordinator;
}

namespace pp::core::ui {

// Newest-first table of finished compression jobs.
class HistoryModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit HistoryModel(QObject* parent = nullptr);

    // Follows the coordinator's history until it is destroyed.
    void bind(pp::core::app::JobCoordinator& coordinator);

    void setJobs(const std::vector<pp::core::domain::CompressionJob>& jobs);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    std::optional<pp::core::domain::CompressionJob> jobAtRow(int row) const;

    enum Column {
        ColGame = 0,
        ColKind,
        ColAlgorithm,
        ColStatus,
        ColProgress,
        ColFinished,
        ColError,
        ColumnCount
    };

private:
    void syncFromCoordinator();

    QVariant displayData(const pp::core::domain::CompressionJob& job, Column col) const;
    QVariant alignmentData(Column col) const;

    QPointer<pp::core::app::JobCoordinator>      coordinator_;
    std::vector<pp::core::domain::CompressionJob> jobs_;
};

} // namespace pp::core::ui
