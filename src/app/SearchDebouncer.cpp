#include "app/SearchDebouncer.hpp"

#include <QString>

#include "app/InventoryProjection.hpp"

namespace pp::core::app {

SearchDebouncer::SearchDebouncer(QObject* parent)
    : SearchDebouncer(kDefaultQuietPeriod, parent) {
}

SearchDebouncer::SearchDebouncer(std::chrono::milliseconds quietPeriod, QObject* parent)
    : QObject(parent) {
    timer_.setSingleShot(true);
    timer_.setInterval(quietPeriod);
    connect(&timer_, &QTimer::timeout, this, [this]() { commit(pending_); });
}

void SearchDebouncer::input(const std::string& raw) {
    const std::string normalized = normalizeQuery(raw);
    timer_.stop();

    if (normalized.empty()) {
        pending_.clear();
        commit(normalized);
        return;
    }

    pending_ = normalized;
    timer_.start();
}

void SearchDebouncer::commit(const std::string& normalized) {
    if (committed_ == normalized) {
        return;
    }
    committed_ = normalized;
    emit queryCommitted(QString::fromStdString(committed_));
}

} // namespace pp::core::app
