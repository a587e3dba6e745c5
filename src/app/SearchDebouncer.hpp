#pragma once

#include <QObject>
#include <QTimer>

#include <chrono>
#include <string>

namespace pp::core::app {

// Turns raw search keystrokes into committed queries.
//
// Input is normalized (trim + lowercase) and committed after a quiet period with no
// further input. Clearing the field commits at once.
class SearchDebouncer final : public QObject {
    Q_OBJECT

public:
    static constexpr std::chrono::milliseconds kDefaultQuietPeriod{220};

    explicit SearchDebouncer(QObject* parent = nullptr);
    SearchDebouncer(std::chrono::milliseconds quietPeriod, QObject* parent = nullptr);

    void input(const std::string& raw);

    const std::string& committedQuery() const noexcept { return committed_; }
    bool hasPendingCommit() const { return timer_.isActive(); }

signals:
    void queryCommitted(const QString& query);

private:
    void commit(const std::string& normalized);

    QTimer      timer_;
    std::string pending_;
    std::string committed_;
};

} // namespace pp::core::app
