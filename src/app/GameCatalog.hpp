#pragma once

#include <QObject>

#include <optional>
#include <string>

#include "app/IGameCatalog.hpp"
#include "domain/domain_model.hpp"

namespace pp::core::app {

class IBridgePort;

// Owner of the inventory list. Every change publishes a new immutable list, so views
// can detect changes by pointer identity.
class GameCatalog final : public QObject, public IGameCatalog {
    Q_OBJECT

public:
    explicit GameCatalog(IBridgePort& bridge, QObject* parent = nullptr);

    domain::GameListPtr games() const override { return games_; }
    void updateGame(const domain::GameInfo& game) override;
    void refresh() override;

    // Replaces the list without asking the backend.
    void setGames(domain::GameList games);

    std::optional<domain::GameInfo> gameByPath(const std::string& path) const;

    bool isLoading() const noexcept { return loading_; }
    const std::optional<std::string>& lastError() const noexcept { return lastError_; }

signals:
    void changed();
    void loadingChanged(bool loading);

private:
    void setLoading(bool loading);

    IBridgePort&               bridge_;
    domain::GameListPtr        games_;
    std::optional<std::string> lastError_;
    // Only the newest refresh may publish its result.
    unsigned                   requestGeneration_{0};
    bool                       loading_{false};
};

} // namespace pp::core::app
