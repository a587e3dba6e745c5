#include "app/GameCatalog.hpp"

#include <QDebug>
#include <QPointer>
#include <QString>

#include <algorithm>
#include <memory>

#include "app/IBridgePort.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

GameCatalog::GameCatalog(IBridgePort& bridge, QObject* parent)
    : QObject(parent)
    , bridge_(bridge) {
}

void GameCatalog::setLoading(bool loading) {
    if (loading_ == loading) {
        return;
    }
    loading_ = loading;
    emit loadingChanged(loading_);
}

void GameCatalog::refresh() {
    const unsigned requestId = ++requestGeneration_;
    setLoading(true);

    QPointer<GameCatalog> self(this);
    bridge_.listGames([self, requestId](const ListGamesResult& result) {
        if (!self || requestId != self->requestGeneration_) {
            return;
        }
        self->setLoading(false);

        if (!result.ok) {
            qWarning() << "Failed to load games:" << QString::fromStdString(result.error);
            self->lastError_ = "Failed to load games: " + result.error;
            emit self->changed();
            return;
        }

        self->lastError_.reset();
        self->games_ = std::make_shared<const GameList>(result.games);
        emit self->changed();
    });
}

void GameCatalog::setGames(GameList games) {
    ++requestGeneration_;
    setLoading(false);
    lastError_.reset();
    games_ = std::make_shared<const GameList>(std::move(games));
    emit changed();
}

void GameCatalog::updateGame(const GameInfo& game) {
    if (!games_) {
        return;
    }

    const auto it = std::find_if(games_->begin(), games_->end(),
                                 [&game](const GameInfo& g) { return g.path == game.path; });
    if (it == games_->end() || *it == game) {
        return;
    }

    auto next = std::make_shared<GameList>(*games_);
    (*next)[static_cast<std::size_t>(it - games_->begin())] = game;
    games_ = std::move(next);
    emit changed();
}

std::optional<GameInfo> GameCatalog::gameByPath(const std::string& path) const {
    if (!games_) {
        return std::nullopt;
    }
    const auto it = std::find_if(games_->begin(), games_->end(),
                                 [&path](const GameInfo& g) { return g.path == path; });
    if (it == games_->end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace pp::core::app
