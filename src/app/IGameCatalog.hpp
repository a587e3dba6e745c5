#pragma once

#include "domain/domain_model.hpp"

namespace pp::core::app {

// Port to whoever owns the inventory list.
class IGameCatalog {
public:
    virtual ~IGameCatalog() = default;

    // nullptr until the first load has finished.
    virtual domain::GameListPtr games() const = 0;

    virtual void updateGame(const domain::GameInfo& game) = 0;

    // Full reload from the backend.
    virtual void refresh() = 0;
};

} // namespace pp::core::app
