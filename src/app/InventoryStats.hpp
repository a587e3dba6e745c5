#pragma once

#include <cstdint>
#include <map>

#include "domain/domain_model.hpp"

namespace pp::core::app {

struct SavingsTotals {
    std::int64_t totalBytes{0};
    std::int64_t savedBytes{0};
};

std::map<domain::Platform, int> platformCounts(const domain::GameList& games);
SavingsTotals totalSavings(const domain::GameList& games);

} // namespace pp::core::app
