#include "app/InventoryStats.hpp"

namespace pp::core::app {

using namespace pp::core::domain;

std::map<Platform, int> platformCounts(const GameList& games) {
    std::map<Platform, int> counts;
    for (const auto& g : games) {
        ++counts[g.platform];
    }
    return counts;
}

SavingsTotals totalSavings(const GameList& games) {
    SavingsTotals t;
    for (const auto& g : games) {
        t.totalBytes += g.sizeBytes;
        t.savedBytes += g.bytesSaved();
    }
    return t;
}

} // namespace pp::core::app
