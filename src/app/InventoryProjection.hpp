#pragma once

#include <set>
#include <string>

#include "domain/domain_model.hpp"

namespace pp::core::app {

enum class InventorySortField {
    Name           = 0,
    OriginalSize   = 1,
    SavingsPercent = 2,
    Platform       = 3
};

enum class SortDirection {
    Ascending  = 0,
    Descending = 1
};

enum class CompressionFilter {
    All          = 0,
    Compressed   = 1,
    Uncompressed = 2   // not compressed and not DirectStorage
};

struct InventoryFilter {
    std::set<domain::Platform> platforms;   // empty = all platforms
    CompressionFilter          compression{CompressionFilter::All};

    bool operator==(const InventoryFilter& o) const {
        return platforms == o.platforms && compression == o.compression;
    }
    bool operator!=(const InventoryFilter& o) const { return !(*this == o); }
};

bool matchesFilter(const domain::GameInfo& game, const InventoryFilter& filter);

// trim + lowercase (ASCII).
std::string normalizeQuery(const std::string& raw);

// Memoized filter + sort over the inventory list.
//
// The list is compared by identity (shared_ptr address), never by content. When the
// list, the normalized query, the filter, the sort field and the direction all match
// the previous call, the very same result pointer is returned.
class InventoryProjection {
public:
    domain::GameListPtr project(const domain::GameListPtr& games,
                                const std::string& query,
                                InventorySortField field,
                                SortDirection direction);
    domain::GameListPtr project(const domain::GameListPtr& games,
                                const std::string& query,
                                const InventoryFilter& filter,
                                InventorySortField field,
                                SortDirection direction);

    // Number of real recomputations so far.
    std::size_t computeCount() const noexcept { return computeCount_; }

private:
    static domain::GameListPtr compute(const domain::GameList& games,
                                       const std::string& normalizedQuery,
                                       const InventoryFilter& filter,
                                       InventorySortField field,
                                       SortDirection direction);

    bool                hasCache_{false};
    domain::GameListPtr lastSource_;
    std::string         lastQuery_;
    InventoryFilter     lastFilter_;
    InventorySortField  lastField_{InventorySortField::Name};
    SortDirection       lastDirection_{SortDirection::Ascending};
    domain::GameListPtr cached_;
    std::size_t         computeCount_{0};
};

} // namespace pp::core::app
