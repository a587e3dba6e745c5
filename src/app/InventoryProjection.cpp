#include "app/InventoryProjection.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace pp::core::app {

using namespace pp::core::domain;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

template <typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compareBy(const GameInfo& a, const GameInfo& b, InventorySortField field) {
    switch (field) {
        case InventorySortField::Name:
            return threeWay(a.name, b.name);
        case InventorySortField::OriginalSize:
            return threeWay(a.sizeBytes, b.sizeBytes);
        case InventorySortField::SavingsPercent:
            return threeWay(a.savingsRatio(), b.savingsRatio());
        case InventorySortField::Platform:
            return threeWay(display_name(a.platform), display_name(b.platform));
    }
    return 0;
}

} // namespace

bool matchesFilter(const GameInfo& game, const InventoryFilter& filter) {
    if (!filter.platforms.empty() && filter.platforms.count(game.platform) == 0) {
        return false;
    }
    switch (filter.compression) {
        case CompressionFilter::All:
            return true;
        case CompressionFilter::Compressed:
            return game.isCompressed;
        case CompressionFilter::Uncompressed:
            return !game.isCompressed && !game.isDirectStorage;
    }
    return true;
}

std::string normalizeQuery(const std::string& raw) {
    const auto first = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) {
        return std::isspace(c) != 0;
    }).base();
    if (first >= last) {
        return {};
    }
    return toLower(std::string(first, last));
}

GameListPtr InventoryProjection::project(const GameListPtr& games,
                                         const std::string& query,
                                         InventorySortField field,
                                         SortDirection direction) {
    return project(games, query, InventoryFilter{}, field, direction);
}

GameListPtr InventoryProjection::project(const GameListPtr& games,
                                         const std::string& query,
                                         const InventoryFilter& filter,
                                         InventorySortField field,
                                         SortDirection direction) {
    const std::string normalized = normalizeQuery(query);

    if (hasCache_ &&
        games == lastSource_ &&
        normalized == lastQuery_ &&
        filter == lastFilter_ &&
        field == lastField_ &&
        direction == lastDirection_) {
        return cached_;
    }

    static const GameList kEmpty;
    cached_        = compute(games ? *games : kEmpty, normalized, filter, field, direction);
    lastSource_    = games;
    lastQuery_     = normalized;
    lastFilter_    = filter;
    lastField_     = field;
    lastDirection_ = direction;
    hasCache_      = true;
    ++computeCount_;
    return cached_;
}

GameListPtr InventoryProjection::compute(const GameList& games,
                                         const std::string& normalizedQuery,
                                         const InventoryFilter& filter,
                                         InventorySortField field,
                                         SortDirection direction) {
    GameList out;
    out.reserve(games.size());
    for (const auto& g : games) {
        if (!normalizedQuery.empty() && toLower(g.name).find(normalizedQuery) == std::string::npos) {
            continue;
        }
        if (!matchesFilter(g, filter)) {
            continue;
        }
        out.push_back(g);
    }

    const int sign = direction == SortDirection::Descending ? -1 : 1;
    std::stable_sort(out.begin(), out.end(), [field, sign](const GameInfo& a, const GameInfo& b) {
        return sign * compareBy(a, b, field) < 0;
    });

    return std::make_shared<const GameList>(std::move(out));
}

} // namespace pp::core::app
