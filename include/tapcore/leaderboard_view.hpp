#pragma once

#include <memory>
#include <vector>
#include "game_store.hpp"

namespace tapcore {

/// Read-only ranking of players by persisted tokens.
class LeaderboardView {
public:
    static constexpr int DEFAULT_LIMIT = 10;
    static constexpr int MAX_LIMIT = 100;

    explicit LeaderboardView(std::shared_ptr<const GameStore> store);

    /// Up to `limit` entries, tokens descending, ties by external id ascending.
    std::vector<LeaderboardEntry> top(int limit = DEFAULT_LIMIT) const;

private:
    std::shared_ptr<const GameStore> store_;
};

} // namespace tapcore
