#include "tapcore/leaderboard_view.hpp"
#include <algorithm>
#include <utility>

namespace tapcore {

LeaderboardView::LeaderboardView(std::shared_ptr<const GameStore> store)
    : store_(std::move(store)) {}

std::vector<LeaderboardEntry> LeaderboardView::top(int limit) const {
    if (limit <= 0) {
        return {};
    }
    return store_->top_by_tokens(std::min(limit, MAX_LIMIT));
}

} // namespace tapcore
