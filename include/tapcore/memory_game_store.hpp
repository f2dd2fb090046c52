#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include "game_store.hpp"

namespace tapcore {

/**
 * Process-local GameStore.
 *
 * Player rows sit behind a single directory mutex; each GameState row
 * carries its own mutex so updates for different players do not contend.
 */
class InMemoryGameStore : public GameStore {
public:
    Player upsert_player(const Identity& identity) override;
    std::optional<Player> find_player(int64_t external_id) const override;
    bool create_state_if_absent(int64_t player_id, TimePoint now) override;
    std::optional<GameState> load_state(int64_t player_id) const override;
    StateUpdate update_state(int64_t player_id, const StateTransition& transition) override;
    std::vector<LeaderboardEntry> top_by_tokens(int limit) const override;

    size_t player_count() const;
    size_t state_count() const;

private:
    struct StateRow {
        mutable std::mutex mutex;
        GameState state;
    };

    std::shared_ptr<StateRow> find_row(int64_t player_id) const;

    mutable std::mutex players_mutex_;
    std::unordered_map<int64_t, Player> players_by_external_id_;
    std::unordered_map<int64_t, int64_t> external_id_by_player_id_;
    int64_t next_player_id_ = 1;

    mutable std::mutex states_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<StateRow>> states_;
};

} // namespace tapcore
