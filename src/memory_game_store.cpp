#include "tapcore/memory_game_store.hpp"
#include "tapcore/errors.hpp"
#include <algorithm>
#include <string>

namespace tapcore {

Player InMemoryGameStore::upsert_player(const Identity& identity) {
    std::lock_guard<std::mutex> lock(players_mutex_);
    auto it = players_by_external_id_.find(identity.id);
    if (it == players_by_external_id_.end()) {
        Player player;
        player.id = next_player_id_++;
        player.external_id = identity.id;
        it = players_by_external_id_.emplace(identity.id, player).first;
        external_id_by_player_id_[player.id] = identity.id;
    }

    // Last write wins, absent fields included.
    Player& player = it->second;
    player.username = identity.username;
    player.first_name = identity.first_name;
    player.last_name = identity.last_name;
    player.photo_url = identity.photo_url;
    return player;
}

std::optional<Player> InMemoryGameStore::find_player(int64_t external_id) const {
    std::lock_guard<std::mutex> lock(players_mutex_);
    auto it = players_by_external_id_.find(external_id);
    if (it == players_by_external_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryGameStore::create_state_if_absent(int64_t player_id, TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(players_mutex_);
        if (external_id_by_player_id_.count(player_id) == 0) {
            throw StorageError::constraint_violation(
                "game_state.player_id references unknown player " + std::to_string(player_id));
        }
    }

    auto row = std::make_shared<StateRow>();
    row->state = GameState::initial(player_id, now);
    GameStateSchema::check(row->state);

    std::lock_guard<std::mutex> lock(states_mutex_);
    return states_.emplace(player_id, std::move(row)).second;
}

std::shared_ptr<InMemoryGameStore::StateRow> InMemoryGameStore::find_row(int64_t player_id) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(player_id);
    return it == states_.end() ? nullptr : it->second;
}

std::optional<GameState> InMemoryGameStore::load_state(int64_t player_id) const {
    auto row = find_row(player_id);
    if (!row) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(row->mutex);
    return row->state;
}

StateUpdate InMemoryGameStore::update_state(int64_t player_id, const StateTransition& transition) {
    auto row = find_row(player_id);
    if (!row) {
        throw NotFoundError("Game state not found for player " + std::to_string(player_id));
    }

    std::lock_guard<std::mutex> lock(row->mutex);
    GameState working = row->state;
    bool applied = transition(working);
    GameStateSchema::check_transition(row->state, working);
    row->state = working;
    return StateUpdate{applied, working};
}

std::vector<LeaderboardEntry> InMemoryGameStore::top_by_tokens(int limit) const {
    if (limit <= 0) {
        return {};
    }

    std::vector<std::pair<int64_t, int64_t>> tokens_by_player;
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        tokens_by_player.reserve(states_.size());
        for (const auto& [player_id, row] : states_) {
            std::lock_guard<std::mutex> row_lock(row->mutex);
            tokens_by_player.emplace_back(player_id, row->state.tokens);
        }
    }

    std::vector<LeaderboardEntry> entries;
    entries.reserve(tokens_by_player.size());
    {
        std::lock_guard<std::mutex> lock(players_mutex_);
        for (const auto& [player_id, tokens] : tokens_by_player) {
            auto ext = external_id_by_player_id_.find(player_id);
            if (ext == external_id_by_player_id_.end()) {
                continue;
            }
            const Player& player = players_by_external_id_.at(ext->second);
            entries.push_back(LeaderboardEntry{player.external_id, player.username, tokens});
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
                  if (a.tokens != b.tokens) return a.tokens > b.tokens;
                  return a.external_id < b.external_id;
              });
    if (entries.size() > static_cast<size_t>(limit)) {
        entries.resize(static_cast<size_t>(limit));
    }
    return entries;
}

size_t InMemoryGameStore::player_count() const {
    std::lock_guard<std::mutex> lock(players_mutex_);
    return players_by_external_id_.size();
}

size_t InMemoryGameStore::state_count() const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    return states_.size();
}

} // namespace tapcore
