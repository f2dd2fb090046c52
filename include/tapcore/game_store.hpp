#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "game_state.hpp"
#include "player.hpp"

namespace tapcore {

/// One row of the ranked token projection.
struct LeaderboardEntry {
    int64_t external_id = 0;
    std::optional<std::string> display_name;
    int64_t tokens = 0;
};

/**
 * Mutation applied to a working copy of a GameState row.
 *
 * Returns true when the action's guard held and its effect was applied.
 * Whatever the return value, the working copy is what gets committed.
 */
using StateTransition = std::function<bool(GameState&)>;

/// Outcome of an atomic conditional update.
struct StateUpdate {
    bool applied = false;
    GameState state;
};

/**
 * Storage backend consumed by the core.
 *
 * Implementations must make update_state() atomic per player row: the
 * transition observes the committed row and its result is committed
 * before any other writer sees the row. Rows are validated against
 * GameStateSchema on every write. Failures surface as StorageError.
 */
class GameStore {
public:
    virtual ~GameStore() = default;

    /**
     * Insert a player keyed by external id, or overwrite its display
     * metadata if it already exists. Returns the resulting row.
     */
    virtual Player upsert_player(const Identity& identity) = 0;

    /// Look up a player by external id.
    virtual std::optional<Player> find_player(int64_t external_id) const = 0;

    /**
     * Create the default GameState for a player unless one exists.
     * Returns true if a row was created.
     */
    virtual bool create_state_if_absent(int64_t player_id, TimePoint now) = 0;

    /// Plain read by player key.
    virtual std::optional<GameState> load_state(int64_t player_id) const = 0;

    /**
     * Atomic read-modify-write of one GameState row.
     *
     * @throws NotFoundError if the player has no GameState
     * @throws StorageError if the resulting row violates the schema
     */
    virtual StateUpdate update_state(int64_t player_id, const StateTransition& transition) = 0;

    /// Top-N rows by tokens descending, ties by external id ascending.
    virtual std::vector<LeaderboardEntry> top_by_tokens(int limit) const = 0;
};

} // namespace tapcore
