#pragma once

#include <functional>
#include <memory>
#include <optional>
#include "game_store.hpp"
#include "player.hpp"

namespace tapcore {

/**
 * Resolves external identities to player rows.
 *
 * ensure() is the only path that creates players and their initial
 * GameState. Both steps are idempotent, so concurrent first logins for
 * the same identity converge on one player and one state row.
 */
class PlayerDirectory {
public:
    using TimeSource = std::function<TimePoint()>;

    explicit PlayerDirectory(std::shared_ptr<GameStore> store,
                             TimeSource now = [] { return Clock::now(); });

    /// Upsert the player's display metadata and make sure a GameState exists.
    Player ensure(const Identity& identity);

    /// Resolve without creating.
    std::optional<Player> find(int64_t external_id) const;

    /**
     * Resolve a player that must already have authenticated.
     *
     * @throws NotFoundError if the identity was never seen
     */
    Player require(int64_t external_id) const;

private:
    std::shared_ptr<GameStore> store_;
    TimeSource now_;
};

} // namespace tapcore
