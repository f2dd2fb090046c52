#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "game_store.hpp"

namespace tapcore {

/// Outcome of a tap. `applied` is false when energy was short.
struct TapResult {
    bool applied = false;
    GameState state;
};

/// Outcome of an upgrade. A shortfall is reported through `ok` and `reason`.
struct UpgradeResult {
    bool ok = false;
    GameState state;
    /// Price charged on success, or the price that could not be met.
    int64_t cost = 0;
    std::optional<std::string> reason;
};

/**
 * Tap/upgrade state machine over GameState.
 *
 * Every action runs as one GameStore::update_state() call: energy is
 * caught up to `now`, then the action's guard is checked and its effect
 * applied against that same working copy. The catch-up is committed even
 * when the guard fails, and never on its own ahead of the action.
 */
class ActionProcessor {
public:
    using TimeSource = std::function<TimePoint()>;

    static constexpr const char* NOT_ENOUGH_COINS = "Not enough coins";

    explicit ActionProcessor(std::shared_ptr<GameStore> store,
                             TimeSource now = [] { return Clock::now(); });

    /// Persist the regen catch-up alone and return the resulting state.
    GameState refresh(int64_t player_id);

    /// Spend one energy for tap_power tokens.
    TapResult tap(int64_t player_id);

    /// Spend max(10, tap_power * 20) tokens for one more tap_power.
    UpgradeResult upgrade(int64_t player_id);

    /**
     * Tap transition on a working copy. Returns true if applied.
     */
    static bool apply_tap(GameState& state, TimePoint now);

    /**
     * Upgrade transition on a working copy. Returns true if applied;
     * `cost` receives the price evaluated after regen either way.
     */
    static bool apply_upgrade(GameState& state, TimePoint now, int64_t& cost);

private:
    std::shared_ptr<GameStore> store_;
    TimeSource now_;
};

} // namespace tapcore
