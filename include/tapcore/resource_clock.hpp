#pragma once

#include "game_state.hpp"

namespace tapcore {

/// Energy and timestamp after regeneration catch-up.
struct Regen {
    double energy = 0.0;
    TimePoint last_update{};
};

/**
 * Time-based energy regeneration.
 *
 * Pure: nothing is persisted here. ActionProcessor folds the result into
 * the same atomic write as the action it precedes.
 */
class ResourceClock {
public:
    /**
     * energy' = min(cap, energy + regen_per_sec * max(0, now - last_update)).
     * last_update' = now, or the stored value if `now` lags behind it.
     */
    static Regen regen(const GameState& state, TimePoint now);

    /// Apply regen() to the state in place.
    static void catch_up(GameState& state, TimePoint now);
};

} // namespace tapcore
