#include "tapcore/game_state.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/validation.hpp"
#include <algorithm>
#include <cmath>

namespace tapcore {

GameState GameState::initial(int64_t player_id, TimePoint now) {
    GameState state;
    state.player_id = player_id;
    state.energy = state.cap;
    state.last_update = now;
    return state;
}

int64_t upgrade_cost(int32_t tap_power) {
    return std::max<int64_t>(MIN_UPGRADE_COST,
                             static_cast<int64_t>(tap_power) * UPGRADE_COST_PER_POWER);
}

void GameStateSchema::check(const GameState& state) {
    validation::require_non_negative(state.tokens, "tokens");
    validation::require_positive(state.tap_power, "tap_power");
    validation::require_positive(state.cap, "cap");
    validation::require_positive(state.regen_per_sec, "regen_per_sec");
    if (!std::isfinite(state.energy) || !std::isfinite(state.regen_per_sec)) {
        throw StorageError::constraint_violation("energy and regen_per_sec must be finite");
    }
    validation::require_non_negative(state.energy, "energy");
    validation::require_at_most(state.energy, state.cap, "energy");
}

void GameStateSchema::check_transition(const GameState& before, const GameState& after) {
    check(after);
    if (after.player_id != before.player_id) {
        throw StorageError::constraint_violation("player_id is immutable");
    }
    if (after.last_update < before.last_update) {
        throw StorageError::constraint_violation("last_update must not move backwards");
    }
}

} // namespace tapcore
