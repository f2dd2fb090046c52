#include "tapcore/resource_clock.hpp"
#include "tapcore/helpers.hpp"
#include <algorithm>

namespace tapcore {

Regen ResourceClock::regen(const GameState& state, TimePoint now) {
    double elapsed = helpers::elapsed_seconds(state.last_update, now);
    double cap = static_cast<double>(state.cap);

    Regen result;
    result.energy = std::min(cap, state.energy + state.regen_per_sec * elapsed);
    result.last_update = std::max(state.last_update, now);
    return result;
}

void ResourceClock::catch_up(GameState& state, TimePoint now) {
    Regen result = regen(state, now);
    state.energy = result.energy;
    state.last_update = result.last_update;
}

} // namespace tapcore
