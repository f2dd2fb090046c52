#include "tapcore/action_processor.hpp"
#include "tapcore/resource_clock.hpp"
#include <utility>

namespace tapcore {

ActionProcessor::ActionProcessor(std::shared_ptr<GameStore> store, TimeSource now)
    : store_(std::move(store)), now_(std::move(now)) {}

bool ActionProcessor::apply_tap(GameState& state, TimePoint now) {
    ResourceClock::catch_up(state, now);

    // Guard
    if (state.energy < 1.0) {
        return false;
    }

    // Compute
    state.energy -= 1.0;
    state.tokens += state.tap_power;
    return true;
}

bool ActionProcessor::apply_upgrade(GameState& state, TimePoint now, int64_t& cost) {
    ResourceClock::catch_up(state, now);
    cost = upgrade_cost(state.tap_power);

    // Guard
    if (state.tokens < cost) {
        return false;
    }

    // Compute
    state.tokens -= cost;
    state.tap_power += 1;
    return true;
}

GameState ActionProcessor::refresh(int64_t player_id) {
    TimePoint now = now_();
    auto update = store_->update_state(player_id, [now](GameState& state) {
        ResourceClock::catch_up(state, now);
        return true;
    });
    return update.state;
}

TapResult ActionProcessor::tap(int64_t player_id) {
    TimePoint now = now_();
    auto update = store_->update_state(player_id, [now](GameState& state) {
        return apply_tap(state, now);
    });
    return TapResult{update.applied, update.state};
}

UpgradeResult ActionProcessor::upgrade(int64_t player_id) {
    TimePoint now = now_();
    int64_t cost = 0;
    auto update = store_->update_state(player_id, [now, &cost](GameState& state) {
        return apply_upgrade(state, now, cost);
    });

    UpgradeResult result;
    result.ok = update.applied;
    result.state = update.state;
    result.cost = cost;
    if (!result.ok) {
        result.reason = NOT_ENOUGH_COINS;
    }
    return result;
}

} // namespace tapcore
