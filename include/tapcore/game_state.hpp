#pragma once

#include <chrono>
#include <cstdint>

namespace tapcore {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr int32_t DEFAULT_LEVEL = 1;
constexpr int32_t DEFAULT_TAP_POWER = 1;
constexpr int32_t DEFAULT_CAP = 100;
constexpr double DEFAULT_REGEN_PER_SEC = 2.0;

constexpr int64_t MIN_UPGRADE_COST = 10;
constexpr int64_t UPGRADE_COST_PER_POWER = 20;

/// Per-player game state row.
struct GameState {
    int64_t player_id = 0;
    int64_t tokens = 0;
    int32_t level = DEFAULT_LEVEL;
    int32_t tap_power = DEFAULT_TAP_POWER;
    double energy = DEFAULT_CAP;
    int32_t cap = DEFAULT_CAP;
    double regen_per_sec = DEFAULT_REGEN_PER_SEC;
    TimePoint last_update{};

    /// Row as created on a player's first authentication.
    static GameState initial(int64_t player_id, TimePoint now);
};

/// Server-side upgrade price for the given tap power: max(10, tap_power * 20).
int64_t upgrade_cost(int32_t tap_power);

/**
 * Column constraints for GameState rows.
 *
 * Every row the store writes passes through check(); a violation is a
 * StorageError and the write is discarded.
 */
struct GameStateSchema {
    static void check(const GameState& state);

    /// Also enforces last_update monotonicity against the committed row.
    static void check_transition(const GameState& before, const GameState& after);
};

} // namespace tapcore
