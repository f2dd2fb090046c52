#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include "game_state.hpp"

namespace tapcore {

/**
 * Helper functions shared by the core components.
 */
namespace helpers {

/**
 * Lowercase hex encoding of a byte string.
 */
std::string to_hex(const std::string& bytes);

/**
 * Decode one application/x-www-form-urlencoded component.
 * '+' becomes a space; malformed percent escapes are kept verbatim.
 */
std::string form_decode(const std::string& component);

/**
 * Seconds from `from` to `to`, clamped at zero.
 */
inline double elapsed_seconds(TimePoint from, TimePoint to) {
    std::chrono::duration<double> elapsed = to - from;
    return std::max(0.0, elapsed.count());
}

} // namespace helpers
} // namespace tapcore
