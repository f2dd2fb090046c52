#pragma once

#include <string>
#include "errors.hpp"

namespace tapcore {
namespace validation {

/**
 * Require that a stored column value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (!(value > 0)) {
        throw StorageError::constraint_violation(field_name + " must be positive");
    }
}

/**
 * Require that a stored column value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (!(value >= 0)) {
        throw StorageError::constraint_violation(field_name + " must be non-negative");
    }
}

/**
 * Require that a stored column value does not exceed an upper bound.
 */
template<typename T, typename U>
void require_at_most(T value, U bound, const std::string& field_name = "value") {
    if (!(value <= bound)) {
        throw StorageError::constraint_violation(field_name + " exceeds its bound");
    }
}

/**
 * Require that a configuration value is present.
 */
inline void require_setting(const char* value, const std::string& name) {
    if (value == nullptr || *value == '\0') {
        throw ConfigError("Missing env " + name);
    }
}

} // namespace validation
} // namespace tapcore
