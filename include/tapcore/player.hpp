#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tapcore {

/// Identity record carried in the signed `user` field.
struct Identity {
    int64_t id = 0;
    std::optional<std::string> username;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> photo_url;
};

/// Internal player row, keyed uniquely by external identity.
struct Player {
    int64_t id = 0;
    int64_t external_id = 0;
    std::optional<std::string> username;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> photo_url;
};

} // namespace tapcore
