#include "tapcore/config.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/validation.hpp"
#include <cstdlib>
#include <stdexcept>

namespace tapcore {

ServerConfig ServerConfig::from_env() {
    return from_env([](const char* name) { return std::getenv(name); });
}

ServerConfig ServerConfig::from_env(const EnvLookup& lookup) {
    ServerConfig config;

    const char* token = lookup("BOT_TOKEN");
    validation::require_setting(token, "BOT_TOKEN");
    config.bot_token = token;

    const char* port = lookup("PORT");
    if (port != nullptr && *port != '\0') {
        size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(port, &consumed);
        } catch (const std::logic_error&) {
            throw ConfigError(std::string("Invalid PORT: ") + port);
        }
        if (port[consumed] != '\0' || value <= 0 || value > 65535) {
            throw ConfigError(std::string("Invalid PORT: ") + port);
        }
        config.port = value;
    }

    const char* origin = lookup("CLIENT_ORIGIN");
    if (origin != nullptr && *origin != '\0') {
        config.client_origin = origin;
    }

    return config;
}

} // namespace tapcore
