#pragma once

#include <functional>
#include <string>

namespace tapcore {

/**
 * Process configuration, read once at startup.
 *
 * BOT_TOKEN      shared signing secret (required)
 * PORT           gRPC listen port (default 50600)
 * CLIENT_ORIGIN  allowed origin for the HTTP gateway (default "*")
 */
struct ServerConfig {
    static constexpr int DEFAULT_PORT = 50600;
    static constexpr const char* DEFAULT_ORIGIN = "*";

    using EnvLookup = std::function<const char*(const char*)>;

    std::string bot_token;
    int port = DEFAULT_PORT;
    std::string client_origin = DEFAULT_ORIGIN;

    std::string listen_address() const {
        return "0.0.0.0:" + std::to_string(port);
    }

    /**
     * Load from the process environment.
     *
     * @throws ConfigError if BOT_TOKEN is missing or PORT is malformed
     */
    static ServerConfig from_env();

    /// Load through an explicit lookup function.
    static ServerConfig from_env(const EnvLookup& lookup);
};

} // namespace tapcore
