#pragma once

#include <map>
#include <string>
#include "player.hpp"

namespace tapcore {

/// Fields of a credential blob that passed signature verification.
struct VerifiedCredential {
    Identity identity;
    /// Every signed field except `hash`, keyed by name.
    std::map<std::string, std::string> fields;
};

/**
 * Verifies signed launch payloads issued by the platform identity provider.
 *
 * The payload is a query string whose `hash` field is
 * hex(HMAC_SHA256(secret_key, data_check_string)), where secret_key is
 * derived from the shared secret and the "WebAppData" constant and the
 * data check string is the remaining fields sorted by name and joined
 * as `key=value` lines.
 *
 * Verification is pure and runs on every request; nothing is cached.
 *
 * Example:
 *   RequestAuthenticator auth(config.bot_token);
 *   auto credential = auth.verify(request->init_data());
 *   int64_t user_id = credential.identity.id;
 */
class RequestAuthenticator {
public:
    static constexpr const char* DOMAIN_CONSTANT = "WebAppData";
    static constexpr const char* HASH_FIELD = "hash";
    static constexpr const char* USER_FIELD = "user";

    explicit RequestAuthenticator(std::string shared_secret);

    /**
     * Verify a credential blob against the configured secret.
     *
     * @throws AuthError on any verification failure
     */
    VerifiedCredential verify(const std::string& init_data) const;

    /**
     * Verify a credential blob against an explicit secret.
     *
     * @throws AuthError on any verification failure
     */
    static VerifiedCredential verify(const std::string& init_data,
                                     const std::string& shared_secret);

    /// Split a query string into decoded fields. A repeated name keeps its last value.
    static std::map<std::string, std::string> parse_fields(const std::string& init_data);

    /// Canonical `key=value\n...` string over the given fields (no `hash`).
    static std::string data_check_string(const std::map<std::string, std::string>& fields);

    /// Hex signature the identity provider would attach to these fields.
    static std::string sign(const std::map<std::string, std::string>& fields,
                            const std::string& shared_secret);

private:
    std::string shared_secret_;
};

} // namespace tapcore
