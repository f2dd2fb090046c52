#include "tapcore/request_authenticator.hpp"
#include "tapcore/errors.hpp"
#include "tapcore/helpers.hpp"
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <optional>
#include <utility>

namespace tapcore {

namespace {

std::string hmac_sha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const unsigned char* result = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        digest, &digest_len);
    if (result == nullptr) {
        throw TapcoreError("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<std::string> optional_text(const nlohmann::json& user, const char* key) {
    auto it = user.find(key);
    if (it == user.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

Identity parse_identity(const std::map<std::string, std::string>& fields) {
    auto user_field = fields.find(RequestAuthenticator::USER_FIELD);
    if (user_field == fields.end()) {
        throw AuthError::missing_identity();
    }

    nlohmann::json user = nlohmann::json::parse(user_field->second, nullptr, false);
    if (user.is_discarded() || !user.is_object()) {
        throw AuthError::missing_identity("Malformed user");
    }

    auto id = user.find("id");
    if (id == user.end() || !id->is_number_integer() || id->get<int64_t>() == 0) {
        throw AuthError::missing_identity();
    }

    Identity identity;
    identity.id = id->get<int64_t>();
    identity.username = optional_text(user, "username");
    identity.first_name = optional_text(user, "first_name");
    identity.last_name = optional_text(user, "last_name");
    identity.photo_url = optional_text(user, "photo_url");
    return identity;
}

} // anonymous namespace

RequestAuthenticator::RequestAuthenticator(std::string shared_secret)
    : shared_secret_(std::move(shared_secret)) {}

VerifiedCredential RequestAuthenticator::verify(const std::string& init_data) const {
    return verify(init_data, shared_secret_);
}

VerifiedCredential RequestAuthenticator::verify(const std::string& init_data,
                                                const std::string& shared_secret) {
    if (init_data.empty()) {
        throw AuthError::missing_credential();
    }

    auto fields = parse_fields(init_data);
    auto hash = fields.find(HASH_FIELD);
    if (hash == fields.end() || hash->second.empty()) {
        throw AuthError::missing_signature();
    }
    std::string received = hash->second;
    fields.erase(hash);

    if (!constant_time_equals(sign(fields, shared_secret), received)) {
        throw AuthError::bad_signature();
    }

    VerifiedCredential credential;
    credential.identity = parse_identity(fields);
    credential.fields = std::move(fields);
    return credential;
}

std::map<std::string, std::string> RequestAuthenticator::parse_fields(const std::string& init_data) {
    std::map<std::string, std::string> fields;
    size_t start = 0;
    while (start <= init_data.size()) {
        size_t end = init_data.find('&', start);
        if (end == std::string::npos) {
            end = init_data.size();
        }
        std::string pair = init_data.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string name = helpers::form_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : helpers::form_decode(pair.substr(eq + 1));
            fields[name] = value;
        }
        start = end + 1;
    }
    return fields;
}

std::string RequestAuthenticator::data_check_string(const std::map<std::string, std::string>& fields) {
    std::string canonical;
    for (const auto& [name, value] : fields) {
        if (name == HASH_FIELD) continue;
        if (!canonical.empty()) {
            canonical.push_back('\n');
        }
        canonical += name;
        canonical.push_back('=');
        canonical += value;
    }
    return canonical;
}

std::string RequestAuthenticator::sign(const std::map<std::string, std::string>& fields,
                                       const std::string& shared_secret) {
    // Platform key derivation: the constant keys an HMAC over the secret.
    std::string secret_key = hmac_sha256(DOMAIN_CONSTANT, shared_secret);
    return helpers::to_hex(hmac_sha256(secret_key, data_check_string(fields)));
}

} // namespace tapcore
