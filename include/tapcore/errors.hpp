#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace tapcore {

/**
 * Base exception for all tapcore errors.
 */
class TapcoreError : public std::runtime_error {
public:
    explicit TapcoreError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the request could not be authenticated.
     */
    virtual bool is_unauthenticated() const { return false; }

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a storage-layer failure.
     */
    virtual bool is_storage_error() const { return false; }

    /**
     * Returns true if this is a startup configuration error.
     */
    virtual bool is_config_error() const { return false; }

    /**
     * Map to the gRPC status a service handler returns.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

/**
 * Reason a credential blob was rejected.
 */
enum class AuthErrorKind {
    MissingCredential,
    MissingSignature,
    BadSignature,
    MissingIdentity
};

/**
 * Thrown when a credential blob fails verification.
 * Maps to gRPC UNAUTHENTICATED status.
 */
class AuthError : public TapcoreError {
public:
    AuthError(AuthErrorKind kind, const std::string& message)
        : TapcoreError(message), kind_(kind) {}

    static AuthError missing_credential() {
        return AuthError(AuthErrorKind::MissingCredential, "Missing initData");
    }

    static AuthError missing_signature() {
        return AuthError(AuthErrorKind::MissingSignature, "Missing hash");
    }

    static AuthError bad_signature() {
        return AuthError(AuthErrorKind::BadSignature, "Bad hash");
    }

    static AuthError missing_identity(const std::string& detail = "No user") {
        return AuthError(AuthErrorKind::MissingIdentity, detail);
    }

    AuthErrorKind kind() const { return kind_; }

    bool is_unauthenticated() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, what());
    }

private:
    AuthErrorKind kind_;
};

/**
 * Thrown when an action references a player that never authenticated.
 */
class NotFoundError : public TapcoreError {
public:
    explicit NotFoundError(const std::string& message)
        : TapcoreError(message) {}

    bool is_not_found() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }
};

/**
 * Thrown when the storage backend fails or rejects a write.
 * Nothing from the failed operation is committed.
 */
class StorageError : public TapcoreError {
public:
    explicit StorageError(const std::string& message)
        : TapcoreError(message) {}

    static StorageError constraint_violation(const std::string& detail) {
        return StorageError("constraint violation: " + detail);
    }

    bool is_storage_error() const override { return true; }
};

/**
 * Thrown when required configuration is missing or malformed.
 */
class ConfigError : public TapcoreError {
public:
    explicit ConfigError(const std::string& message)
        : TapcoreError(message) {}

    bool is_config_error() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what());
    }
};

} // namespace tapcore
