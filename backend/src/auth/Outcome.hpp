#pragma once
#include <string>
#include <utility>
#include <variant>

// Result codes shared by every public auth operation. Nothing throws past
// SessionManager / AuthManager / VerificationCodeIssuer; callers switch on these.
enum class AuthStatus {
    Ok,

    // validation
    Validation,

    // lookups
    UserNotFound,
    SessionNotFound,
    CodeNotFound,

    // conflicts
    EmailTaken,
    AlreadyVerified,

    // credentials
    IncorrectPassword,
    Unverified,
    Mismatch,

    Throttled,

    // token checks (never fatal, the gate redirects)
    InvalidSignature,
    Expired,
    Revoked,

    // collaborators
    StorageError,
    Timeout,
    DeliveryFailed,

    // internal
    HashingFailed,
    SigningFailed
};

const char* toString(AuthStatus status);

template <typename T = std::monostate>
struct Outcome {
    AuthStatus status = AuthStatus::Ok;
    std::string message;
    T value{};

    bool ok() const { return status == AuthStatus::Ok; }

    static Outcome success(T v, std::string msg = "") {
        Outcome o;
        o.value = std::move(v);
        o.message = std::move(msg);
        return o;
    }

    static Outcome failure(AuthStatus s, std::string msg) {
        Outcome o;
        o.status = s;
        o.message = std::move(msg);
        return o;
    }

    // Failure that still hands back a value (e.g. the user id when only the
    // verification email could not be delivered).
    static Outcome failure(AuthStatus s, std::string msg, T v) {
        Outcome o = failure(s, std::move(msg));
        o.value = std::move(v);
        return o;
    }
};
