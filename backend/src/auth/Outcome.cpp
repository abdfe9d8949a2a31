#include "Outcome.hpp"

const char* toString(AuthStatus status) {
    switch (status) {
    case AuthStatus::Ok: return "ok";
    case AuthStatus::Validation: return "validation_error";
    case AuthStatus::UserNotFound: return "user_not_found";
    case AuthStatus::SessionNotFound: return "session_not_found";
    case AuthStatus::CodeNotFound: return "code_not_found";
    case AuthStatus::EmailTaken: return "email_taken";
    case AuthStatus::AlreadyVerified: return "already_verified";
    case AuthStatus::IncorrectPassword: return "incorrect_password";
    case AuthStatus::Unverified: return "unverified";
    case AuthStatus::Mismatch: return "mismatch";
    case AuthStatus::Throttled: return "throttled";
    case AuthStatus::InvalidSignature: return "invalid_signature";
    case AuthStatus::Expired: return "expired";
    case AuthStatus::Revoked: return "revoked";
    case AuthStatus::StorageError: return "storage_error";
    case AuthStatus::Timeout: return "timeout";
    case AuthStatus::DeliveryFailed: return "delivery_failed";
    case AuthStatus::HashingFailed: return "hashing_failed";
    case AuthStatus::SigningFailed: return "signing_failed";
    }
    return "unknown";
}
