#pragma once
#include <string>
#include <ctime>
#include "../auth/User.hpp"
#include "../auth/Session.hpp"
#include "../auth/VerificationRequest.hpp"
#include "../auth/Outcome.hpp"

// Outcome of a single store call. Timeout is kept apart from Failure so a slow
// backend never looks like a missing row.
enum class StoreStatus {
    Ok,
    NotFound,
    Conflict,   // unique key taken, or a conditional write was refused
    Timeout,
    Failure
};

const char* toString(StoreStatus status);

// Timeout stays Timeout; every other failure is a StorageError for callers.
AuthStatus toAuthStatus(StoreStatus status);

// Persistence collaborator. Implementations must make every call atomic with
// respect to the others; AuthManager and friends hold no locks of their own.
class Storage {
public:
    virtual ~Storage() = default;

    // USERS
    virtual StoreStatus insertUser(const User& user) = 0;
    virtual StoreStatus findUserById(const std::string& id, User& out) = 0;
    virtual StoreStatus findUserByEmail(const std::string& email, User& out) = 0;
    virtual StoreStatus markEmailVerified(const std::string& user_id, std::time_t when) = 0;

    // Registration writes the user and its first code together or not at all.
    // Conflict when the email is already registered.
    virtual StoreStatus insertUserWithVerification(const User& user, const VerificationRequest& req) = 0;

    // SESSIONS
    virtual StoreStatus insertSession(const Session& session) = 0;
    virtual StoreStatus findSession(const std::string& id, Session& out) = 0;
    virtual StoreStatus updateSession(const Session& session) = 0;
    virtual StoreStatus revokeSession(const std::string& id, std::time_t when) = 0;

    // VERIFICATIONS
    virtual StoreStatus upsertVerification(const VerificationRequest& req) = 0;
    virtual StoreStatus findVerification(const std::string& user_id, VerificationRequest& out) = 0;

    // Conditional upsert used by resend: writes `next` only when there is no
    // row for the user or the existing row expires at or before `latest_expiry`.
    // Otherwise returns Conflict and copies the blocking row into `current`.
    virtual StoreStatus replaceVerificationIfStale(const VerificationRequest& next,
        std::time_t latest_expiry, VerificationRequest& current) = 0;
};
