#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include "Storage.hpp"

// In-process store guarded by one mutex. Subclasses can persist the tables by
// overriding commit(), which runs under the lock after every mutation; a failed
// commit rolls the mutation back and the call reports Failure.
class MemoryStorage : public Storage {
public:
    MemoryStorage() = default;
    ~MemoryStorage() override = default;

    StoreStatus insertUser(const User& user) override;
    StoreStatus findUserById(const std::string& id, User& out) override;
    StoreStatus findUserByEmail(const std::string& email, User& out) override;
    StoreStatus markEmailVerified(const std::string& user_id, std::time_t when) override;
    StoreStatus insertUserWithVerification(const User& user, const VerificationRequest& req) override;

    StoreStatus insertSession(const Session& session) override;
    StoreStatus findSession(const std::string& id, Session& out) override;
    StoreStatus updateSession(const Session& session) override;
    StoreStatus revokeSession(const std::string& id, std::time_t when) override;

    StoreStatus upsertVerification(const VerificationRequest& req) override;
    StoreStatus findVerification(const std::string& user_id, VerificationRequest& out) override;
    StoreStatus replaceVerificationIfStale(const VerificationRequest& next,
        std::time_t latest_expiry, VerificationRequest& current) override;

    size_t userCount() const;
    size_t sessionCount() const;

protected:
    virtual bool commit() { return true; }

    mutable std::mutex mtx;
    std::unordered_map<std::string, User> users;                 // by id
    std::unordered_map<std::string, std::string> user_by_email;  // email -> id
    std::unordered_map<std::string, Session> sessions;           // by id
    std::unordered_map<std::string, VerificationRequest> verifications; // by user id

private:
    StoreStatus putVerification(const VerificationRequest& req);
};
