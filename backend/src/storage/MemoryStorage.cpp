#include "MemoryStorage.hpp"
#include <spdlog/spdlog.h>

StoreStatus MemoryStorage::insertUser(const User& user) {
    std::lock_guard<std::mutex> lock(mtx);

    if (users.count(user.id) || user_by_email.count(user.email)) {
        spdlog::warn("insertUser: duplicate id or email for user '{}'", user.id);
        return StoreStatus::Conflict;
    }

    users[user.id] = user;
    user_by_email[user.email] = user.id;

    if (!commit()) {
        users.erase(user.id);
        user_by_email.erase(user.email);
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::findUserById(const std::string& id, User& out) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = users.find(id);
    if (it == users.end())
        return StoreStatus::NotFound;
    out = it->second;
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::findUserByEmail(const std::string& email, User& out) {
    std::lock_guard<std::mutex> lock(mtx);
    auto idx = user_by_email.find(email);
    if (idx == user_by_email.end())
        return StoreStatus::NotFound;
    auto it = users.find(idx->second);
    if (it == users.end()) {
        spdlog::error("Email index points at missing user '{}'", idx->second);
        return StoreStatus::Failure;
    }
    out = it->second;
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::markEmailVerified(const std::string& user_id, std::time_t when) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = users.find(user_id);
    if (it == users.end())
        return StoreStatus::NotFound;

    std::time_t previous = it->second.email_verified_at;
    it->second.email_verified_at = when;

    if (!commit()) {
        it->second.email_verified_at = previous;
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::insertUserWithVerification(const User& user, const VerificationRequest& req) {
    std::lock_guard<std::mutex> lock(mtx);

    if (users.count(user.id) || user_by_email.count(user.email)) {
        spdlog::warn("insertUserWithVerification: duplicate id or email for user '{}'", user.id);
        return StoreStatus::Conflict;
    }

    bool had_code = verifications.count(req.user_id) > 0;
    VerificationRequest old_code;
    if (had_code) old_code = verifications[req.user_id];

    users[user.id] = user;
    user_by_email[user.email] = user.id;
    verifications[req.user_id] = req;

    if (!commit()) {
        users.erase(user.id);
        user_by_email.erase(user.email);
        if (had_code) verifications[req.user_id] = old_code;
        else verifications.erase(req.user_id);
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::insertSession(const Session& session) {
    std::lock_guard<std::mutex> lock(mtx);

    if (sessions.count(session.id)) {
        spdlog::warn("insertSession: duplicate session id '{}'", session.id);
        return StoreStatus::Conflict;
    }

    sessions[session.id] = session;
    if (!commit()) {
        sessions.erase(session.id);
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::findSession(const std::string& id, Session& out) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(id);
    if (it == sessions.end())
        return StoreStatus::NotFound;
    out = it->second;
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::updateSession(const Session& session) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(session.id);
    if (it == sessions.end())
        return StoreStatus::NotFound;

    Session previous = it->second;
    it->second = session;

    if (!commit()) {
        it->second = previous;
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::revokeSession(const std::string& id, std::time_t when) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(id);
    if (it == sessions.end())
        return StoreStatus::NotFound;

    // first revocation wins
    if (it->second.isRevoked())
        return StoreStatus::Ok;

    it->second.revoked_at = when;
    if (!commit()) {
        it->second.revoked_at = 0;
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::upsertVerification(const VerificationRequest& req) {
    std::lock_guard<std::mutex> lock(mtx);
    return putVerification(req);
}

StoreStatus MemoryStorage::findVerification(const std::string& user_id, VerificationRequest& out) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = verifications.find(user_id);
    if (it == verifications.end())
        return StoreStatus::NotFound;
    out = it->second;
    return StoreStatus::Ok;
}

StoreStatus MemoryStorage::replaceVerificationIfStale(const VerificationRequest& next,
    std::time_t latest_expiry, VerificationRequest& current)
{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = verifications.find(next.user_id);
    if (it != verifications.end() && it->second.expires_at > latest_expiry) {
        current = it->second;
        return StoreStatus::Conflict;
    }
    return putVerification(next);
}

// Caller holds mtx.
StoreStatus MemoryStorage::putVerification(const VerificationRequest& req) {
    if (!users.count(req.user_id)) {
        spdlog::warn("Verification for unknown user '{}'", req.user_id);
        return StoreStatus::NotFound;
    }

    auto it = verifications.find(req.user_id);
    bool existed = it != verifications.end();
    VerificationRequest previous;
    if (existed) previous = it->second;

    verifications[req.user_id] = req;

    if (!commit()) {
        if (existed) verifications[req.user_id] = previous;
        else verifications.erase(req.user_id);
        return StoreStatus::Failure;
    }
    return StoreStatus::Ok;
}

size_t MemoryStorage::userCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return users.size();
}

size_t MemoryStorage::sessionCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}
