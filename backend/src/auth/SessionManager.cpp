#include "SessionManager.hpp"
#include <algorithm>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include "TokenSigner.hpp"
#include "User.hpp"
#include "../gate/Cookie.hpp"
#include "../storage/Storage.hpp"

// Constant time for equal lengths; tokens are fixed-size hex digests.
static bool sameToken(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

static SessionPayload payloadOf(const Session& s) {
    SessionPayload p;
    p.session_id = s.id;
    p.user_id = s.user_id;
    p.access_token = s.access_token;
    p.refresh_token = s.refresh_token;
    p.expires_at = s.expires_at;
    return p;
}

SessionManager::SessionManager(Storage& storage, const TokenSigner& s,
    const SessionConfig& cfg, Clock c)
    : store(storage),
    signer(s),
    config(cfg),
    clock(std::move(c))
{
    spdlog::debug("SessionManager initialized: duration={}s refresh={}s strict={}",
        config.duration_seconds, config.refresh_duration_seconds, config.strict_revocation);
}

Outcome<IssuedSession> SessionManager::signAndWrap(const Session& row) {
    Outcome<std::string> signed_token = signer.sign(payloadOf(row));
    if (!signed_token.ok())
        return Outcome<IssuedSession>::failure(AuthStatus::SigningFailed, "Unable to store local session");

    IssuedSession issued;
    issued.token = std::move(signed_token.value);
    issued.session = row;
    return Outcome<IssuedSession>::success(std::move(issued));
}

Outcome<IssuedSession> SessionManager::createSession(const std::string& user_id) {
    spdlog::info("Creating session for user '{}'", user_id);

    User user;
    StoreStatus st = store.findUserById(user_id, user);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Session not created: user '{}' not found", user_id);
        return Outcome<IssuedSession>::failure(AuthStatus::UserNotFound, "User not found");
    }
    if (st != StoreStatus::Ok)
        return Outcome<IssuedSession>::failure(toAuthStatus(st), "Unable to create session");

    std::time_t now = clock();

    Session row;
    row.id = User::generateID();
    row.user_id = user_id;
    row.access_token = signer.generateOpaqueToken();
    row.refresh_token = signer.generateOpaqueToken();
    row.created_at = now;
    row.expires_at = now + static_cast<std::time_t>(config.duration_seconds);
    row.refresh_expires_at = now + static_cast<std::time_t>(config.refresh_duration_seconds);
    row.last_active = now;

    // Sign before insert so a signing failure leaves no orphan row.
    Outcome<IssuedSession> issued = signAndWrap(row);
    if (!issued.ok()) {
        spdlog::error("Signing new session for user '{}' failed", user_id);
        return issued;
    }

    st = store.insertSession(row);
    if (st != StoreStatus::Ok) {
        spdlog::error("Inserting session for user '{}' failed: {}", user_id, toString(st));
        return Outcome<IssuedSession>::failure(toAuthStatus(st), "Unable to create session");
    }

    spdlog::info("Created session '{}' for user '{}' (expires {})", row.id, user_id, row.expires_at);
    issued.message = "Successfully created session";
    return issued;
}

Outcome<SessionPayload> SessionManager::validate(const std::string& token) {
    using Result = Outcome<SessionPayload>;

    Result checked = signer.verify(token, clock());
    if (!checked.ok())
        return checked;

    if (!config.strict_revocation)
        return checked;

    const SessionPayload& p = checked.value;
    Session row;
    StoreStatus st = store.findSession(p.session_id, row);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Token references unknown session '{}'", p.session_id);
        return Result::failure(AuthStatus::SessionNotFound, "Session not found");
    }
    if (st != StoreStatus::Ok)
        return Result::failure(toAuthStatus(st), "Unable to load session");

    if (row.isRevoked()) {
        spdlog::info("Rejected revoked session '{}'", row.id);
        return Result::failure(AuthStatus::Revoked, "Session has been logged out");
    }
    if (row.user_id != p.user_id || !sameToken(row.access_token, p.access_token)) {
        spdlog::warn("Rejected superseded token for session '{}'", row.id);
        return Result::failure(AuthStatus::InvalidSignature, "Session token superseded");
    }

    return checked;
}

Outcome<IssuedSession> SessionManager::refreshSession(const std::string& token) {
    using Result = Outcome<IssuedSession>;

    Outcome<SessionPayload> decoded = signer.decode(token);
    if (!decoded.ok())
        return Result::failure(decoded.status, decoded.message);

    const SessionPayload& p = decoded.value;
    spdlog::info("Refreshing session '{}'", p.session_id);

    Session row;
    StoreStatus st = store.findSession(p.session_id, row);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Refresh failed: session '{}' not found", p.session_id);
        return Result::failure(AuthStatus::SessionNotFound, "Session not found");
    }
    if (st != StoreStatus::Ok)
        return Result::failure(toAuthStatus(st), "Unable to load session");

    if (row.isRevoked()) {
        spdlog::warn("Refresh refused: session '{}' was logged out", row.id);
        return Result::failure(AuthStatus::Revoked, "Session has been logged out");
    }
    if (row.user_id != p.user_id || !sameToken(row.refresh_token, p.refresh_token)) {
        spdlog::warn("Refresh refused: refresh token does not match session '{}'", row.id);
        return Result::failure(AuthStatus::InvalidSignature, "Invalid refresh token");
    }

    std::time_t now = clock();
    if (now >= row.refresh_expires_at) {
        spdlog::info("Refresh refused: window for session '{}' closed at {}", row.id, row.refresh_expires_at);
        return Result::failure(AuthStatus::Expired, "Session expired");
    }

    // The new expiry must move forward but stays inside the refresh window.
    std::time_t next_expiry = std::min(
        std::max(now + static_cast<std::time_t>(config.duration_seconds), row.expires_at + 1),
        row.refresh_expires_at);
    if (next_expiry <= row.expires_at) {
        spdlog::info("Refresh refused: session '{}' already expires at the end of its window", row.id);
        return Result::failure(AuthStatus::Expired, "Session expired");
    }

    Session updated = row;
    updated.access_token = signer.generateOpaqueToken();
    updated.refresh_token = signer.generateOpaqueToken();
    updated.expires_at = next_expiry;
    updated.last_active = now;

    Result issued = signAndWrap(updated);
    if (!issued.ok()) {
        spdlog::error("Signing refreshed session '{}' failed", row.id);
        return issued;
    }

    st = store.updateSession(updated);
    if (st != StoreStatus::Ok) {
        spdlog::error("Updating session '{}' failed: {}", row.id, toString(st));
        return Result::failure(toAuthStatus(st), "Unable to refresh session");
    }

    spdlog::info("Refreshed session '{}' (expires {})", row.id, updated.expires_at);
    issued.message = "Session refreshed";
    return issued;
}

Outcome<std::string> SessionManager::invalidateSession(const std::string& session_id) {
    spdlog::info("Invalidating session '{}'", session_id);
    std::string cleared = clearingCookie();

    StoreStatus st = store.revokeSession(session_id, clock());
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Invalidate: session '{}' not found", session_id);
        return Outcome<std::string>::failure(AuthStatus::SessionNotFound, "Session not found", cleared);
    }
    if (st != StoreStatus::Ok) {
        spdlog::error("Revoking session '{}' failed: {}", session_id, toString(st));
        return Outcome<std::string>::failure(toAuthStatus(st), "Unable to revoke session", cleared);
    }

    return Outcome<std::string>::success(cleared, "Logged out");
}

Outcome<SessionPayload> SessionManager::inspect(const std::string& token) const {
    return signer.decode(token);
}

std::string SessionManager::cookieFor(const IssuedSession& issued) const {
    return Cookie::sessionCookie(issued.token, issued.session.expires_at, config.secure_cookie);
}

std::string SessionManager::clearingCookie() const {
    return Cookie::clearedSessionCookie(config.secure_cookie);
}
