#pragma once
#include <string>
#include "Outcome.hpp"
#include "Session.hpp"
#include "../config/Config.hpp"
#include "../utils/Clock.hpp"

class Storage;
class TokenSigner;

// Creates, validates, refreshes and revokes sessions.
//
// Each session is a Session row plus a signed token (see TokenSigner) that the
// client keeps in the "session" cookie. The token's expiry is the access
// expiry; past it the refresh token can mint a new access token until
// refresh_expires_at. Logout revokes the row so neither path revives it.
class SessionManager {
public:
    SessionManager(Storage& storage, const TokenSigner& signer,
        const SessionConfig& cfg, Clock clock = systemClock());

    // UserNotFound, StorageError, Timeout or SigningFailed on failure.
    Outcome<IssuedSession> createSession(const std::string& user_id);

    // Ok with the payload, or InvalidSignature / Expired (payload attached) /
    // Revoked / SessionNotFound. With strict revocation the row is consulted
    // and must be live and carry the token's access token.
    Outcome<SessionPayload> validate(const std::string& token);

    // For a token whose access part has expired (or is about to): rotates
    // both tokens, so the presented one cannot refresh again, and pushes the
    // expiry strictly past the old one without leaving the refresh window.
    // Fails closed on a bad signature, a missing or revoked row, a stale
    // refresh token, or a closed refresh window.
    Outcome<IssuedSession> refreshSession(const std::string& token);

    // Marks the row revoked. The value is the Set-Cookie header that clears
    // the client cookie, returned on failure too.
    Outcome<std::string> invalidateSession(const std::string& session_id);

    // Signature check only, expiry ignored (logout of an expired session).
    Outcome<SessionPayload> inspect(const std::string& token) const;

    // Set-Cookie header carrying `issued.token`.
    std::string cookieFor(const IssuedSession& issued) const;

    // Set-Cookie header that deletes the session cookie.
    std::string clearingCookie() const;

private:
    Storage& store;
    const TokenSigner& signer;
    SessionConfig config;
    Clock clock;

    Outcome<IssuedSession> signAndWrap(const Session& row);
};
