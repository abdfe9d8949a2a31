#pragma once
#include <string>
#include <ctime>

// Backing row for one login. Rows are never deleted; logout sets revoked_at.
struct Session {
    std::string id;
    std::string user_id;
    std::string access_token;
    std::string refresh_token;
    std::time_t created_at = 0;
    std::time_t expires_at = 0;          // access expiry, embedded in the signed token
    std::time_t refresh_expires_at = 0;  // last moment the refresh token can mint a new access token
    std::time_t last_active = 0;
    std::time_t revoked_at = 0;          // 0 = live

    bool isRevoked() const { return revoked_at != 0; }
};

// Fields carried inside the signed cookie value.
struct SessionPayload {
    std::string session_id;
    std::string user_id;
    std::string access_token;
    std::string refresh_token;
    std::time_t expires_at = 0;

    bool operator==(const SessionPayload& o) const {
        return session_id == o.session_id && user_id == o.user_id &&
            access_token == o.access_token && refresh_token == o.refresh_token &&
            expires_at == o.expires_at;
    }
};

// A signed token plus the row it was minted for.
struct IssuedSession {
    std::string token;
    Session session;
};
