#include <string>

#include "TestSupport.hpp"
#include "auth/SessionManager.hpp"
#include "auth/TokenSigner.hpp"

int main() {
    if (!initTestEnv()) FAIL();

    ManualClock clk;
    MemoryStorage store;
    TokenSigner signer(kTestSecret);
    SessionConfig cfg;  // 1h access, 7d refresh, strict revocation
    cfg.secure_cookie = false;
    SessionManager sessions(store, signer, cfg, clk.clock());

    User alice = makeUser("Alice", "alice@example.com");
    EXPECT(store.insertUser(alice) == StoreStatus::Ok);

    EXPECT(sessions.createSession("no-such-user").status == AuthStatus::UserNotFound);
    EXPECT(store.sessionCount() == 0);

    const std::time_t t0 = clk.now;
    Outcome<IssuedSession> created = sessions.createSession(alice.id);
    EXPECT(created.ok());
    const Session row = created.value.session;
    EXPECT(row.user_id == alice.id);
    EXPECT(row.created_at == t0);
    EXPECT(row.expires_at == t0 + 3600);
    EXPECT(row.refresh_expires_at == t0 + 7 * 24 * 3600);
    EXPECT(row.access_token.size() == 64);
    EXPECT(row.refresh_token.size() == 64);
    EXPECT(row.access_token != row.refresh_token);
    EXPECT(!row.isRevoked());
    EXPECT(store.sessionCount() == 1);

    const std::string token = created.value.token;

    // Two logins are two sessions.
    {
        Outcome<IssuedSession> other = sessions.createSession(alice.id);
        EXPECT(other.ok());
        EXPECT(other.value.session.id != row.id);
        EXPECT(other.value.token != token);
        EXPECT(store.sessionCount() == 2);
    }

    // Cookie carries the token and the access expiry.
    {
        std::string cookie = sessions.cookieFor(created.value);
        EXPECT(cookie.rfind("session=" + token + "; Expires=", 0) == 0);
        EXPECT(cookie.find("HttpOnly") != std::string::npos);
        EXPECT(cookie.find("SameSite=Strict") != std::string::npos);
        EXPECT(cookie.find("Secure") == std::string::npos);
    }

    // Valid until the access expiry.
    {
        Outcome<SessionPayload> v = sessions.validate(token);
        EXPECT(v.ok());
        EXPECT(v.value.user_id == alice.id);
        EXPECT(v.value.session_id == row.id);

        clk.advance(3599);
        EXPECT(sessions.validate(token).ok());
        clk.advance(1);
        v = sessions.validate(token);
        EXPECT(v.status == AuthStatus::Expired);
        EXPECT(v.value.session_id == row.id);
    }

    // Refresh rotates both tokens and moves the expiry forward.
    std::string current = token;
    {
        Outcome<IssuedSession> r = sessions.refreshSession(current);
        EXPECT(r.ok());
        EXPECT(r.value.session.id == row.id);
        EXPECT(r.value.session.expires_at > row.expires_at);
        EXPECT(r.value.session.expires_at == clk.now + 3600);
        EXPECT(r.value.session.access_token != row.access_token);
        EXPECT(r.value.session.refresh_token != row.refresh_token);
        EXPECT(r.value.session.refresh_token.size() == row.refresh_token.size());
        EXPECT(r.value.token != token);

        Session stored;
        EXPECT(store.findSession(row.id, stored) == StoreStatus::Ok);
        EXPECT(stored.access_token == r.value.session.access_token);
        EXPECT(stored.refresh_token == r.value.session.refresh_token);
        EXPECT(stored.expires_at == r.value.session.expires_at);
        EXPECT(stored.last_active == clk.now);

        current = r.value.token;
        EXPECT(sessions.validate(current).ok());
        EXPECT(sessions.validate(token).status == AuthStatus::Expired);
    }

    // A copy of the pre-refresh cookie cannot mint tokens and leaves the
    // current holder untouched.
    {
        EXPECT(sessions.refreshSession(token).status == AuthStatus::InvalidSignature);
        EXPECT(sessions.validate(current).ok());

        Session stored;
        EXPECT(store.findSession(row.id, stored) == StoreStatus::Ok);
        Outcome<SessionPayload> p = sessions.inspect(current);
        EXPECT(p.ok());
        EXPECT(stored.access_token == p.value.access_token);
        EXPECT(stored.refresh_token == p.value.refresh_token);
    }

    // Refreshing early still pushes the expiry strictly past the old one,
    // and the superseded token stops validating.
    {
        Outcome<SessionPayload> before = sessions.validate(current);
        EXPECT(before.ok());

        Outcome<IssuedSession> r = sessions.refreshSession(current);
        EXPECT(r.ok());
        EXPECT(r.value.session.expires_at > before.value.expires_at);

        EXPECT(sessions.validate(r.value.token).ok());
        EXPECT(sessions.validate(current).status == AuthStatus::InvalidSignature);
        current = r.value.token;
    }

    // Tampered tokens never refresh.
    {
        std::string forged = current;
        forged[0] = forged[0] == 'e' ? 'f' : 'e';
        EXPECT(sessions.validate(forged).status == AuthStatus::InvalidSignature);
        EXPECT(sessions.refreshSession(forged).status == AuthStatus::InvalidSignature);
        EXPECT(sessions.refreshSession("").status == AuthStatus::InvalidSignature);
    }

    // inspect() ignores expiry but not the signature.
    {
        Outcome<SessionPayload> p = sessions.inspect(token);
        EXPECT(p.ok());
        EXPECT(p.value.session_id == row.id);
        EXPECT(sessions.inspect("garbage").status == AuthStatus::InvalidSignature);
    }

    // Logout revokes the row; neither validate nor refresh revive it.
    {
        Outcome<std::string> out = sessions.invalidateSession(row.id);
        EXPECT(out.ok());
        EXPECT(out.value.find("session=;") == 0);
        EXPECT(out.value.find("Max-Age=0") != std::string::npos);

        EXPECT(sessions.validate(current).status == AuthStatus::Revoked);
        EXPECT(sessions.refreshSession(current).status == AuthStatus::Revoked);

        Session stored;
        EXPECT(store.findSession(row.id, stored) == StoreStatus::Ok);
        EXPECT(stored.revoked_at == clk.now);
        EXPECT(store.sessionCount() == 2);

        // Second logout keeps the first timestamp.
        clk.advance(10);
        EXPECT(sessions.invalidateSession(row.id).ok());
        EXPECT(store.findSession(row.id, stored) == StoreStatus::Ok);
        EXPECT(stored.revoked_at == clk.now - 10);
    }

    {
        Outcome<std::string> out = sessions.invalidateSession("no-such-session");
        EXPECT(out.status == AuthStatus::SessionNotFound);
        EXPECT(out.value == sessions.clearingCookie());
    }

    // The refresh window closes.
    {
        Outcome<IssuedSession> s = sessions.createSession(alice.id);
        EXPECT(s.ok());
        clk.advance(7 * 24 * 3600 - 1);
        Outcome<IssuedSession> r = sessions.refreshSession(s.value.token);
        EXPECT(r.ok());
        EXPECT(r.value.session.expires_at == s.value.session.refresh_expires_at);
        EXPECT(r.value.session.expires_at == clk.now + 1);

        // Already at the end of the window: nothing later fits.
        EXPECT(sessions.refreshSession(r.value.token).status == AuthStatus::Expired);
        EXPECT(sessions.validate(r.value.token).ok());

        clk.advance(3601);
        EXPECT(sessions.validate(r.value.token).status == AuthStatus::Expired);
        EXPECT(sessions.refreshSession(r.value.token).status == AuthStatus::Expired);
    }

    // A live token whose row is not in this store.
    {
        Outcome<IssuedSession> s = sessions.createSession(alice.id);
        EXPECT(s.ok());

        MemoryStorage empty;
        SessionManager other(empty, signer, cfg, clk.clock());
        EXPECT(other.validate(s.value.token).status == AuthStatus::SessionNotFound);
        EXPECT(other.refreshSession(s.value.token).status == AuthStatus::SessionNotFound);
    }

    // Without strict revocation validate() trusts the signature alone.
    {
        SessionConfig loose = cfg;
        loose.strict_revocation = false;
        SessionManager lax(store, signer, loose, clk.clock());

        Outcome<IssuedSession> s = lax.createSession(alice.id);
        EXPECT(s.ok());
        EXPECT(lax.invalidateSession(s.value.session.id).ok());
        EXPECT(lax.validate(s.value.token).ok());
        EXPECT(lax.refreshSession(s.value.token).status == AuthStatus::Revoked);
    }

    // Failed writes leave no row behind.
    {
        BrokenStorage broken;
        User carol = makeUser("Carol", "carol@example.com");
        EXPECT(broken.insertUser(carol) == StoreStatus::Ok);
        SessionManager flaky(broken, signer, cfg, clk.clock());

        Outcome<IssuedSession> s = flaky.createSession(carol.id);
        EXPECT(s.ok());

        broken.broken = true;
        EXPECT(flaky.createSession(carol.id).status == AuthStatus::StorageError);
        EXPECT(broken.sessionCount() == 1);

        clk.advance(3600);
        EXPECT(flaky.refreshSession(s.value.token).status == AuthStatus::StorageError);
        EXPECT(flaky.invalidateSession(s.value.session.id).status == AuthStatus::StorageError);

        broken.broken = false;
        EXPECT(flaky.validate(s.value.token).status == AuthStatus::Expired);
        EXPECT(flaky.refreshSession(s.value.token).ok());
    }

    return 0;
}
