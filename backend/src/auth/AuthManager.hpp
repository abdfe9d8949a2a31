#pragma once

#include <string>
#include "Outcome.hpp"
#include "Session.hpp"
#include "VerificationCodeIssuer.hpp"
#include "../utils/Clock.hpp"

class Storage;
class PasswordHasher;
class SessionManager;

struct LoginResult {
    std::string user_id;
    IssuedSession session;   // empty token when status is Unverified
    std::string set_cookie;  // Set-Cookie header for the new session
};

// Account flows: registration, login, email verification, resend, logout.
// Every call returns an Outcome; nothing throws to the caller.
class AuthManager {
public:
    AuthManager(Storage& storage, const PasswordHasher& hasher,
        VerificationCodeIssuer& codes, SessionManager& sessions,
        Clock clock = systemClock());

    // Value is the new user id. DeliveryFailed still carries it: the account
    // exists, only the verification email may not have arrived.
    Outcome<std::string> registerUser(const std::string& name, const std::string& email,
        const std::string& password, const std::string& confirm_password);

    // Unverified accounts get status Unverified with user_id set and no session.
    Outcome<LoginResult> authenticateUser(const std::string& email, const std::string& password);

    // Checks the code, marks the email verified and opens a session.
    Outcome<LoginResult> verifyUserEmail(const std::string& user_id, const std::string& code);

    Outcome<IssuedCode> resendUserEmailVerification(const std::string& user_id);

    // Revokes the session behind `token` (expired tokens included). The value
    // is always the cookie-clearing Set-Cookie header.
    Outcome<std::string> logoutUser(const std::string& token);

    // Length >= 8, one uppercase letter, one digit.
    static Outcome<> checkPasswordPolicy(const std::string& password);

private:
    Storage& store;
    const PasswordHasher& hasher;
    VerificationCodeIssuer& codes;
    SessionManager& sessions;
    Clock clock;

    Outcome<LoginResult> openSession(const std::string& user_id);
};
