#include "AuthManager.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include "PasswordHasher.hpp"
#include "SessionManager.hpp"
#include "User.hpp"
#include "../storage/Storage.hpp"

static constexpr size_t MIN_PASSWORD_LENGTH = 8;

static bool hasLineBreak(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

// Loose shape check: something@something, no whitespace.
static bool plausibleEmail(const std::string& email) {
    size_t at = email.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= email.size())
        return false;
    if (email.find('@', at + 1) != std::string::npos)
        return false;
    for (unsigned char c : email)
        if (std::isspace(c)) return false;
    return true;
}

AuthManager::AuthManager(Storage& storage, const PasswordHasher& h,
    VerificationCodeIssuer& c, SessionManager& s, Clock clk)
    : store(storage),
    hasher(h),
    codes(c),
    sessions(s),
    clock(std::move(clk))
{
    spdlog::info("AuthManager initialized");
}

Outcome<> AuthManager::checkPasswordPolicy(const std::string& password) {
    if (password.size() < MIN_PASSWORD_LENGTH)
        return Outcome<>::failure(AuthStatus::Validation, "Password must be at least 8 characters long");

    bool upper = false, digit = false;
    for (unsigned char c : password) {
        if (std::isupper(c)) upper = true;
        if (std::isdigit(c)) digit = true;
    }

    if (!upper)
        return Outcome<>::failure(AuthStatus::Validation, "Password must have at least one uppercase character");
    if (!digit)
        return Outcome<>::failure(AuthStatus::Validation, "Password must have at least one number");

    return Outcome<>::success({});
}

Outcome<std::string> AuthManager::registerUser(const std::string& name, const std::string& email,
    const std::string& password, const std::string& confirm_password)
{
    using Result = Outcome<std::string>;
    spdlog::info("Attempting registration for email '{}'", email);

    Outcome<> policy = checkPasswordPolicy(password);
    if (!policy.ok()) {
        spdlog::warn("Registration failed: {}", policy.message);
        return Result::failure(policy.status, policy.message);
    }
    if (password != confirm_password) {
        spdlog::warn("Registration failed: confirmation does not match");
        return Result::failure(AuthStatus::Validation, "Passwords do not match");
    }
    if (name.empty() || hasLineBreak(name)) {
        spdlog::warn("Registration failed: invalid name");
        return Result::failure(AuthStatus::Validation, "Name is required");
    }
    if (!plausibleEmail(email)) {
        spdlog::warn("Registration failed: invalid email '{}'", email);
        return Result::failure(AuthStatus::Validation, "Email address is not valid");
    }

    User existing;
    StoreStatus st = store.findUserByEmail(email, existing);
    if (st == StoreStatus::Ok) {
        spdlog::warn("Registration failed: email '{}' already registered", email);
        return Result::failure(AuthStatus::EmailTaken, "Email already registered");
    }
    if (st != StoreStatus::NotFound)
        return Result::failure(toAuthStatus(st), "Unable to register account");

    std::string hash;
    spdlog::debug("Hashing password for new account '{}'", email);
    try {
        hash = hasher.hash(password);
    }
    catch (const std::exception& e) {
        spdlog::error("Registration failed for '{}': {}", email, e.what());
        return Result::failure(AuthStatus::HashingFailed, "Unable to register account");
    }

    User user(name, email, hash, clock());

    VerificationRequest first_code = codes.generate(user.id);
    st = store.insertUserWithVerification(user, first_code);
    if (st == StoreStatus::Conflict) {
        spdlog::warn("Registration failed: email '{}' registered concurrently", email);
        return Result::failure(AuthStatus::EmailTaken, "Email already registered");
    }
    if (st != StoreStatus::Ok) {
        spdlog::error("Registration write failed for '{}': {}", email, toString(st));
        return Result::failure(toAuthStatus(st), "Unable to register account");
    }

    spdlog::info("User '{}' registered", user.id);

    Outcome<IssuedCode> sent = codes.deliver(user, first_code);
    if (!sent.ok())
        return Result::failure(sent.status, sent.message, user.id);

    return Result::success(user.id, "Verification email sent");
}

Outcome<LoginResult> AuthManager::authenticateUser(const std::string& email, const std::string& password) {
    using Result = Outcome<LoginResult>;
    spdlog::info("Login attempt for email '{}'", email);

    Outcome<> policy = checkPasswordPolicy(password);
    if (!policy.ok()) {
        spdlog::warn("Login failed: {}", policy.message);
        return Result::failure(policy.status, policy.message);
    }

    User user;
    StoreStatus st = store.findUserByEmail(email, user);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Login failed: email '{}' not found", email);
        return Result::failure(AuthStatus::UserNotFound, "Email was not found");
    }
    if (st != StoreStatus::Ok)
        return Result::failure(toAuthStatus(st), "Unable to login to account");

    if (!hasher.verify(password, user.password_hash)) {
        spdlog::warn("Login failed: incorrect password for '{}'", user.id);
        return Result::failure(AuthStatus::IncorrectPassword, "Incorrect password");
    }

    if (!user.isVerified()) {
        spdlog::info("Login held: user '{}' has not verified their email", user.id);
        LoginResult pending;
        pending.user_id = user.id;
        return Result::failure(AuthStatus::Unverified, "Email address not verified", pending);
    }

    Result r = openSession(user.id);
    if (r.ok()) {
        r.message = "Logged in successfully";
        spdlog::info("User '{}' logged in successfully", user.id);
    }
    return r;
}

Outcome<LoginResult> AuthManager::verifyUserEmail(const std::string& user_id, const std::string& code) {
    using Result = Outcome<LoginResult>;

    Outcome<> checked = codes.verify(user_id, code);
    if (!checked.ok())
        return Result::failure(checked.status, checked.message);

    StoreStatus st = store.markEmailVerified(user_id, clock());
    if (st == StoreStatus::NotFound)
        return Result::failure(AuthStatus::UserNotFound, "User not found");
    if (st != StoreStatus::Ok) {
        spdlog::error("Marking '{}' verified failed: {}", user_id, toString(st));
        return Result::failure(toAuthStatus(st), "Unable to verify email");
    }

    spdlog::info("Email verified for user '{}'", user_id);

    Result r = openSession(user_id);
    if (r.ok())
        r.message = "Email verified";
    return r;
}

Outcome<IssuedCode> AuthManager::resendUserEmailVerification(const std::string& user_id) {
    return codes.resend(user_id);
}

Outcome<std::string> AuthManager::logoutUser(const std::string& token) {
    Outcome<SessionPayload> p = sessions.inspect(token);
    if (!p.ok()) {
        spdlog::debug("logoutUser() called without a valid session token");
        return Outcome<std::string>::failure(p.status, p.message, sessions.clearingCookie());
    }

    spdlog::info("User '{}' logging out of session '{}'", p.value.user_id, p.value.session_id);
    return sessions.invalidateSession(p.value.session_id);
}

Outcome<LoginResult> AuthManager::openSession(const std::string& user_id) {
    Outcome<IssuedSession> s = sessions.createSession(user_id);
    if (!s.ok()) {
        spdlog::error("Unable to create session for '{}': {}", user_id, s.message);
        return Outcome<LoginResult>::failure(s.status, "Unable to create session");
    }

    LoginResult result;
    result.user_id = user_id;
    result.set_cookie = sessions.cookieFor(s.value);
    result.session = std::move(s.value);
    return Outcome<LoginResult>::success(std::move(result));
}
