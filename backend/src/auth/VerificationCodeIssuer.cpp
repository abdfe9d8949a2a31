#include "VerificationCodeIssuer.hpp"
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include "../storage/Storage.hpp"
#include "../notify/Notifier.hpp"

static constexpr int CODE_MIN = 10000;
static constexpr int CODE_SPAN = 90000;  // 10000..99999

VerificationCodeIssuer::VerificationCodeIssuer(Storage& storage, Notifier& n,
    const VerificationConfig& cfg, const std::string& app, Clock c)
    : store(storage),
    notifier(n),
    config(cfg),
    app_name(app),
    clock(std::move(c))
{
    spdlog::debug("VerificationCodeIssuer initialized: lifetime={}s cooldown={}s",
        config.code_lifetime_seconds, config.resend_cooldown_seconds);
}

int VerificationCodeIssuer::randomCode() {
    return CODE_MIN + static_cast<int>(randombytes_uniform(CODE_SPAN));
}

VerificationRequest VerificationCodeIssuer::generate(const std::string& user_id) const {
    VerificationRequest req;
    req.user_id = user_id;
    req.code = randomCode();
    req.expires_at = clock() + static_cast<std::time_t>(config.code_lifetime_seconds);
    return req;
}

Outcome<IssuedCode> VerificationCodeIssuer::issue(const User& user) {
    spdlog::info("Issuing verification code for user '{}'", user.id);

    VerificationRequest req = generate(user.id);
    StoreStatus st = store.upsertVerification(req);
    if (st == StoreStatus::NotFound)
        return Outcome<IssuedCode>::failure(AuthStatus::UserNotFound, "User not found");
    if (st != StoreStatus::Ok) {
        spdlog::error("Storing verification code for '{}' failed: {}", user.id, toString(st));
        return Outcome<IssuedCode>::failure(toAuthStatus(st), "Unable to store verification code");
    }

    return deliver(user, req);
}

Outcome<IssuedCode> VerificationCodeIssuer::resend(const std::string& user_id) {
    spdlog::info("Resend of verification code requested for user '{}'", user_id);

    User user;
    StoreStatus st = store.findUserById(user_id, user);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Resend failed: user '{}' not found", user_id);
        return Outcome<IssuedCode>::failure(AuthStatus::UserNotFound, "User not found");
    }
    if (st != StoreStatus::Ok)
        return Outcome<IssuedCode>::failure(toAuthStatus(st), "Unable to load user");

    if (user.isVerified()) {
        spdlog::warn("Resend refused: user '{}' already verified", user_id);
        return Outcome<IssuedCode>::failure(AuthStatus::AlreadyVerified, "Email already verified");
    }

    // A code still valid for more than one cooldown cannot be replaced.
    std::time_t now = clock();
    std::time_t latest_expiry = now + static_cast<std::time_t>(config.resend_cooldown_seconds);

    VerificationRequest next = generate(user_id);
    VerificationRequest current;
    st = store.replaceVerificationIfStale(next, latest_expiry, current);

    if (st == StoreStatus::Conflict) {
        IssuedCode wait;
        wait.expires_at = current.expires_at;
        wait.retry_after = static_cast<long long>(current.expires_at - latest_expiry);
        spdlog::warn("Resend throttled for user '{}' ({}s left)", user_id, wait.retry_after);
        return Outcome<IssuedCode>::failure(AuthStatus::Throttled,
            "Please wait a bit longer! You've already received a verification code less than " +
            std::to_string((config.resend_cooldown_seconds + 59) / 60) + " minutes ago.",
            wait);
    }
    if (st == StoreStatus::NotFound)
        return Outcome<IssuedCode>::failure(AuthStatus::UserNotFound, "User not found");
    if (st != StoreStatus::Ok) {
        spdlog::error("Replacing verification code for '{}' failed: {}", user_id, toString(st));
        return Outcome<IssuedCode>::failure(toAuthStatus(st), "Unable to store verification code");
    }

    return deliver(user, next);
}

Outcome<> VerificationCodeIssuer::verify(const std::string& user_id, const std::string& code) {
    spdlog::info("Verifying email code for user '{}'", user_id);

    User user;
    StoreStatus st = store.findUserById(user_id, user);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Verification failed: user '{}' not found", user_id);
        return Outcome<>::failure(AuthStatus::UserNotFound, "User not found");
    }
    if (st != StoreStatus::Ok)
        return Outcome<>::failure(toAuthStatus(st), "Unable to load user");

    if (user.isVerified()) {
        spdlog::warn("Verification refused: user '{}' already verified", user_id);
        return Outcome<>::failure(AuthStatus::AlreadyVerified, "Email already verified");
    }

    VerificationRequest req;
    st = store.findVerification(user_id, req);
    if (st == StoreStatus::NotFound) {
        spdlog::warn("Verification failed: no code on file for '{}'", user_id);
        return Outcome<>::failure(AuthStatus::CodeNotFound, "Verification code not found");
    }
    if (st != StoreStatus::Ok)
        return Outcome<>::failure(toAuthStatus(st), "Unable to load verification code");

    if (clock() >= req.expires_at) {
        spdlog::warn("Verification failed: code for '{}' expired", user_id);
        return Outcome<>::failure(AuthStatus::Expired, "Verification code has expired");
    }

    bool well_formed = code.size() == 5;
    for (char c : code)
        if (c < '0' || c > '9') well_formed = false;

    if (!well_formed || std::stoi(code) != req.code) {
        spdlog::warn("Verification failed: incorrect code for '{}'", user_id);
        return Outcome<>::failure(AuthStatus::Mismatch, "Incorrect verification code");
    }

    spdlog::info("Verification code accepted for user '{}'", user_id);
    return Outcome<>::success({});
}

Outcome<IssuedCode> VerificationCodeIssuer::deliver(const User& user, const VerificationRequest& req) {
    IssuedCode issued;
    issued.code = req.code;
    issued.expires_at = req.expires_at;

    DeliveryStatus ds = notifier.send(user.email,
        "[" + app_name + "] Verify your account",
        "Verification code: " + std::to_string(req.code));

    if (ds == DeliveryStatus::Timeout) {
        spdlog::error("Verification email to user '{}' timed out", user.id);
        return Outcome<IssuedCode>::failure(AuthStatus::DeliveryFailed,
            "Verification email timed out and may not have arrived", issued);
    }
    if (ds != DeliveryStatus::Delivered) {
        spdlog::error("Verification email to user '{}' failed", user.id);
        return Outcome<IssuedCode>::failure(AuthStatus::DeliveryFailed,
            "Unable to send verification email", issued);
    }

    spdlog::info("Verification email sent to user '{}'", user.id);
    return Outcome<IssuedCode>::success(issued, "Verification email sent");
}
