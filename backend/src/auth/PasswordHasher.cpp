#include "PasswordHasher.hpp"
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

PasswordHasher::PasswordHasher(Profile profile) {
    switch (profile) {
    case Profile::Min:
        opslimit = crypto_pwhash_OPSLIMIT_MIN;
        memlimit = crypto_pwhash_MEMLIMIT_MIN;
        break;
    case Profile::Moderate:
        opslimit = crypto_pwhash_OPSLIMIT_MODERATE;
        memlimit = crypto_pwhash_MEMLIMIT_MODERATE;
        break;
    case Profile::Sensitive:
        opslimit = crypto_pwhash_OPSLIMIT_SENSITIVE;
        memlimit = crypto_pwhash_MEMLIMIT_SENSITIVE;
        break;
    case Profile::Interactive:
    default:
        opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
        memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
        break;
    }
}

PasswordHasher::Profile PasswordHasher::profileFromString(const std::string& name) {
    if (name == "min") return Profile::Min;
    if (name == "moderate") return Profile::Moderate;
    if (name == "sensitive") return Profile::Sensitive;
    return Profile::Interactive;
}

std::string PasswordHasher::hash(const std::string& password) const {
    spdlog::debug("Hashing password (not logging the password)");

    char out[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(
        out,
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        opslimit,
        memlimit) != 0)
    {
        spdlog::error("crypto_pwhash_str failed (likely out of memory)");
        throw std::runtime_error("password hashing failed");
    }

    spdlog::debug("Password hashed successfully");
    return std::string(out);
}

bool PasswordHasher::verify(const std::string& password, const std::string& hash) const {
    spdlog::debug("Verifying password (not logging password or hash)");

    if (hash.empty()) {
        spdlog::warn("verify() called with empty hash");
        return false;
    }

    if (crypto_pwhash_str_verify(hash.c_str(),
        password.c_str(),
        static_cast<unsigned long long>(password.size())) == 0)
    {
        spdlog::debug("Password verified successfully");
        return true;
    }

    spdlog::debug("Password verification failed");
    return false;
}
