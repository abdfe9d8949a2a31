#pragma once
#include <string>
#include <ctime>

class User {
public:
    User() = default;
    // New unverified account with a fresh id.
    User(const std::string& name, const std::string& email, const std::string& hash,
        std::time_t created);

    std::string id;               // UUIDv4 text
    std::string name;
    std::string email;            // unique
    std::string password_hash;    // Argon2id hash (crypto_pwhash_str)
    std::time_t email_verified_at = 0;     // 0 = unverified
    std::time_t created_at = 0;
    std::time_t last_password_change = 0;  // reserved, 0 = never

    bool isVerified() const { return email_verified_at != 0; }

    // Random RFC 4122 version 4 identifier (libsodium CSPRNG).
    static std::string generateID();
};
