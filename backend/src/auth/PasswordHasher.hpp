#pragma once
#include <string>

// Argon2id password hashing through libsodium's crypto_pwhash_str.
// Output strings embed algorithm, parameters and salt, so verify() needs only
// the stored hash.
class PasswordHasher {
public:
    enum class Profile { Min, Interactive, Moderate, Sensitive };

    explicit PasswordHasher(Profile profile = Profile::Interactive);

    // Throws std::runtime_error("password hashing failed") on any internal
    // failure; the message never mentions the input.
    std::string hash(const std::string& password) const;

    bool verify(const std::string& password, const std::string& hash) const;

    // Maps a config string (min, interactive, moderate, sensitive).
    static Profile profileFromString(const std::string& name);

private:
    unsigned long long opslimit;
    size_t memlimit;
};
