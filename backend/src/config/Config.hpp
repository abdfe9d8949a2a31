#pragma once
#include <string>
#include <vector>

struct RouteConfig {
    std::vector<std::string> public_prefixes{ "/", "/auth/" };
    std::vector<std::string> private_prefixes{ "/dashboard" };
    std::string login_redirect_url = "/auth/login";
};

struct SessionConfig {
    long long duration_seconds = 60 * 60;                  // access token lifetime
    long long refresh_duration_seconds = 7 * 24 * 60 * 60; // refresh window from login
    bool strict_revocation = true;   // validate() checks the row, not only the signature
    bool secure_cookie = true;       // set "Secure" (production)
};

struct VerificationConfig {
    long long code_lifetime_seconds = 60 * 60;
    long long resend_cooldown_seconds = 5 * 60;
};

struct PasswordConfig {
    std::string hash_profile = "interactive"; // min | interactive | moderate | sensitive
};

struct StorageConfig {
    std::string path = "sessiongate.db";
};

struct MailConfig {
    std::string from = "SessionGate <no-reply@localhost>";
    std::string outbox_dir;  // empty = log messages instead of writing them
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "sessiongate.log";  // empty = console only
};

// Everything the process reads at startup. Immutable once loaded; the signing
// secret only changes by restarting with a new value, which invalidates every
// outstanding session token.
struct AppConfig {
    std::string app_name = "SessionGate";
    std::string signing_secret;
    std::string signing_secret_env = "SESSIONGATE_SIGNING_KEY";

    RouteConfig routes;
    SessionConfig session;
    VerificationConfig verification;
    PasswordConfig password;
    StorageConfig storage;
    MailConfig mail;
    LoggingConfig logging;
};

constexpr size_t kMinSigningSecretBytes = 32;
// Upper bound for every configured duration (ten years).
constexpr long long kMaxDurationSeconds = 10LL * 365 * 24 * 60 * 60;

// Parses JSON text over the defaults in `out`. Keys that are absent keep their
// default. The environment variable named by signing.secret_env, when set,
// overrides signing.secret. Runs validateConfig() before returning.
bool parseConfig(const std::string& json_text, AppConfig& out, std::string& err);

// Reads `path` and calls parseConfig().
bool loadConfig(const std::string& path, AppConfig& out, std::string& err);

bool validateConfig(const AppConfig& cfg, std::string& err);
