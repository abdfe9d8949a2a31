#include "Config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace
{
    template <typename T>
    void readValue(const json& j, const char* key, T& out) {
        if (j.contains(key))
            out = j.at(key).get<T>();
    }
}

bool parseConfig(const std::string& json_text, AppConfig& out, std::string& err) {
    AppConfig cfg = out;

    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            err = "config root must be an object";
            return false;
        }

        readValue(root, "app_name", cfg.app_name);

        if (root.contains("signing")) {
            const json& s = root.at("signing");
            readValue(s, "secret", cfg.signing_secret);
            readValue(s, "secret_env", cfg.signing_secret_env);
        }

        if (root.contains("routes")) {
            const json& r = root.at("routes");
            readValue(r, "public", cfg.routes.public_prefixes);
            readValue(r, "private", cfg.routes.private_prefixes);
            readValue(r, "login_redirect_url", cfg.routes.login_redirect_url);
        }

        if (root.contains("session")) {
            const json& s = root.at("session");
            readValue(s, "duration_seconds", cfg.session.duration_seconds);
            readValue(s, "refresh_duration_seconds", cfg.session.refresh_duration_seconds);
            readValue(s, "strict_revocation", cfg.session.strict_revocation);
            readValue(s, "secure_cookie", cfg.session.secure_cookie);
        }

        if (root.contains("verification")) {
            const json& v = root.at("verification");
            readValue(v, "code_lifetime_seconds", cfg.verification.code_lifetime_seconds);
            readValue(v, "resend_cooldown_seconds", cfg.verification.resend_cooldown_seconds);
        }

        if (root.contains("password"))
            readValue(root.at("password"), "hash_profile", cfg.password.hash_profile);

        if (root.contains("storage"))
            readValue(root.at("storage"), "path", cfg.storage.path);

        if (root.contains("mail")) {
            const json& m = root.at("mail");
            readValue(m, "from", cfg.mail.from);
            readValue(m, "outbox_dir", cfg.mail.outbox_dir);
        }

        if (root.contains("logging")) {
            const json& l = root.at("logging");
            readValue(l, "level", cfg.logging.level);
            readValue(l, "file", cfg.logging.file);
        }
    }
    catch (const json::exception& e) {
        err = std::string("invalid config: ") + e.what();
        return false;
    }

    if (!cfg.signing_secret_env.empty()) {
        const char* env = std::getenv(cfg.signing_secret_env.c_str());
        if (env != nullptr && *env != '\0') {
            spdlog::debug("Signing secret taken from ${}", cfg.signing_secret_env);
            cfg.signing_secret = env;
        }
    }

    if (!validateConfig(cfg, err))
        return false;

    out = std::move(cfg);
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open config file '" + path + "'";
        return false;
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    return parseConfig(oss.str(), out, err);
}

bool validateConfig(const AppConfig& cfg, std::string& err) {
    if (cfg.signing_secret.size() < kMinSigningSecretBytes) {
        err = "signing secret must be at least " + std::to_string(kMinSigningSecretBytes) + " bytes";
        return false;
    }
    if (cfg.routes.login_redirect_url.empty()) {
        err = "routes.login_redirect_url must not be empty";
        return false;
    }
    if (cfg.session.duration_seconds <= 0) {
        err = "session.duration_seconds must be positive";
        return false;
    }
    if (cfg.session.refresh_duration_seconds < cfg.session.duration_seconds) {
        err = "session.refresh_duration_seconds must be at least session.duration_seconds";
        return false;
    }
    if (cfg.session.refresh_duration_seconds > kMaxDurationSeconds) {
        err = "session durations must not exceed " + std::to_string(kMaxDurationSeconds) + " seconds";
        return false;
    }
    if (cfg.verification.code_lifetime_seconds <= 0) {
        err = "verification.code_lifetime_seconds must be positive";
        return false;
    }
    if (cfg.verification.code_lifetime_seconds > kMaxDurationSeconds) {
        err = "verification.code_lifetime_seconds must not exceed " +
            std::to_string(kMaxDurationSeconds) + " seconds";
        return false;
    }
    if (cfg.verification.resend_cooldown_seconds < 0 ||
        cfg.verification.resend_cooldown_seconds >= cfg.verification.code_lifetime_seconds)
    {
        err = "verification.resend_cooldown_seconds must be in [0, code_lifetime_seconds)";
        return false;
    }

    const std::string& p = cfg.password.hash_profile;
    if (p != "min" && p != "interactive" && p != "moderate" && p != "sensitive") {
        err = "password.hash_profile must be one of min, interactive, moderate, sensitive";
        return false;
    }

    const std::string& lvl = cfg.logging.level;
    if (lvl != "trace" && lvl != "debug" && lvl != "info" && lvl != "warn" &&
        lvl != "error" && lvl != "critical" && lvl != "off")
    {
        err = "logging.level must be one of trace, debug, info, warn, error, critical, off";
        return false;
    }
    return true;
}
