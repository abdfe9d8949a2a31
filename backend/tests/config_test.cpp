#include <cstdlib>
#include <fstream>
#include <string>

#include "TestSupport.hpp"
#include "config/Config.hpp"

static const char* kSecretJson = "\"signing\": { \"secret\": \"0123456789abcdef0123456789abcdef\" }";

int main() {
    unsetenv("SESSIONGATE_SIGNING_KEY");
    spdlog::set_level(spdlog::level::warn);

    // Defaults survive a config that only sets the secret.
    {
        AppConfig cfg;
        std::string err;
        EXPECT(parseConfig(std::string("{") + kSecretJson + "}", cfg, err));
        EXPECT(cfg.signing_secret == "0123456789abcdef0123456789abcdef");
        EXPECT(cfg.app_name == "SessionGate");
        EXPECT(cfg.routes.public_prefixes.size() == 2);
        EXPECT(cfg.routes.public_prefixes[0] == "/");
        EXPECT(cfg.routes.public_prefixes[1] == "/auth/");
        EXPECT(cfg.routes.private_prefixes.size() == 1);
        EXPECT(cfg.routes.private_prefixes[0] == "/dashboard");
        EXPECT(cfg.routes.login_redirect_url == "/auth/login");
        EXPECT(cfg.session.duration_seconds == 3600);
        EXPECT(cfg.session.refresh_duration_seconds == 7 * 24 * 3600);
        EXPECT(cfg.session.strict_revocation);
        EXPECT(cfg.session.secure_cookie);
        EXPECT(cfg.verification.code_lifetime_seconds == 3600);
        EXPECT(cfg.verification.resend_cooldown_seconds == 300);
        EXPECT(cfg.password.hash_profile == "interactive");
        EXPECT(cfg.storage.path == "sessiongate.db");
        EXPECT(cfg.mail.outbox_dir.empty());
        EXPECT(cfg.logging.level == "info");
    }

    // Every section overridden.
    {
        const std::string text = R"({
            "app_name": "Portal",
            "signing": { "secret": "abcdefghijklmnopqrstuvwxyz0123456789", "secret_env": "" },
            "routes": {
                "public": ["/", "/docs/"],
                "private": ["/admin", "/account"],
                "login_redirect_url": "/signin"
            },
            "session": {
                "duration_seconds": 900,
                "refresh_duration_seconds": 86400,
                "strict_revocation": false,
                "secure_cookie": false
            },
            "verification": { "code_lifetime_seconds": 600, "resend_cooldown_seconds": 60 },
            "password": { "hash_profile": "min" },
            "storage": { "path": "/tmp/portal.db" },
            "mail": { "from": "Portal <mail@portal.test>", "outbox_dir": "/tmp/outbox" },
            "logging": { "level": "debug", "file": "" }
        })";

        AppConfig cfg;
        std::string err;
        EXPECT(parseConfig(text, cfg, err));
        EXPECT(cfg.app_name == "Portal");
        EXPECT(cfg.routes.public_prefixes.size() == 2);
        EXPECT(cfg.routes.public_prefixes[1] == "/docs/");
        EXPECT(cfg.routes.private_prefixes.size() == 2);
        EXPECT(cfg.routes.private_prefixes[1] == "/account");
        EXPECT(cfg.routes.login_redirect_url == "/signin");
        EXPECT(cfg.session.duration_seconds == 900);
        EXPECT(cfg.session.refresh_duration_seconds == 86400);
        EXPECT(!cfg.session.strict_revocation);
        EXPECT(!cfg.session.secure_cookie);
        EXPECT(cfg.verification.code_lifetime_seconds == 600);
        EXPECT(cfg.verification.resend_cooldown_seconds == 60);
        EXPECT(cfg.password.hash_profile == "min");
        EXPECT(cfg.storage.path == "/tmp/portal.db");
        EXPECT(cfg.mail.from == "Portal <mail@portal.test>");
        EXPECT(cfg.mail.outbox_dir == "/tmp/outbox");
        EXPECT(cfg.logging.level == "debug");
        EXPECT(cfg.logging.file.empty());
    }

    // Rejections leave the output untouched and explain why.
    {
        const char* bad[] = {
            "not json",
            "[]",
            "{}",
            R"({ "signing": { "secret": "too-short" } })",
            R"({ "signing": { "secret": 42 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "routes": { "login_redirect_url": "" } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "routes": { "private": "/dashboard" } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "session": { "duration_seconds": 0 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "session": { "duration_seconds": 7200, "refresh_duration_seconds": 3600 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "verification": { "code_lifetime_seconds": 0 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "session": { "duration_seconds": 9000000000000000000, "refresh_duration_seconds": 9000000000000000000 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "session": { "refresh_duration_seconds": 315360001 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "verification": { "code_lifetime_seconds": 9000000000000000000 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "verification": { "resend_cooldown_seconds": 3600 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "verification": { "resend_cooldown_seconds": -1 } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "password": { "hash_profile": "fast" } })",
            R"({ "signing": { "secret": "0123456789abcdef0123456789abcdef" }, "logging": { "level": "verbose" } })"
        };
        for (const char* text : bad) {
            AppConfig cfg;
            cfg.app_name = "unchanged";
            std::string err;
            if (parseConfig(text, cfg, err)) {
                std::cerr << "accepted: " << text << "\n";
                FAIL();
            }
            if (err.empty()) FAIL();
            if (cfg.app_name != "unchanged") FAIL();
        }
    }

    // Ten years is the longest accepted duration.
    {
        const std::string text = std::string("{") + kSecretJson + R"(,
            "session": { "duration_seconds": 315360000, "refresh_duration_seconds": 315360000 },
            "verification": { "code_lifetime_seconds": 315360000 } })";
        AppConfig cfg;
        std::string err;
        EXPECT(parseConfig(text, cfg, err));
        EXPECT(cfg.session.refresh_duration_seconds == kMaxDurationSeconds);
        EXPECT(cfg.verification.code_lifetime_seconds == kMaxDurationSeconds);
    }

    // The environment overrides the file.
    {
        setenv("SG_TEST_SIGNING_KEY", "from-the-environment-0123456789abcdef", 1);
        const std::string text = R"({ "signing": { "secret": "short", "secret_env": "SG_TEST_SIGNING_KEY" } })";
        AppConfig cfg;
        std::string err;
        EXPECT(parseConfig(text, cfg, err));
        EXPECT(cfg.signing_secret == "from-the-environment-0123456789abcdef");

        setenv("SG_TEST_SIGNING_KEY", "", 1);
        EXPECT(!parseConfig(text, cfg, err));
        unsetenv("SG_TEST_SIGNING_KEY");
    }

    // Files.
    {
        auto dir = tempDir("sessiongate_config_test");
        std::string err;
        AppConfig cfg;
        EXPECT(!loadConfig((dir / "missing.json").string(), cfg, err));
        EXPECT(err.find("missing.json") != std::string::npos);

        auto path = dir / "sessiongate.json";
        {
            std::ofstream out(path);
            out << "{ \"app_name\": \"FromFile\", " << kSecretJson << " }";
        }
        EXPECT(loadConfig(path.string(), cfg, err));
        EXPECT(cfg.app_name == "FromFile");
    }

    return 0;
}
