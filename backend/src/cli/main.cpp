#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../config/Config.hpp"
#include "../auth/AuthManager.hpp"
#include "../auth/PasswordHasher.hpp"
#include "../auth/SessionManager.hpp"
#include "../auth/TokenSigner.hpp"
#include "../auth/VerificationCodeIssuer.hpp"
#include "../gate/Cookie.hpp"
#include "../gate/RequestGate.hpp"
#include "../gate/RouteClassifier.hpp"
#include "../notify/LogNotifier.hpp"
#include "../notify/OutboxNotifier.hpp"
#include "../storage/FileStorage.hpp"

static std::string prompt(const char* label) {
    std::string line;
    std::cout << label;
    std::getline(std::cin, line);
    return line;
}

static void report(const char* what, AuthStatus status, const std::string& message) {
    if (status == AuthStatus::Ok)
        std::cout << what << ": " << (message.empty() ? "ok" : message) << "\n";
    else
        std::cout << what << " failed [" << toString(status) << "]: " << message << "\n";
}

// Splits "/path?query" for the gate.
static GateRequest makeRequest(const std::string& target, const std::string& token) {
    GateRequest req;
    size_t q = target.find('?');
    req.path = target.substr(0, q);
    if (q != std::string::npos)
        req.query = target.substr(q + 1);
    if (!token.empty())
        req.cookie_header = std::string(Cookie::kSessionCookie) + "=" + token;
    return req;
}

// Pulls the cookie value back out of a Set-Cookie header.
static std::string tokenFromSetCookie(const std::string& set_cookie) {
    std::string value;
    Cookie::find(set_cookie.substr(0, set_cookie.find(';')), Cookie::kSessionCookie, value);
    return value;
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    const std::string config_path = argc > 1 ? argv[1] : "sessiongate.json";
    AppConfig cfg;
    std::string err;
    if (!loadConfig(config_path, cfg, err)) {
        std::cerr << "Config error: " << err << "\n";
        return 1;
    }

    try {
        Log::init(cfg.logging);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << "\n";
        return 1;
    }

    FileStorage store(cfg.storage.path);
    if (!store.load()) {
        std::cerr << "Store file '" << cfg.storage.path << "' is unreadable\n";
        return 1;
    }

    std::unique_ptr<Notifier> notifier;
    if (cfg.mail.outbox_dir.empty())
        notifier = std::make_unique<LogNotifier>();
    else
        notifier = std::make_unique<OutboxNotifier>(cfg.mail.outbox_dir, cfg.mail.from);

    std::unique_ptr<TokenSigner> signer;
    try {
        signer = std::make_unique<TokenSigner>(cfg.signing_secret);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Signing key rejected: " << e.what() << "\n";
        return 1;
    }

    PasswordHasher hasher(PasswordHasher::profileFromString(cfg.password.hash_profile));
    VerificationCodeIssuer codes(store, *notifier, cfg.verification, cfg.app_name);
    SessionManager sessions(store, *signer, cfg.session);
    AuthManager auth(store, hasher, codes, sessions);
    RouteClassifier routes(cfg.routes.public_prefixes, cfg.routes.private_prefixes);
    RequestGate gate(routes, sessions, cfg.routes.login_redirect_url);

    std::string session_token;   // what a browser would hold in the cookie jar
    std::string pending_user;    // registered/unverified user id

    while (true) {
        std::cout << "\n===== " << cfg.app_name << " =====\n"
            << "Session: " << (session_token.empty() ? "(none)" : "active") << "\n"
            "1. Register\n"
            "2. Verify email\n"
            "3. Resend verification code\n"
            "4. Login\n"
            "5. Request a path\n"
            "6. Logout\n"
            "7. Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear();
            std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

        if (choice == 1) {
            std::string name = prompt("Name: ");
            std::string email = prompt("Email: ");
            std::string password = prompt("Password: ");
            std::string confirm = prompt("Confirm password: ");

            auto r = auth.registerUser(name, email, password, confirm);
            report("Register", r.status, r.message);
            if (!r.value.empty()) {
                pending_user = r.value;
                std::cout << "User id: " << pending_user << "\n";
            }
        }

        else if (choice == 2) {
            std::string id = pending_user;
            if (id.empty()) id = prompt("User id: ");
            std::string code = prompt("5-digit code: ");

            auto r = auth.verifyUserEmail(id, code);
            report("Verify", r.status, r.message);
            if (r.ok()) {
                session_token = r.value.session.token;
                pending_user.clear();
                std::cout << "Set-Cookie: " << r.value.set_cookie << "\n";
            }
        }

        else if (choice == 3) {
            std::string id = pending_user;
            if (id.empty()) id = prompt("User id: ");

            auto r = auth.resendUserEmailVerification(id);
            report("Resend", r.status, r.message);
            if (r.status == AuthStatus::Throttled)
                std::cout << "Retry in " << r.value.retry_after << "s\n";
        }

        else if (choice == 4) {
            std::string email = prompt("Email: ");
            std::string password = prompt("Password: ");

            auto r = auth.authenticateUser(email, password);
            report("Login", r.status, r.message);
            if (r.ok()) {
                session_token = r.value.session.token;
                std::cout << "Set-Cookie: " << r.value.set_cookie << "\n";
            }
            else if (r.status == AuthStatus::Unverified) {
                pending_user = r.value.user_id;
                std::cout << "Verify your email first (user id " << pending_user << ")\n";
            }
        }

        else if (choice == 5) {
            std::string target = prompt("Path: ");
            if (target.empty()) { std::cout << "Path required.\n"; continue; }

            GateDecision d = gate.handle(makeRequest(target, session_token));
            if (d.action == GateAction::Allow) {
                std::cout << "200 OK" << (d.route.is_private ? " (private)" : " (public)");
                if (!d.user_id.empty()) std::cout << " user=" << d.user_id;
                std::cout << "\n";
                if (!d.set_cookie.empty()) {
                    std::cout << "Set-Cookie: " << d.set_cookie << "\n";
                    session_token = tokenFromSetCookie(d.set_cookie);
                }
            }
            else {
                std::cout << "302 Found\nLocation: " << d.location << "\n";
            }
        }

        else if (choice == 6) {
            auto r = auth.logoutUser(session_token);
            report("Logout", r.status, r.message);
            std::cout << "Set-Cookie: " << r.value << "\n";
            session_token.clear();
        }

        else if (choice == 7)
            break;

        else std::cout << "Invalid.\n";
    }

    std::cout << "Goodbye!\n";
    return 0;
}
