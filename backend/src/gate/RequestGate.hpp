#pragma once
#include <string>
#include "RouteClassifier.hpp"
#include "../auth/Outcome.hpp"

class SessionManager;

struct GateRequest {
    std::string path;           // "/dashboard/settings"
    std::string query;          // without '?', may be empty
    std::string cookie_header;  // raw Cookie header, may be empty
};

enum class GateAction {
    Allow,
    Redirect
};

struct GateDecision {
    GateAction action = GateAction::Allow;
    RouteClass route;
    std::string location;    // Redirect target
    std::string set_cookie;  // refreshed session cookie, if one was minted
    std::string user_id;     // authenticated user on private routes
    AuthStatus reason = AuthStatus::Ok;  // why a private request was redirected
};

// Middleware core: classifies the path and, for private routes, requires a
// valid session, refreshing an expired one on the fly. Anything that is not a
// valid session becomes a redirect to the login page, never an error.
class RequestGate {
public:
    RequestGate(const RouteClassifier& classifier, SessionManager& sessions,
        const std::string& login_redirect_url);

    GateDecision handle(const GateRequest& req);

    // login_redirect_url + "?redirect_uri=" + encoded path[?query]
    std::string redirectLocation(const GateRequest& req) const;

private:
    const RouteClassifier& classifier;
    SessionManager& sessions;
    std::string login_url;

    GateDecision redirect(GateDecision d, const GateRequest& req, AuthStatus why) const;
};
