#include "RequestGate.hpp"
#include <spdlog/spdlog.h>
#include "Cookie.hpp"
#include "../auth/SessionManager.hpp"
#include "../utils/Encoding.hpp"

RequestGate::RequestGate(const RouteClassifier& c, SessionManager& s, const std::string& login)
    : classifier(c),
    sessions(s),
    login_url(login)
{
    spdlog::info("RequestGate: {} public / {} private prefixes, login at '{}'",
        classifier.publicPrefixes().size(), classifier.privatePrefixes().size(), login_url);
}

std::string RequestGate::redirectLocation(const GateRequest& req) const {
    std::string target = req.path;
    if (!req.query.empty())
        target += "?" + req.query;

    char sep = login_url.find('?') == std::string::npos ? '?' : '&';
    return login_url + sep + "redirect_uri=" + Encoding::urlEncode(target);
}

GateDecision RequestGate::redirect(GateDecision d, const GateRequest& req, AuthStatus why) const {
    d.action = GateAction::Redirect;
    d.location = redirectLocation(req);
    d.reason = why;
    d.user_id.clear();
    spdlog::info("Gate: redirecting '{}' to login ({})", req.path, toString(why));
    return d;
}

GateDecision RequestGate::handle(const GateRequest& req) {
    GateDecision d;
    d.route = classifier.classify(req.path);

    if (!d.route.requiresAuth()) {
        spdlog::debug("Gate: '{}' is not private, allowing", req.path);
        return d;
    }

    std::string token;
    if (!Cookie::find(req.cookie_header, Cookie::kSessionCookie, token)) {
        spdlog::debug("Gate: no session cookie on '{}'", req.path);
        return redirect(d, req, AuthStatus::SessionNotFound);
    }

    Outcome<SessionPayload> checked = sessions.validate(token);
    if (checked.ok()) {
        d.user_id = checked.value.user_id;
        spdlog::debug("Gate: allowing '{}' for user '{}'", req.path, d.user_id);
        return d;
    }

    if (checked.status != AuthStatus::Expired)
        return redirect(d, req, checked.status);

    spdlog::info("Gate: session expired on '{}', attempting refresh", req.path);
    Outcome<IssuedSession> refreshed = sessions.refreshSession(token);
    if (!refreshed.ok())
        return redirect(d, req, refreshed.status);

    d.user_id = refreshed.value.session.user_id;
    d.set_cookie = sessions.cookieFor(refreshed.value);
    spdlog::info("Gate: refreshed session for user '{}' on '{}'", d.user_id, req.path);
    return d;
}
