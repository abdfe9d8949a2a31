#pragma once
#include <ctime>
#include <string>
#include "Outcome.hpp"
#include "User.hpp"
#include "VerificationRequest.hpp"
#include "../config/Config.hpp"
#include "../utils/Clock.hpp"

class Storage;
class Notifier;

struct IssuedCode {
    int code = 0;
    std::time_t expires_at = 0;
    long long retry_after = 0;  // seconds; set only when Throttled
};

/*
  Email verification codes, one per user:

    NoCode -> Pending -> Verified
                     \-> Expired -> (resend) -> Pending

  Codes are 5 digits and live code_lifetime_seconds. A code can be re-sent once
  it has no more than resend_cooldown_seconds left.
*/
class VerificationCodeIssuer {
public:
    VerificationCodeIssuer(Storage& storage, Notifier& notifier,
        const VerificationConfig& cfg, const std::string& app_name,
        Clock clock = systemClock());

    // Fresh code for `user_id` expiring one lifetime from now. Not stored.
    VerificationRequest generate(const std::string& user_id) const;

    // Stores a fresh code (overwriting any previous one) and mails it.
    Outcome<IssuedCode> issue(const User& user);

    // Throttled while the current code expires after now + cooldown; the
    // check and overwrite are one atomic store call.
    Outcome<IssuedCode> resend(const std::string& user_id);

    // UserNotFound, AlreadyVerified, CodeNotFound, Expired or Mismatch.
    // On Ok the caller marks the user verified.
    Outcome<> verify(const std::string& user_id, const std::string& code);

    // Mails an already stored code. DeliveryFailed leaves the code in place.
    Outcome<IssuedCode> deliver(const User& user, const VerificationRequest& req);

    static int randomCode();

private:
    Storage& store;
    Notifier& notifier;
    VerificationConfig config;
    std::string app_name;
    Clock clock;
};
