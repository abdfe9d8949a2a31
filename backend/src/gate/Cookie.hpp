#pragma once
#include <ctime>
#include <string>

namespace Cookie
{
    constexpr const char* kSessionCookie = "session";

    // Finds `name` in a raw "Cookie:" header value ("a=1; session=xyz").
    // Returns false when absent or empty.
    bool find(const std::string& header, const std::string& name, std::string& value);

    // "session=<token>; Expires=<date>; Path=/; HttpOnly; Secure; SameSite=Strict"
    std::string sessionCookie(const std::string& token, std::time_t expires_at, bool secure);

    // Same attributes with an empty value and Max-Age=0.
    std::string clearedSessionCookie(bool secure);

    // IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
    std::string httpDate(std::time_t t);
}
