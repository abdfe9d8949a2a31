#include "Cookie.hpp"
#include <cstdio>

namespace
{
    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
        return s.substr(b, e - b);
    }

    std::string attributes(bool secure) {
        std::string a = "; Path=/; HttpOnly";
        if (secure) a += "; Secure";
        a += "; SameSite=Strict";
        return a;
    }
}

namespace Cookie
{
    bool find(const std::string& header, const std::string& name, std::string& value) {
        size_t pos = 0;
        while (pos <= header.size()) {
            size_t end = header.find(';', pos);
            if (end == std::string::npos) end = header.size();

            std::string pair = header.substr(pos, end - pos);
            size_t eq = pair.find('=');
            if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
                std::string v = trim(pair.substr(eq + 1));
                if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
                    v = v.substr(1, v.size() - 2);
                if (v.empty())
                    return false;
                value = v;
                return true;
            }
            pos = end + 1;
        }
        return false;
    }

    std::string sessionCookie(const std::string& token, std::time_t expires_at, bool secure) {
        std::string c = std::string(kSessionCookie) + "=" + token;
        c += "; Expires=" + httpDate(expires_at);
        return c + attributes(secure);
    }

    std::string clearedSessionCookie(bool secure) {
        std::string c = std::string(kSessionCookie) + "=";
        c += "; Max-Age=0";
        return c + attributes(secure);
    }

    std::string httpDate(std::time_t t) {
        static const char* days[] = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
        static const char* months[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
            days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
            tm.tm_hour, tm.tm_min, tm.tm_sec);
        return std::string(buf);
    }
}
