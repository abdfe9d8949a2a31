#include "TokenSigner.hpp"
#include <sodium.h>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "../utils/Encoding.hpp"

using nlohmann::json;

static constexpr size_t MIN_SECRET_BYTES = 32;
static constexpr size_t RAW_TOKEN_BYTES = 32;

TokenSigner::TokenSigner(const std::string& secret)
    : key(secret.begin(), secret.end())
{
    if (key.size() < MIN_SECRET_BYTES) {
        spdlog::error("Signing secret too short ({} bytes)", key.size());
        throw std::invalid_argument("signing secret must be at least 32 bytes");
    }
    spdlog::debug("TokenSigner initialized (not logging the secret)");
}

TokenSigner::~TokenSigner() {
    if (!key.empty())
        sodium_memzero(key.data(), key.size());
}

void TokenSigner::mac(const std::string& data, unsigned char* out) const {
    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, key.data(), key.size());
    crypto_auth_hmacsha256_update(&st,
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<unsigned long long>(data.size()));
    crypto_auth_hmacsha256_final(&st, out);
    sodium_memzero(&st, sizeof(st));
}

std::string TokenSigner::generateOpaqueToken() const {
    unsigned char raw[RAW_TOKEN_BYTES];
    randombytes_buf(raw, sizeof(raw));
    std::string raw_hex = Encoding::toHex(raw, sizeof(raw));
    sodium_memzero(raw, sizeof(raw));

    unsigned char digest[crypto_auth_hmacsha256_BYTES];
    mac(raw_hex, digest);
    return Encoding::toHex(digest, sizeof(digest));
}

Outcome<std::string> TokenSigner::sign(const SessionPayload& payload) const {
    std::string body;
    try {
        json j = {
            { "sid", payload.session_id },
            { "uid", payload.user_id },
            { "at", payload.access_token },
            { "rt", payload.refresh_token },
            { "exp", static_cast<long long>(payload.expires_at) }
        };
        body = j.dump();
    }
    catch (const json::exception& e) {
        spdlog::error("Failed to serialize session payload: {}", e.what());
        return Outcome<std::string>::failure(AuthStatus::SigningFailed, "Unable to sign session");
    }

    std::string encoded = Encoding::toBase64Url(body);

    unsigned char digest[crypto_auth_hmacsha256_BYTES];
    mac(encoded, digest);

    return Outcome<std::string>::success(encoded + "." + Encoding::toBase64Url(digest, sizeof(digest)));
}

Outcome<SessionPayload> TokenSigner::decode(const std::string& token) const {
    using Result = Outcome<SessionPayload>;

    size_t dot = token.find('.');
    if (dot == std::string::npos || dot == 0 || token.find('.', dot + 1) != std::string::npos) {
        spdlog::debug("Token rejected: bad structure");
        return Result::failure(AuthStatus::InvalidSignature, "Malformed session token");
    }

    std::string encoded = token.substr(0, dot);
    std::vector<unsigned char> given;
    if (!Encoding::fromBase64Url(token.substr(dot + 1), given) ||
        given.size() != crypto_auth_hmacsha256_BYTES)
    {
        spdlog::debug("Token rejected: bad signature encoding");
        return Result::failure(AuthStatus::InvalidSignature, "Malformed session token");
    }

    unsigned char expected[crypto_auth_hmacsha256_BYTES];
    mac(encoded, expected);
    if (sodium_memcmp(expected, given.data(), sizeof(expected)) != 0) {
        spdlog::warn("Token rejected: signature mismatch");
        return Result::failure(AuthStatus::InvalidSignature, "Invalid session signature");
    }

    std::vector<unsigned char> body;
    if (!Encoding::fromBase64Url(encoded, body)) {
        spdlog::warn("Token rejected: signed payload is not base64url");
        return Result::failure(AuthStatus::InvalidSignature, "Malformed session token");
    }

    SessionPayload p;
    try {
        json j = json::parse(body.begin(), body.end());
        if (!j.is_object() || !j["sid"].is_string() || !j["uid"].is_string() ||
            !j["at"].is_string() || !j["rt"].is_string() || !j["exp"].is_number_integer())
        {
            spdlog::warn("Token rejected: signed payload has the wrong shape");
            return Result::failure(AuthStatus::InvalidSignature, "Malformed session token");
        }

        p.session_id = j["sid"].get<std::string>();
        p.user_id = j["uid"].get<std::string>();
        p.access_token = j["at"].get<std::string>();
        p.refresh_token = j["rt"].get<std::string>();
        p.expires_at = static_cast<std::time_t>(j["exp"].get<long long>());
    }
    catch (const json::exception& e) {
        spdlog::warn("Token rejected: payload parse error: {}", e.what());
        return Result::failure(AuthStatus::InvalidSignature, "Malformed session token");
    }

    return Result::success(p);
}

Outcome<SessionPayload> TokenSigner::verify(const std::string& token, std::time_t now) const {
    Outcome<SessionPayload> r = decode(token);
    if (!r.ok())
        return r;

    if (now >= r.value.expires_at) {
        spdlog::debug("Token for session '{}' expired at {}", r.value.session_id, r.value.expires_at);
        return Outcome<SessionPayload>::failure(AuthStatus::Expired, "Session expired", r.value);
    }
    return r;
}
