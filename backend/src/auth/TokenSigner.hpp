#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Outcome.hpp"
#include "Session.hpp"

// Signs session payloads with HMAC-SHA256 under the process secret.
//
// Token format:  base64url(json payload) "." base64url(hmac over the first part)
// Payload keys:  sid, uid, at, rt, exp
//
// The expiry travels inside the token, so verify() enforces it without a
// storage round-trip. A new secret invalidates every token signed before.
class TokenSigner {
public:
    // Throws std::invalid_argument when the secret is shorter than 32 bytes.
    explicit TokenSigner(const std::string& secret);
    ~TokenSigner();

    TokenSigner(const TokenSigner&) = delete;
    TokenSigner& operator=(const TokenSigner&) = delete;

    // 32 CSPRNG bytes, hex encoded, then HMAC'd under the secret (64 hex chars).
    // A leaked raw value is useless without the key.
    std::string generateOpaqueToken() const;

    // SigningFailed if the payload cannot be serialized.
    Outcome<std::string> sign(const SessionPayload& payload) const;

    // Ok, InvalidSignature, or Expired (now >= exp). Expired still carries the
    // decoded payload so the caller can attempt a refresh.
    Outcome<SessionPayload> verify(const std::string& token, std::time_t now) const;

    // Signature and shape only, expiry ignored. Ok or InvalidSignature.
    Outcome<SessionPayload> decode(const std::string& token) const;

private:
    std::vector<unsigned char> key;

    void mac(const std::string& data, unsigned char* out) const;
};
