#pragma once
#include <string>
#include <vector>

// Thin wrappers over libsodium's codecs plus URL percent-encoding.
namespace Encoding
{
    std::string toHex(const unsigned char* data, size_t len);

    // Base64url without padding (sodium_base64_VARIANT_URLSAFE_NO_PADDING).
    std::string toBase64Url(const unsigned char* data, size_t len);
    std::string toBase64Url(const std::string& data);

    // Strict decode: rejects characters outside the alphabet and non-zero
    // trailing bits. Returns false on any malformed input.
    bool fromBase64Url(const std::string& text, std::vector<unsigned char>& out);

    // Percent-encodes everything except RFC 3986 unreserved characters and '/'.
    std::string urlEncode(const std::string& text);
}
