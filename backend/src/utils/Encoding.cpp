#include "Encoding.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace Encoding
{
    std::string toHex(const unsigned char* data, size_t len) {
        std::string hex(2 * len + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), data, len);
        hex.pop_back();
        return hex;
    }

    std::string toBase64Url(const unsigned char* data, size_t len) {
        const int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
        std::string out(sodium_base64_encoded_len(len, variant), '\0');
        sodium_bin2base64(&out[0], out.size(), data, len, variant);
        out.resize(std::char_traits<char>::length(out.c_str()));
        return out;
    }

    std::string toBase64Url(const std::string& data) {
        return toBase64Url(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    bool fromBase64Url(const std::string& text, std::vector<unsigned char>& out) {
        out.assign(text.size() * 3 / 4 + 1, 0);
        size_t bin_len = 0;
        const char* end = nullptr;

        if (sodium_base642bin(out.data(), out.size(),
            text.c_str(), text.size(),
            nullptr, &bin_len, &end,
            sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
        {
            spdlog::debug("base64url decode failed");
            out.clear();
            return false;
        }

        // sodium stops at the first non-alphabet character instead of failing
        if (end != text.c_str() + text.size()) {
            spdlog::debug("base64url input has trailing garbage");
            out.clear();
            return false;
        }

        out.resize(bin_len);
        return true;
    }

    std::string urlEncode(const std::string& text) {
        static const char digits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(text.size());

        for (unsigned char c : text) {
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                c == '-' || c == '_' || c == '.' || c == '~' || c == '/')
            {
                out.push_back(static_cast<char>(c));
            }
            else {
                out.push_back('%');
                out.push_back(digits[c >> 4]);
                out.push_back(digits[c & 0x0f]);
            }
        }
        return out;
    }
}
