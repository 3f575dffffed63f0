#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <optional>
#include <vector>
#include <boost/json.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/evp.h>

namespace erebus {

// Input validation and cryptographic verification helpers shared by the
// grant verifier and the packet parser.
class InputValidator {
public:
    /**
     * Verifies an Ed25519 Edwards-curve signature.
     * Used for authenticating grant tokens (JWS alg EdDSA).
     */
    static bool verify_ed25519(const std::vector<unsigned char>& pubkey,
                               const std::vector<unsigned char>& message,
                               const std::vector<unsigned char>& signature) {
        if (pubkey.size() != 32 || signature.size() != 64) return false;

        EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, pubkey.data(), pubkey.size());
        if (!pkey) return false;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        bool result = false;

        if (ctx && EVP_DigestVerifyInit(ctx, NULL, NULL, NULL, pkey) == 1) {
            if (EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size()) == 1) {
                result = true;
            }
        }

        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return result;
    }

    // Decodes unpadded base64url (RFC 4648 section 5). Returns nullopt on any invalid character.
    static std::optional<std::vector<unsigned char>> base64url_decode(const std::string& input) {
        std::string b64;
        b64.reserve(input.size() + 3);
        for (char c : input) {
            if (c == '-') b64 += '+';
            else if (c == '_') b64 += '/';
            else if (std::isalnum(static_cast<unsigned char>(c))) b64 += c;
            else return std::nullopt;
        }
        if (b64.size() % 4 == 1) return std::nullopt;
        while (b64.size() % 4 != 0) b64 += '=';

        namespace base64 = boost::beast::detail::base64;
        std::vector<unsigned char> out(base64::decoded_size(b64.size()));
        auto result = base64::decode(out.data(), b64.data(), b64.size());
        out.resize(result.first);
        return out;
    }

    static std::string base64url_encode(const std::string& input) {
        namespace base64 = boost::beast::detail::base64;
        std::string out(base64::encoded_size(input.size()), '\0');
        out.resize(base64::encode(out.data(), input.data(), input.size()));
        while (!out.empty() && out.back() == '=') out.pop_back();
        std::replace(out.begin(), out.end(), '+', '-');
        std::replace(out.begin(), out.end(), '/', '_');
        return out;
    }

    // Topics and ids become storage key segments, so ':' is rejected, as are control bytes.
    // Bytes >= 0x80 pass so UTF-8 names survive.
    static bool is_valid_key_segment(const std::string& str, size_t max_length = 256) {
        if (str.empty() || str.size() > max_length) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            auto b = static_cast<unsigned char>(c);
            return b >= 0x20 && b != 0x7f && c != ':';
        });
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with recursion depth limits to prevent stack-exhaustion (DoS).
     */
    static boost::json::value safe_parse_json(const std::string& input, size_t max_depth = 16) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }
};

}
