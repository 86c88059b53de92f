#include "daemon/webhook_signature.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <cstdio>

std::string WebhookSignature::hmac_sha256_hex(const std::string& key, const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(body.data()), body.size(),
              digest, &len)) {
        return "";
    }

    char hex[EVP_MAX_MD_SIZE * 2 + 1];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(hex + i * 2, 3, "%02x", digest[i]);
    }
    return std::string(hex, len * 2);
}

bool WebhookSignature::verify(const std::string& secret, const std::string& body, const std::string& header) {
    static const std::string prefix = "sha256=";
    if (secret.empty() || header.size() <= prefix.size()) return false;
    if (header.compare(0, prefix.size(), prefix) != 0) return false;

    std::string given = header.substr(prefix.size());
    for (auto& c : given) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::string expected = hmac_sha256_hex(secret, body);
    if (expected.empty() || given.size() != expected.size()) return false;
    return CRYPTO_memcmp(given.data(), expected.data(), expected.size()) == 0;
}
