#pragma once

#include <string>

class WebhookSignature {
public:
    /// Lowercase hex HMAC-SHA256 of body under key
    static std::string hmac_sha256_hex(const std::string& key, const std::string& body);

    /// Checks an "X-Hub-Signature-256: sha256=<hex>" header in constant time
    static bool verify(const std::string& secret, const std::string& body, const std::string& header);
};
