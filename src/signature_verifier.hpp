#pragma once

#include <string>
#include <string_view>

// Authenticates webhook bodies with a shared secret. The signature is
// the lowercase hex HMAC-SHA256 of the exact bytes received on the
// wire.
class SignatureVerifier
{
public:
    std::string sign(std::string_view raw_body, std::string_view secret) const;

    // True iff `signature` equals sign(raw_body, secret). The comparison
    // takes the same time no matter where the two strings differ. Never
    // throws; an empty secret or a malformed signature just fails.
    bool verify(std::string_view raw_body, std::string_view signature,
                std::string_view secret) const;
};
