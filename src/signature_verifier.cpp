#include "signature_verifier.hpp"

#include <string>
#include <string_view>

#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/hmac.h>
#include <cryptopp/misc.h>
#include <cryptopp/sha.h>

namespace {

// Hex length of a SHA-256 digest.
constexpr size_t SIGNATURE_LENGTH = CryptoPP::SHA256::DIGESTSIZE * 2;

const CryptoPP::byte* asBytes(std::string_view s)
{
    return reinterpret_cast<const CryptoPP::byte*>(s.data());
}

} // namespace

std::string SignatureVerifier::sign(std::string_view raw_body,
                                    std::string_view secret) const
{
    CryptoPP::HMAC<CryptoPP::SHA256> hmac(asBytes(secret), secret.size());
    std::string result;
    CryptoPP::StringSource src(
        asBytes(raw_body), raw_body.size(), true,
        new CryptoPP::HashFilter(
            hmac, new CryptoPP::HexEncoder(
                new CryptoPP::StringSink(result), false)));
    return result;
}

bool SignatureVerifier::verify(std::string_view raw_body,
                               std::string_view signature,
                               std::string_view secret) const
{
    if(secret.empty())
    {
        return false;
    }
    // The length of a valid signature is public, so bailing out here
    // leaks nothing.
    if(signature.size() != SIGNATURE_LENGTH)
    {
        return false;
    }
    const std::string expected = sign(raw_body, secret);
    return CryptoPP::VerifyBufsEqual(asBytes(expected), asBytes(signature),
                                     SIGNATURE_LENGTH);
}
