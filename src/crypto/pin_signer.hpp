#ifndef CONSENT_CRYPTO_PIN_SIGNER_HPP
#define CONSENT_CRYPTO_PIN_SIGNER_HPP

#include "../helpers.hpp"

#include <string>

namespace consent {
namespace crypto {

constexpr size_t PIN_TOKEN_BYTES = 32;
constexpr char CREDENTIAL_SEPARATOR = '.';

// -----------------------------------------------------------------------------
// PinSigner - HMAC-SHA256 binding of a PIN id to its secret token
// -----------------------------------------------------------------------------
class PinSigner {
public:
    explicit PinSigner(Bytes signing_key);

    // base64url (padded) HMAC-SHA256 over "<pin_id>:<token>"
    std::string sign(const std::string& pin_id, const std::string& token) const;

    // Recomputes the signature and compares in constant time.
    bool verify(const std::string& pin_id, const std::string& token,
                const std::string& signature) const;

private:
    Bytes key_;
};

// Fresh high-entropy token: 32 random bytes, base64url without padding.
std::string generate_pin_token();

// Bearer credential handed to the PIN holder: "<token>.<signature>"
std::string compose_credential(const std::string& token, const std::string& signature);

// Splits at the last separator. Returns false if there is none.
bool split_credential(const std::string& credential, std::string& token, std::string& signature);

} // namespace crypto
} // namespace consent

#endif // CONSENT_CRYPTO_PIN_SIGNER_HPP
