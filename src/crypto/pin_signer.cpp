#include "pin_signer.hpp"

#include <sodium.h>
#include <stdexcept>

namespace consent {
namespace crypto {

PinSigner::PinSigner(Bytes signing_key) : key_(std::move(signing_key)) {
    if (key_.empty()) {
        throw std::invalid_argument("PIN signing key cannot be empty");
    }
    utils::ensure_sodium_init();
}

std::string PinSigner::sign(const std::string& pin_id, const std::string& token) const {
    Bytes msg = utils::to_bytes(pin_id + ":" + token);

    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key_.data(), key_.size());
    crypto_auth_hmacsha256_update(&state, msg.data(), msg.size());

    Bytes mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof state);

    return utils::base64url_encode(mac, true);
}

bool PinSigner::verify(const std::string& pin_id, const std::string& token,
                       const std::string& signature) const {
    std::string expected = sign(pin_id, token);
    if (expected.size() != signature.size()) {
        return false;
    }
    return sodium_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

std::string generate_pin_token() {
    return utils::base64url_encode(utils::random_bytes(PIN_TOKEN_BYTES), false);
}

std::string compose_credential(const std::string& token, const std::string& signature) {
    return token + CREDENTIAL_SEPARATOR + signature;
}

bool split_credential(const std::string& credential, std::string& token, std::string& signature) {
    auto pos = credential.rfind(CREDENTIAL_SEPARATOR);
    if (pos == std::string::npos) {
        return false;
    }
    token = credential.substr(0, pos);
    signature = credential.substr(pos + 1);
    return true;
}

} // namespace crypto
} // namespace consent
