#include "ed25519.hpp"

#include <algorithm>
#include <cctype>
#include <sodium.h>
#include <stdexcept>

namespace consent {
namespace crypto {

using utils::DecodeError;

namespace {

// DER prefix of an Ed25519 SubjectPublicKeyInfo (RFC 8410):
// SEQUENCE { SEQUENCE { OID 1.3.101.112 } BIT STRING (0 unused bits) }
const Bytes SPKI_PREFIX = {0x30, 0x2a, 0x30, 0x05, 0x06, 0x03, 0x2b, 0x65,
                           0x70, 0x03, 0x21, 0x00};

constexpr const char* PEM_HEADER = "-----BEGIN PUBLIC KEY-----";
constexpr const char* PEM_FOOTER = "-----END PUBLIC KEY-----";

} // namespace

SigningKeyPair keygen() {
    utils::ensure_sodium_init();

    SigningKeyPair kp;
    kp.public_key.resize(crypto_sign_PUBLICKEYBYTES);
    kp.secret_key.resize(crypto_sign_SECRETKEYBYTES);

    if (crypto_sign_keypair(kp.public_key.data(), kp.secret_key.data()) != 0) {
        throw std::runtime_error("Failed to generate key pair");
    }
    return kp;
}

std::string public_key_to_pem(const Bytes& public_key) {
    if (public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
        throw std::invalid_argument("Invalid public key size: expected " +
            std::to_string(ED25519_PUBLIC_KEY_SIZE) + ", got " +
            std::to_string(public_key.size()));
    }

    Bytes der = SPKI_PREFIX;
    der.insert(der.end(), public_key.begin(), public_key.end());

    // 44 base64 characters, well under the 64-column PEM line limit
    return std::string(PEM_HEADER) + "\n" + utils::base64_encode(der) + "\n" + PEM_FOOTER + "\n";
}

Bytes public_key_from_pem(const std::string& pem) {
    auto begin = pem.find(PEM_HEADER);
    auto end = pem.find(PEM_FOOTER);
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        throw DecodeError("PEM: missing PUBLIC KEY block");
    }

    std::string body = pem.substr(begin + std::char_traits<char>::length(PEM_HEADER),
                                  end - begin - std::char_traits<char>::length(PEM_HEADER));
    body.erase(std::remove_if(body.begin(), body.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               body.end());

    Bytes der = utils::base64_decode(body);
    if (der.size() != SPKI_PREFIX.size() + ED25519_PUBLIC_KEY_SIZE ||
        !std::equal(SPKI_PREFIX.begin(), SPKI_PREFIX.end(), der.begin())) {
        throw DecodeError("PEM: not an Ed25519 public key");
    }
    return Bytes(der.begin() + SPKI_PREFIX.size(), der.end());
}

std::string sign_content_hash(const Bytes& secret_key, const std::string& content_hash) {
    utils::ensure_sodium_init();

    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        throw std::invalid_argument("Invalid secret key size: expected " +
            std::to_string(crypto_sign_SECRETKEYBYTES) + ", got " +
            std::to_string(secret_key.size()));
    }

    Bytes msg = utils::to_bytes(content_hash);
    Bytes sig(crypto_sign_BYTES);
    if (crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), secret_key.data()) != 0) {
        throw std::runtime_error("Signing failed");
    }
    return utils::base64_encode(sig);
}

} // namespace crypto
} // namespace consent
