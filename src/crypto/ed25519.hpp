#ifndef CONSENT_CRYPTO_ED25519_HPP
#define CONSENT_CRYPTO_ED25519_HPP

#include "../helpers.hpp"

#include <string>

namespace consent {
namespace crypto {

// Key sizes for Ed25519
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // libsodium layout: seed || public key
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

// -----------------------------------------------------------------------------
// SigningKeyPair - a party's Ed25519 contract-signing key
// -----------------------------------------------------------------------------
struct SigningKeyPair {
    Bytes public_key;  // 32 bytes
    Bytes secret_key;  // 64 bytes
};

// Generate a new Ed25519 key pair
SigningKeyPair keygen();

// Encode a raw public key as a PEM "PUBLIC KEY" block (SubjectPublicKeyInfo).
std::string public_key_to_pem(const Bytes& public_key);

// Decode a PEM "PUBLIC KEY" block. Throws utils::DecodeError unless it holds
// exactly one Ed25519 SubjectPublicKeyInfo.
Bytes public_key_from_pem(const std::string& pem);

// Sign the UTF-8 bytes of a content-hash string; returns base64 (standard alphabet).
std::string sign_content_hash(const Bytes& secret_key, const std::string& content_hash);

} // namespace crypto
} // namespace consent

#endif // CONSENT_CRYPTO_ED25519_HPP
