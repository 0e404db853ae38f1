#ifndef CONSENT_CRYPTO_VERIFIER_HPP
#define CONSENT_CRYPTO_VERIFIER_HPP

#include "../helpers.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>

namespace consent {
namespace crypto {

constexpr size_t CONTENT_HASH_HEX_SIZE = 64;

// -----------------------------------------------------------------------------
// ContractContent - the immutable terms covered by a contract's content hash
// -----------------------------------------------------------------------------
struct ContractContent {
    std::string           party_a;
    std::string           party_b;
    std::set<std::string> data_types;
    std::set<std::string> actions;
    std::string           purpose;
    std::optional<int>    retention_days;  // nullopt = unbounded
    std::optional<Timestamp> expires_at;   // nullopt = never
};

/**
 * Serialize a JSON value canonically: object keys sorted, no whitespace,
 * non-ASCII escaped as \uXXXX. Equal values always produce equal text.
 */
std::string canonical_json(const nlohmann::json& value);

// SHA-256 hex digest of canonical_json(value).
std::string canonical_hash(const nlohmann::json& value);

/**
 * Deterministic digest of a contract's terms (64 lowercase hex chars).
 * Set ordering never affects the result.
 */
std::string compute_content_hash(const ContractContent& content);

/**
 * Verify a party's Ed25519 signature over the content-hash string.
 *
 * @param public_key_pem PEM-encoded Ed25519 public key
 * @param signature_b64  Base64-encoded 64-byte signature
 * @param content_hash   Hex content hash; its UTF-8 bytes are the signed message
 * @return true only if the signature verifies. Malformed keys, non-Ed25519
 *         keys, bad encodings, wrong lengths and mismatches all yield false.
 */
bool verify_signature(const std::string& public_key_pem,
                      const std::string& signature_b64,
                      const std::string& content_hash) noexcept;

// SHA-256 hex of the PEM text, for identifying a key in logs.
std::string public_key_fingerprint(const std::string& public_key_pem);

} // namespace crypto
} // namespace consent

#endif // CONSENT_CRYPTO_VERIFIER_HPP
