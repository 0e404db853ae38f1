#include "verifier.hpp"
#include "ed25519.hpp"

#include <sodium.h>

namespace consent {
namespace crypto {

using nlohmann::json;

std::string canonical_json(const json& value) {
    // nlohmann::json objects are std::map backed, so keys come out sorted.
    return value.dump(-1, ' ', true, json::error_handler_t::replace);
}

std::string canonical_hash(const json& value) {
    return utils::sha256_hex(canonical_json(value));
}

std::string compute_content_hash(const ContractContent& content) {
    json j;
    j["party_a"] = content.party_a;
    j["party_b"] = content.party_b;
    j["data_types"] = json(content.data_types);  // std::set iterates in sorted order
    j["actions"] = json(content.actions);
    j["purpose"] = content.purpose;
    j["retention_days"] = content.retention_days ? json(*content.retention_days) : json(nullptr);
    j["expires_at"] = content.expires_at ? json(utils::format_timestamp(*content.expires_at))
                                         : json(nullptr);
    return canonical_hash(j);
}

bool verify_signature(const std::string& public_key_pem,
                      const std::string& signature_b64,
                      const std::string& content_hash) noexcept {
    try {
        utils::ensure_sodium_init();
        Bytes public_key = public_key_from_pem(public_key_pem);
        Bytes signature = utils::base64_decode(signature_b64);
        if (signature.size() != ED25519_SIGNATURE_SIZE) {
            return false;
        }

        Bytes msg = utils::to_bytes(content_hash);
        return crypto_sign_verify_detached(signature.data(), msg.data(), msg.size(),
                                           public_key.data()) == 0;
    } catch (const std::exception&) {
        return false;
    }
}

std::string public_key_fingerprint(const std::string& public_key_pem) {
    return utils::sha256_hex(public_key_pem);
}

} // namespace crypto
} // namespace consent
