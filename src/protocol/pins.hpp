#ifndef CONSENT_PROTOCOL_PINS_HPP
#define CONSENT_PROTOCOL_PINS_HPP

#include "types.hpp"
#include "../config.hpp"
#include "../crypto/pin_signer.hpp"
#include "../errors.hpp"
#include "../store/store.hpp"

#include <optional>
#include <string>

namespace consent {
namespace protocol {

// -----------------------------------------------------------------------------
// PinIssuer - scoped, time-boxed bearer credentials under an active contract
// -----------------------------------------------------------------------------
class PinIssuer {
public:
    PinIssuer(store::Store& store, const CoreConfig& config, Clock clock);

    /**
     * Issue a PIN to a contract party.
     *
     * Checks, in order: InvalidArgument (ttl not positive), NotFound,
     * InvalidState (contract not ACTIVE or past expiry), Forbidden,
     * ScopeExceeded. Only the signature is stored; the returned credential
     * cannot be recovered later.
     *
     * @param ttl_seconds lifetime override, configured default when absent
     */
    Result<IssuedPin> create_pin(const std::string& agent_id,
                                 const std::string& contract_id,
                                 const Scope& scope,
                                 bool single_use,
                                 std::optional<int> ttl_seconds = std::nullopt);

    // NotFound, Forbidden (neither holder nor contract party), InvalidState (already revoked).
    Result<Pin> revoke_pin(const std::string& pin_id,
                           const std::string& agent_id,
                           const std::string& reason);

private:
    store::Store&     store_;
    const CoreConfig& config_;
    Clock             clock_;
    crypto::PinSigner signer_;
};

// -----------------------------------------------------------------------------
// PinValidator - atomic check-and-consume of a presented credential
// -----------------------------------------------------------------------------
class PinValidator {
public:
    PinValidator(store::Store& store, const CoreConfig& config, Clock clock);

    /**
     * Validate a credential against a requested scope.
     *
     * Runs under a non-blocking lock on the PIN; a busy PIN fails with
     * LockContention and is never queued. Then: NotFound (absent or revoked),
     * Expired, AlreadyUsed, InvalidSignature, ScopeExceeded, InvalidState
     * (contract no longer active). A single-use PIN is consumed in the same
     * transaction, so at most one concurrent validation can succeed.
     */
    Result<PinGrant> validate(const std::string& pin_id,
                              const std::string& credential,
                              const Scope& requested_scope);

private:
    store::Store&     store_;
    crypto::PinSigner signer_;
    Clock             clock_;
};

} // namespace protocol
} // namespace consent

#endif // CONSENT_PROTOCOL_PINS_HPP
