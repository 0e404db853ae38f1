#ifndef CONSENT_PROTOCOL_CONTRACTS_HPP
#define CONSENT_PROTOCOL_CONTRACTS_HPP

#include "types.hpp"
#include "../errors.hpp"
#include "../helpers.hpp"
#include "../store/store.hpp"

#include <string>
#include <vector>

namespace consent {
namespace protocol {

// -----------------------------------------------------------------------------
// ContractLedger - proposal, bilateral signing, revocation and expiry
//
// Every status change goes through can_transition(). Mutations of one
// contract are serialized on its contract lock.
// -----------------------------------------------------------------------------
class ContractLedger {
public:
    ContractLedger(store::Store& store, Clock clock);

    /**
     * Propose a contract. The proposer becomes party_a.
     *
     * @return PROPOSED contract with its content hash, or InvalidArgument when
     *         the parties are empty or equal, the purpose is empty, or
     *         retention_days is not positive.
     */
    Result<Contract> create(const std::string& proposer,
                            const std::string& counterparty,
                            const ContractTerms& terms);

    /**
     * Record one party's signature over the content hash.
     *
     * Checks, in order: NotFound, InvalidState (not PROPOSED), Forbidden,
     * Conflict (party already signed), InvalidSignature. The second valid
     * signature moves the contract to ACTIVE and stamps signed_at.
     */
    Result<Contract> sign(const std::string& contract_id,
                          const std::string& signer,
                          const std::string& signature_b64,
                          const std::string& public_key_pem);

    Result<Contract> get(const std::string& contract_id);

    // NotFound, InvalidState (not ACTIVE), Forbidden. Immediate, no grace period.
    Result<Contract> revoke(const std::string& contract_id,
                            const std::string& agent_id,
                            const std::string& reason);

    // Moves every PROPOSED/ACTIVE contract past its expires_at to EXPIRED.
    // Returns the ids that were moved.
    Result<std::vector<std::string>> expire_due();

private:
    store::Store& store_;
    Clock         clock_;
};

} // namespace protocol
} // namespace consent

#endif // CONSENT_PROTOCOL_CONTRACTS_HPP
