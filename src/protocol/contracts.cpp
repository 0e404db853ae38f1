#include "contracts.hpp"
#include "../crypto/verifier.hpp"
#include "../logging.hpp"

namespace consent {
namespace protocol {

namespace {

constexpr const char* LOG_CATEGORY = "contracts";

Status transition(Contract& contract, ContractStatus to) {
    if (!can_transition(contract.status, to)) {
        return make_error(ErrorKind::InvalidState,
                          std::string("contract cannot move from ") + to_string(contract.status) +
                          " to " + to_string(to));
    }
    contract.status = to;
    return Status::Ok();
}

Error not_found(const std::string& contract_id) {
    return make_error(ErrorKind::NotFound, "contract not found: " + contract_id);
}

} // namespace

ContractLedger::ContractLedger(store::Store& store, Clock clock)
    : store_(store), clock_(std::move(clock)) {}

Result<Contract> ContractLedger::create(const std::string& proposer,
                                        const std::string& counterparty,
                                        const ContractTerms& terms) {
    if (proposer.empty() || counterparty.empty()) {
        return make_error(ErrorKind::InvalidArgument, "both parties must be named");
    }
    if (proposer == counterparty) {
        return make_error(ErrorKind::InvalidArgument, "a contract needs two distinct parties");
    }
    if (terms.purpose.empty()) {
        return make_error(ErrorKind::InvalidArgument, "purpose is required");
    }
    if (terms.retention_days && *terms.retention_days <= 0) {
        return make_error(ErrorKind::InvalidArgument, "retention_days must be positive");
    }

    crypto::ContractContent content;
    content.party_a = proposer;
    content.party_b = counterparty;
    content.data_types = terms.data_types;
    content.actions = terms.allowed_actions;
    content.purpose = terms.purpose;
    content.retention_days = terms.retention_days;
    content.expires_at = terms.expires_at;

    Timestamp now = clock_();

    Contract contract;
    contract.id = utils::generate_uuid();
    contract.party_a = proposer;
    contract.party_b = counterparty;
    contract.data_types = terms.data_types;
    contract.allowed_actions = terms.allowed_actions;
    contract.purpose = terms.purpose;
    contract.retention_days = terms.retention_days;
    contract.geographic_scope = terms.geographic_scope;
    contract.status = ContractStatus::Proposed;
    contract.content_hash = crypto::compute_content_hash(content);
    contract.created_at = now;
    contract.updated_at = now;
    contract.expires_at = terms.expires_at;

    auto tx = store_.begin();
    tx->put_contract(contract);
    Status st = tx->commit();
    if (!st) return st.error();

    log::info(LOG_CATEGORY, "contract " + contract.id + " proposed by " + proposer +
              " to " + counterparty);
    return contract;
}

Result<Contract> ContractLedger::sign(const std::string& contract_id,
                                      const std::string& signer,
                                      const std::string& signature_b64,
                                      const std::string& public_key_pem) {
    auto tx = store_.begin();
    Status st = tx->lock_blocking(store::contract_lock_key(contract_id));
    if (!st) return st.error();

    auto found = tx->get_contract(contract_id);
    if (!found) return not_found(contract_id);
    Contract contract = std::move(*found);

    if (contract.status != ContractStatus::Proposed) {
        return make_error(ErrorKind::InvalidState,
                          std::string("contract is not in proposed status (current: ") +
                          to_string(contract.status) + ")");
    }

    bool is_a = signer == contract.party_a;
    bool is_b = signer == contract.party_b;
    if (!is_a && !is_b) {
        log::warn(LOG_CATEGORY, "signature attempt by non-party " + signer +
                  " on contract " + contract_id);
        return make_error(ErrorKind::Forbidden,
                          "agent " + signer + " is not a party to this contract");
    }

    std::optional<std::string>& slot = is_a ? contract.party_a_signature
                                            : contract.party_b_signature;
    if (slot) {
        return make_error(ErrorKind::Conflict,
                          std::string(is_a ? "party A" : "party B") +
                          " has already signed this contract");
    }

    if (!crypto::verify_signature(public_key_pem, signature_b64, contract.content_hash)) {
        log::debug(LOG_CATEGORY, "rejected signature from " + signer + " (key " +
                   crypto::public_key_fingerprint(public_key_pem).substr(0, 16) + ")");
        return make_error(ErrorKind::InvalidSignature, "signature verification failed");
    }

    Timestamp now = clock_();
    slot = signature_b64;
    contract.updated_at = now;

    bool activated = false;
    if (contract.fully_signed()) {
        st = transition(contract, ContractStatus::Active);
        if (!st) return st.error();
        contract.signed_at = now;
        activated = true;
    }

    tx->put_contract(contract);
    st = tx->commit();
    if (!st) return st.error();

    log::info(LOG_CATEGORY, "contract " + contract_id + " signed by " + signer);
    if (activated) {
        log::info(LOG_CATEGORY, "contract " + contract_id + " is now active");
    }
    return contract;
}

Result<Contract> ContractLedger::get(const std::string& contract_id) {
    auto tx = store_.begin();
    auto found = tx->get_contract(contract_id);
    if (!found) return not_found(contract_id);
    return std::move(*found);
}

Result<Contract> ContractLedger::revoke(const std::string& contract_id,
                                        const std::string& agent_id,
                                        const std::string& reason) {
    auto tx = store_.begin();
    Status st = tx->lock_blocking(store::contract_lock_key(contract_id));
    if (!st) return st.error();

    auto found = tx->get_contract(contract_id);
    if (!found) return not_found(contract_id);
    Contract contract = std::move(*found);

    if (contract.status != ContractStatus::Active) {
        return make_error(ErrorKind::InvalidState,
                          std::string("only active contracts can be revoked (current: ") +
                          to_string(contract.status) + ")");
    }
    if (!contract.is_party(agent_id)) {
        return make_error(ErrorKind::Forbidden,
                          "agent " + agent_id + " is not a party to this contract");
    }

    st = transition(contract, ContractStatus::Revoked);
    if (!st) return st.error();

    Timestamp now = clock_();
    contract.revoked_at = now;
    contract.revoked_by = agent_id;
    contract.revocation_reason = reason;
    contract.updated_at = now;

    tx->put_contract(contract);
    st = tx->commit();
    if (!st) return st.error();

    log::info(LOG_CATEGORY, "contract " + contract_id + " revoked by " + agent_id);
    return contract;
}

Result<std::vector<std::string>> ContractLedger::expire_due() {
    Timestamp now = clock_();

    std::vector<std::string> candidates;
    {
        auto scan = store_.begin();
        candidates = scan->contracts_expiring(now);
    }

    std::vector<std::string> expired;
    for (const auto& id : candidates) {
        auto tx = store_.begin();
        Status st = tx->lock_blocking(store::contract_lock_key(id));
        if (!st) return st.error();

        // Re-read under the lock; a concurrent revoke may have won.
        auto found = tx->get_contract(id);
        if (!found || is_terminal(found->status) || !found->expired_at(now)) {
            continue;
        }

        Contract contract = std::move(*found);
        st = transition(contract, ContractStatus::Expired);
        if (!st) return st.error();
        contract.updated_at = now;

        tx->put_contract(contract);
        st = tx->commit();
        if (!st) return st.error();
        expired.push_back(id);
    }

    if (!expired.empty()) {
        log::info(LOG_CATEGORY, "expired " + std::to_string(expired.size()) + " contract(s)");
    }
    return expired;
}

} // namespace protocol
} // namespace consent
