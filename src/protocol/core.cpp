#include "core.hpp"
#include "../logging.hpp"

namespace consent {

namespace {

CoreConfig validated(CoreConfig config) {
    Status st = config.validate();
    if (!st) {
        throw ConfigError(st.error().message);
    }
    return config;
}

} // namespace

ConsentCore::ConsentCore(store::Store& store, CoreConfig config, Clock clock)
    : config_(validated(std::move(config))),
      ledger_(store, clock),
      issuer_(store, config_, clock),
      validator_(store, config_, clock),
      audit_(store, config_, clock) {
    log::set_level(config_.log_level);
    utils::ensure_sodium_init();
}

Result<protocol::Contract> ConsentCore::create_contract(const std::string& proposer,
                                                        const std::string& counterparty,
                                                        const protocol::ContractTerms& terms) {
    return ledger_.create(proposer, counterparty, terms);
}

Result<protocol::Contract> ConsentCore::sign_contract(const std::string& contract_id,
                                                      const std::string& signer,
                                                      const std::string& signature_b64,
                                                      const std::string& public_key_pem) {
    return ledger_.sign(contract_id, signer, signature_b64, public_key_pem);
}

Result<protocol::Contract> ConsentCore::get_contract(const std::string& contract_id) {
    return ledger_.get(contract_id);
}

Result<protocol::Contract> ConsentCore::revoke_contract(const std::string& contract_id,
                                                        const std::string& agent_id,
                                                        const std::string& reason) {
    return ledger_.revoke(contract_id, agent_id, reason);
}

Result<std::vector<std::string>> ConsentCore::expire_contracts() {
    return ledger_.expire_due();
}

Result<protocol::IssuedPin> ConsentCore::create_pin(const std::string& agent_id,
                                                    const std::string& contract_id,
                                                    const protocol::Scope& scope,
                                                    bool single_use,
                                                    std::optional<int> ttl_seconds) {
    return issuer_.create_pin(agent_id, contract_id, scope, single_use, ttl_seconds);
}

Result<protocol::PinGrant> ConsentCore::validate_pin(const std::string& pin_id,
                                                     const std::string& credential,
                                                     const protocol::Scope& requested_scope) {
    return validator_.validate(pin_id, credential, requested_scope);
}

Result<protocol::Pin> ConsentCore::revoke_pin(const std::string& pin_id,
                                              const std::string& agent_id,
                                              const std::string& reason) {
    return issuer_.revoke_pin(pin_id, agent_id, reason);
}

Result<protocol::AuditLogEntry> ConsentCore::append_audit_log(const std::string& agent_id,
                                                              const protocol::AuditAppendRequest& request) {
    return audit_.append(agent_id, request);
}

Result<protocol::AuditPage> ConsentCore::query_audit_logs(const protocol::AuditQuery& query) {
    return audit_.query(query);
}

Result<protocol::ChainReport> ConsentCore::verify_audit_chain(const std::string& agent_id,
                                                              std::optional<Timestamp> start_time,
                                                              std::optional<Timestamp> end_time) {
    return audit_.verify(agent_id, start_time, end_time);
}

} // namespace consent
