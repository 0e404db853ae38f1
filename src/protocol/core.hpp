#ifndef CONSENT_PROTOCOL_CORE_HPP
#define CONSENT_PROTOCOL_CORE_HPP

#include "audit.hpp"
#include "contracts.hpp"
#include "pins.hpp"
#include "types.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../store/store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace consent {

// -----------------------------------------------------------------------------
// ConsentCore - the operations a hosting transport drives
//
// The transport resolves callers to agent ids before calling in. Every
// operation returns a typed result; none throws.
// -----------------------------------------------------------------------------
class ConsentCore {
public:
    // Throws ConfigError if config.validate() fails. Applies config.log_level.
    ConsentCore(store::Store& store, CoreConfig config, Clock clock = system_clock());

    ConsentCore(const ConsentCore&) = delete;
    ConsentCore& operator=(const ConsentCore&) = delete;

    const CoreConfig& config() const { return config_; }

    // Contracts
    Result<protocol::Contract> create_contract(const std::string& proposer,
                                               const std::string& counterparty,
                                               const protocol::ContractTerms& terms);
    Result<protocol::Contract> sign_contract(const std::string& contract_id,
                                             const std::string& signer,
                                             const std::string& signature_b64,
                                             const std::string& public_key_pem);
    Result<protocol::Contract> get_contract(const std::string& contract_id);
    Result<protocol::Contract> revoke_contract(const std::string& contract_id,
                                               const std::string& agent_id,
                                               const std::string& reason);
    Result<std::vector<std::string>> expire_contracts();

    // PINs
    Result<protocol::IssuedPin> create_pin(const std::string& agent_id,
                                           const std::string& contract_id,
                                           const protocol::Scope& scope,
                                           bool single_use,
                                           std::optional<int> ttl_seconds = std::nullopt);
    Result<protocol::PinGrant> validate_pin(const std::string& pin_id,
                                            const std::string& credential,
                                            const protocol::Scope& requested_scope);
    Result<protocol::Pin> revoke_pin(const std::string& pin_id,
                                     const std::string& agent_id,
                                     const std::string& reason);

    // Audit
    Result<protocol::AuditLogEntry> append_audit_log(const std::string& agent_id,
                                                     const protocol::AuditAppendRequest& request);
    Result<protocol::AuditPage> query_audit_logs(const protocol::AuditQuery& query);
    Result<protocol::ChainReport> verify_audit_chain(const std::string& agent_id,
                                                     std::optional<Timestamp> start_time = std::nullopt,
                                                     std::optional<Timestamp> end_time = std::nullopt);

private:
    CoreConfig config_;

    protocol::ContractLedger ledger_;
    protocol::PinIssuer      issuer_;
    protocol::PinValidator   validator_;
    protocol::AuditChain     audit_;
};

} // namespace consent

#endif // CONSENT_PROTOCOL_CORE_HPP
