#ifndef CONSENT_STORE_STORE_HPP
#define CONSENT_STORE_STORE_HPP

#include "../errors.hpp"
#include "../protocol/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace consent {
namespace store {

using protocol::AuditFilter;
using protocol::AuditLogEntry;
using protocol::Contract;
using protocol::Pin;

// Lock keys. Each critical section is scoped to exactly one of these.
inline std::string contract_lock_key(const std::string& contract_id) { return "contract:" + contract_id; }
inline std::string pin_lock_key(const std::string& pin_id) { return "pin:" + pin_id; }
inline std::string audit_lock_key(const std::string& agent_id) { return "audit:" + agent_id; }

// -----------------------------------------------------------------------------
// Transaction - one unit of work against the store
//
// Reads see committed state plus this transaction's own staged writes.
// Destroying a transaction without commit() discards its writes. Every lock
// taken through it is held until destruction, on every exit path.
// -----------------------------------------------------------------------------
class Transaction {
public:
    virtual ~Transaction() = default;

    // Waits for the key. Taking a key this transaction already holds is a no-op.
    virtual Status lock_blocking(const std::string& key) = 0;

    // Fails with LockContention instead of waiting.
    virtual Status try_lock(const std::string& key) = 0;

    virtual std::optional<Contract> get_contract(const std::string& contract_id) = 0;
    virtual void put_contract(const Contract& contract) = 0;

    // Ids of non-terminal contracts whose expires_at lies before now.
    virtual std::vector<std::string> contracts_expiring(Timestamp now) = 0;

    virtual std::optional<Pin> get_pin(const std::string& pin_id) = 0;
    virtual void put_pin(const Pin& pin) = 0;

    // Chain tip for one agent, nullopt when the agent has no entries.
    virtual std::optional<AuditLogEntry> latest_audit_entry(const std::string& agent_id) = 0;
    virtual void append_audit_entry(const AuditLogEntry& entry) = 0;

    // Matching entries in commit order (oldest first).
    virtual std::vector<AuditLogEntry> audit_entries(const AuditFilter& filter) = 0;

    virtual Status commit() = 0;
};

// -----------------------------------------------------------------------------
// Store - transactional persistence for contracts, PINs and audit entries
// -----------------------------------------------------------------------------
class Store {
public:
    virtual ~Store() = default;

    virtual std::unique_ptr<Transaction> begin() = 0;
};

} // namespace store
} // namespace consent

#endif // CONSENT_STORE_STORE_HPP
