#ifndef CONSENT_STORE_MEMORY_STORE_HPP
#define CONSENT_STORE_MEMORY_STORE_HPP

#include "locks.hpp"
#include "store.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace consent {
namespace store {

// -----------------------------------------------------------------------------
// MemoryStore - single-process Store
//
// Row data lives behind one data mutex; staged writes are applied atomically
// at commit. Critical sections use the per-key lock table, so unrelated keys
// never wait on each other.
// -----------------------------------------------------------------------------
class MemoryStore : public Store {
public:
    MemoryStore() = default;
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::unique_ptr<Transaction> begin() override;

    std::size_t contract_count() const;
    std::size_t pin_count() const;
    std::size_t audit_entry_count() const;

    // Rewrites a persisted audit row in place, bypassing append-only rules.
    // Exists to rehearse corruption and tampering; returns false if no such row.
    bool overwrite_audit_entry(const std::string& log_id,
                               const std::function<void(AuditLogEntry&)>& mutate);

    KeyedLocks& locks() { return locks_; }

private:
    friend class MemoryTransaction;

    KeyedLocks locks_;

    mutable std::mutex data_mutex_;
    std::map<std::string, Contract> contracts_;
    std::map<std::string, Pin> pins_;

    // All entries in commit order, plus per-agent positions into it.
    std::vector<AuditLogEntry> audit_log_;
    std::unordered_map<std::string, std::vector<std::size_t>> audit_by_agent_;
};

} // namespace store
} // namespace consent

#endif // CONSENT_STORE_MEMORY_STORE_HPP
