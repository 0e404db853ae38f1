#ifndef CONSENT_PROTOCOL_AUDIT_HPP
#define CONSENT_PROTOCOL_AUDIT_HPP

#include "types.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../store/store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace consent {
namespace protocol {

// SHA-256 over the canonical JSON of every field except entry_hash.
std::string compute_entry_hash(const AuditLogEntry& entry);

/**
 * Check linkage and hashes of a run of one agent's entries (oldest first).
 *
 * @param anchor expected prev_hash of entries[0]; nullopt accepts whatever
 *               the first entry carries (used for ranges that start mid-chain)
 */
ChainReport verify_entries(const std::string& agent_id,
                           const std::vector<AuditLogEntry>& entries,
                           const std::optional<std::string>& anchor);

// -----------------------------------------------------------------------------
// AuditChain - per-agent, hash-linked, append-only log
// -----------------------------------------------------------------------------
class AuditChain {
public:
    AuditChain(store::Store& store, const CoreConfig& config, Clock clock);

    // Serialized per agent; appends for different agents never wait on each other.
    Result<AuditLogEntry> append(const std::string& agent_id, const AuditAppendRequest& request);

    // Newest first. limit must be 1..audit_query_max_limit, offset >= 0.
    Result<AuditPage> query(const AuditQuery& query);

    /**
     * Re-derive one agent's chain from storage.
     *
     * An invalid chain is still an ok() result; the report names the first
     * failing entry. Callers turn it into ChainBroken with to_status().
     */
    Result<ChainReport> verify(const std::string& agent_id,
                               std::optional<Timestamp> start_time = std::nullopt,
                               std::optional<Timestamp> end_time = std::nullopt);

private:
    store::Store&     store_;
    const CoreConfig& config_;
    Clock             clock_;
};

} // namespace protocol
} // namespace consent

#endif // CONSENT_PROTOCOL_AUDIT_HPP
