#include "audit.hpp"
#include "../crypto/verifier.hpp"
#include "../logging.hpp"

#include <algorithm>

namespace consent {
namespace protocol {

using nlohmann::json;

namespace {

constexpr const char* LOG_CATEGORY = "audit";

json optional_field(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::string compute_entry_hash(const AuditLogEntry& e) {
    json j;
    j["log_id"] = e.log_id;
    j["timestamp"] = utils::format_timestamp(e.timestamp);
    j["contract_id"] = optional_field(e.contract_id);
    j["pin_id"] = optional_field(e.pin_id);
    j["agent_id"] = e.agent_id;
    j["action"] = to_string(e.action);
    j["status"] = to_string(e.status);
    j["target_system"] = e.target_system;
    j["scope"] = e.scope;
    j["metadata"] = e.metadata;
    j["source"] = e.source;
    j["request_id"] = e.request_id;
    j["prev_hash"] = e.prev_hash;
    return crypto::canonical_hash(j);
}

ChainReport verify_entries(const std::string& agent_id,
                           const std::vector<AuditLogEntry>& entries,
                           const std::optional<std::string>& anchor) {
    ChainReport report;
    report.agent_id = agent_id;
    if (entries.empty()) {
        return report;
    }

    std::string expected_prev = anchor ? *anchor : entries.front().prev_hash;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        report.entries_checked = i + 1;

        if (entry.prev_hash != expected_prev) {
            report.valid = false;
            report.failure = ChainFailure{entry.log_id, i, ChainCheck::PrevHashMismatch,
                                          "entry " + entry.log_id + ": prev_hash mismatch"};
            return report;
        }
        if (compute_entry_hash(entry) != entry.entry_hash) {
            report.valid = false;
            report.failure = ChainFailure{entry.log_id, i, ChainCheck::EntryHashMismatch,
                                          "entry " + entry.log_id + ": hash mismatch"};
            return report;
        }
        expected_prev = entry.entry_hash;
    }
    return report;
}

AuditChain::AuditChain(store::Store& store, const CoreConfig& config, Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {}

Result<AuditLogEntry> AuditChain::append(const std::string& agent_id,
                                         const AuditAppendRequest& request) {
    if (agent_id.empty()) {
        return make_error(ErrorKind::InvalidArgument, "agent_id is required");
    }
    if (!request.metadata.is_null() && !request.metadata.is_object()) {
        return make_error(ErrorKind::InvalidArgument, "metadata must be a JSON object");
    }

    auto tx = store_.begin();
    Status st = tx->lock_blocking(store::audit_lock_key(agent_id));
    if (!st) return st.error();

    auto tip = tx->latest_audit_entry(agent_id);

    AuditLogEntry entry;
    entry.log_id = utils::generate_uuid();
    entry.timestamp = clock_();
    if (tip && entry.timestamp < tip->timestamp) {
        // Keep timestamp order identical to chain order.
        entry.timestamp = tip->timestamp;
    }
    entry.contract_id = request.contract_id;
    entry.pin_id = request.pin_id;
    entry.agent_id = agent_id;
    entry.action = request.action;
    entry.status = request.status;
    entry.target_system = request.target_system;
    entry.scope = json{{"data_types", request.data_types}};
    entry.metadata = request.metadata.is_null() ? json::object() : request.metadata;
    entry.source = agent_id;
    entry.request_id = request.request_id;
    entry.prev_hash = tip ? tip->entry_hash : GENESIS_HASH;
    entry.entry_hash = compute_entry_hash(entry);

    tx->append_audit_entry(entry);
    st = tx->commit();
    if (!st) return st.error();

    log::debug(LOG_CATEGORY, "appended " + entry.log_id + " to chain of " + agent_id);
    return entry;
}

Result<AuditPage> AuditChain::query(const AuditQuery& query) {
    int limit = query.limit.value_or(config_.audit_query_default_limit);
    if (limit < 1 || limit > config_.audit_query_max_limit) {
        return make_error(ErrorKind::InvalidArgument,
                          "limit must be between 1 and " +
                          std::to_string(config_.audit_query_max_limit));
    }
    if (query.offset < 0) {
        return make_error(ErrorKind::InvalidArgument, "offset must be non-negative");
    }

    auto tx = store_.begin();
    std::vector<AuditLogEntry> matches = tx->audit_entries(query.filter);

    AuditPage page;
    page.total = matches.size();
    page.limit = limit;
    page.offset = query.offset;

    // Newest first by timestamp. Chains of different agents interleave in
    // commit order, which need not match their timestamps; ties keep the
    // later commit first.
    std::reverse(matches.begin(), matches.end());
    std::stable_sort(matches.begin(), matches.end(),
                     [](const AuditLogEntry& a, const AuditLogEntry& b) {
                         return a.timestamp > b.timestamp;
                     });

    auto skip = static_cast<std::size_t>(query.offset);
    if (skip < matches.size()) {
        std::size_t take = std::min(matches.size() - skip, static_cast<std::size_t>(limit));
        auto first = matches.begin() + static_cast<std::ptrdiff_t>(skip);
        page.entries.assign(first, first + static_cast<std::ptrdiff_t>(take));
    }
    return page;
}

Result<ChainReport> AuditChain::verify(const std::string& agent_id,
                                       std::optional<Timestamp> start_time,
                                       std::optional<Timestamp> end_time) {
    if (start_time && end_time && *start_time > *end_time) {
        return make_error(ErrorKind::InvalidArgument, "start_time is after end_time");
    }

    AuditFilter filter;
    filter.agent_id = agent_id;
    filter.start_time = start_time;
    filter.end_time = end_time;

    auto tx = store_.begin();
    std::vector<AuditLogEntry> entries = tx->audit_entries(filter);

    std::optional<std::string> anchor;
    if (!start_time) {
        anchor = GENESIS_HASH;
    }

    ChainReport report = verify_entries(agent_id, entries, anchor);
    if (!report.valid) {
        log::error(LOG_CATEGORY, report.to_status().error().message);
    }
    return report;
}

} // namespace protocol
} // namespace consent
