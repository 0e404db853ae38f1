#ifndef CONSENT_PROTOCOL_TYPES_HPP
#define CONSENT_PROTOCOL_TYPES_HPP

#include "../errors.hpp"
#include "../helpers.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace consent {
namespace protocol {

// First prev_hash of every agent's chain: 64 ASCII zeros.
extern const std::string GENESIS_HASH;

// -----------------------------------------------------------------------------
// Enumerations (string forms are lowercase and part of the hashed content)
// -----------------------------------------------------------------------------
enum class ContractStatus : uint8_t {
    Proposed,
    Active,
    Revoked,
    Expired
};

enum class AuditAction : uint8_t {
    Request,
    Response,
    Error,
    Validation,
    Revocation
};

enum class AuditStatus : uint8_t {
    Sent,
    Received,
    Denied,
    Error,
    Expired
};

const char* to_string(ContractStatus status);
const char* to_string(AuditAction action);
const char* to_string(AuditStatus status);

std::optional<AuditAction> audit_action_from_string(const std::string& text);
std::optional<AuditStatus> audit_status_from_string(const std::string& text);

// REVOKED and EXPIRED have no outgoing transitions.
bool is_terminal(ContractStatus status);
bool can_transition(ContractStatus from, ContractStatus to);

// -----------------------------------------------------------------------------
// Scope - permitted (data types, actions), compared by set containment
// -----------------------------------------------------------------------------
struct Scope {
    std::set<std::string> data_types;
    std::set<std::string> actions;

    bool subset_of(const Scope& other) const;
};

// -----------------------------------------------------------------------------
// Contract
// -----------------------------------------------------------------------------
struct ContractTerms {
    std::set<std::string>    data_types;
    std::set<std::string>    allowed_actions;
    std::string              purpose;
    std::optional<int>       retention_days;
    std::set<std::string>    geographic_scope;
    std::optional<Timestamp> expires_at;
};

struct Contract {
    std::string id;
    std::string party_a;  // proposer
    std::string party_b;  // counterparty

    std::set<std::string> data_types;
    std::set<std::string> allowed_actions;
    std::string           purpose;
    std::optional<int>    retention_days;
    std::set<std::string> geographic_scope;

    std::optional<std::string> party_a_signature;  // base64 Ed25519
    std::optional<std::string> party_b_signature;

    ContractStatus status = ContractStatus::Proposed;
    std::string    content_hash;  // fixed at proposal

    Timestamp                  created_at;
    Timestamp                  updated_at;
    std::optional<Timestamp>   signed_at;
    std::optional<Timestamp>   expires_at;
    std::optional<Timestamp>   revoked_at;
    std::optional<std::string> revoked_by;
    std::optional<std::string> revocation_reason;

    bool is_party(const std::string& agent_id) const;
    bool fully_signed() const;
    bool expired_at(Timestamp now) const;

    Scope scope() const;
};

// -----------------------------------------------------------------------------
// Pin - the persisted row. The secret token is never stored.
// -----------------------------------------------------------------------------
struct Pin {
    std::string id;
    std::string contract_id;
    std::string agent_id;   // holder
    Scope       scope;
    std::string signature;  // HMAC over "<id>:<token>"

    Timestamp                issued_at;
    Timestamp                expires_at;
    std::optional<Timestamp> used_at;
    bool                     single_use = true;

    bool                       revoked = false;
    std::optional<Timestamp>   revoked_at;
    std::optional<std::string> revocation_reason;
};

// Returned by create_pin. The credential is shown exactly once.
struct IssuedPin {
    Pin         pin;
    std::string credential;  // "<token>.<signature>"
};

struct PinGrant {
    std::string pin_id;
    std::string contract_id;
    std::string agent_id;
    Scope       scope;
    Timestamp   validated_at;
    bool        consumed = false;
};

// -----------------------------------------------------------------------------
// Audit log
// -----------------------------------------------------------------------------
struct AuditLogEntry {
    std::string                log_id;
    Timestamp                  timestamp;
    std::optional<std::string> contract_id;
    std::optional<std::string> pin_id;
    std::string                agent_id;  // chain owner
    AuditAction                action = AuditAction::Request;
    AuditStatus                status = AuditStatus::Sent;
    std::string                target_system;
    nlohmann::json             scope;     // {"data_types": [...]}
    nlohmann::json             metadata;  // always an object
    std::string                source;
    std::string                request_id;
    std::string                prev_hash;
    std::string                entry_hash;
};

// Author-supplied fields of a new entry. The chain fills in the rest.
struct AuditAppendRequest {
    std::string                request_id;  // correlates both sides of one transaction
    std::optional<std::string> contract_id;
    std::optional<std::string> pin_id;
    AuditAction                action = AuditAction::Request;
    AuditStatus                status = AuditStatus::Sent;
    std::string                target_system;
    std::vector<std::string>   data_types;
    nlohmann::json             metadata = nlohmann::json::object();
};

struct AuditFilter {
    std::optional<std::string> contract_id;
    std::optional<std::string> agent_id;
    std::optional<AuditAction> action;
    std::optional<AuditStatus> status;
    std::optional<Timestamp>   start_time;  // inclusive
    std::optional<Timestamp>   end_time;    // inclusive

    bool matches(const AuditLogEntry& entry) const;
};

struct AuditQuery {
    AuditFilter        filter;
    std::optional<int> limit;  // nullopt = configured default
    int                offset = 0;
};

struct AuditPage {
    std::vector<AuditLogEntry> entries;  // newest first
    std::size_t                total = 0;
    int                        limit = 0;
    int                        offset = 0;
};

// -----------------------------------------------------------------------------
// Chain verification report
// -----------------------------------------------------------------------------
enum class ChainCheck : uint8_t {
    PrevHashMismatch,
    EntryHashMismatch
};

const char* to_string(ChainCheck check);

struct ChainFailure {
    std::string log_id;
    std::size_t index = 0;  // position within the verified range
    ChainCheck  check = ChainCheck::PrevHashMismatch;
    std::string message;
};

struct ChainReport {
    std::string                 agent_id;
    bool                        valid = true;
    std::size_t                 entries_checked = 0;
    std::optional<ChainFailure> failure;

    // OK when valid, otherwise a ChainBroken error naming the entry.
    Status to_status() const;
};

// -----------------------------------------------------------------------------
// JSON representations (timestamps as ISO-8601, enums lowercase)
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Scope& scope);
void from_json(const nlohmann::json& j, Scope& scope);

void to_json(nlohmann::json& j, const Contract& contract);
void to_json(nlohmann::json& j, const Pin& pin);  // omits the signature
void to_json(nlohmann::json& j, const PinGrant& grant);
void to_json(nlohmann::json& j, const AuditLogEntry& entry);
void to_json(nlohmann::json& j, const AuditPage& page);
void to_json(nlohmann::json& j, const ChainReport& report);

} // namespace protocol
} // namespace consent

#endif // CONSENT_PROTOCOL_TYPES_HPP
