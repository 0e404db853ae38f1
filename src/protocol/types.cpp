#include "types.hpp"

#include <algorithm>

namespace consent {
namespace protocol {

using nlohmann::json;

const std::string GENESIS_HASH(64, '0');

// -----------------------------------------------------------------------------
// Enumerations
// -----------------------------------------------------------------------------

const char* to_string(ContractStatus status) {
    switch (status) {
        case ContractStatus::Proposed: return "proposed";
        case ContractStatus::Active:   return "active";
        case ContractStatus::Revoked:  return "revoked";
        case ContractStatus::Expired:  return "expired";
    }
    return "unknown";
}

const char* to_string(AuditAction action) {
    switch (action) {
        case AuditAction::Request:    return "request";
        case AuditAction::Response:   return "response";
        case AuditAction::Error:      return "error";
        case AuditAction::Validation: return "validation";
        case AuditAction::Revocation: return "revocation";
    }
    return "unknown";
}

const char* to_string(AuditStatus status) {
    switch (status) {
        case AuditStatus::Sent:     return "sent";
        case AuditStatus::Received: return "received";
        case AuditStatus::Denied:   return "denied";
        case AuditStatus::Error:    return "error";
        case AuditStatus::Expired:  return "expired";
    }
    return "unknown";
}

const char* to_string(ChainCheck check) {
    switch (check) {
        case ChainCheck::PrevHashMismatch:  return "prev_hash mismatch";
        case ChainCheck::EntryHashMismatch: return "hash mismatch";
    }
    return "unknown";
}

std::optional<AuditAction> audit_action_from_string(const std::string& text) {
    for (auto a : {AuditAction::Request, AuditAction::Response, AuditAction::Error,
                   AuditAction::Validation, AuditAction::Revocation}) {
        if (text == to_string(a)) return a;
    }
    return std::nullopt;
}

std::optional<AuditStatus> audit_status_from_string(const std::string& text) {
    for (auto s : {AuditStatus::Sent, AuditStatus::Received, AuditStatus::Denied,
                   AuditStatus::Error, AuditStatus::Expired}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

bool is_terminal(ContractStatus status) {
    return status == ContractStatus::Revoked || status == ContractStatus::Expired;
}

bool can_transition(ContractStatus from, ContractStatus to) {
    switch (from) {
        case ContractStatus::Proposed:
            return to == ContractStatus::Active || to == ContractStatus::Revoked ||
                   to == ContractStatus::Expired;
        case ContractStatus::Active:
            return to == ContractStatus::Revoked || to == ContractStatus::Expired;
        case ContractStatus::Revoked:
        case ContractStatus::Expired:
            return false;
    }
    return false;
}

// -----------------------------------------------------------------------------
// Scope / Contract
// -----------------------------------------------------------------------------

bool Scope::subset_of(const Scope& other) const {
    return std::includes(other.data_types.begin(), other.data_types.end(),
                         data_types.begin(), data_types.end()) &&
           std::includes(other.actions.begin(), other.actions.end(),
                         actions.begin(), actions.end());
}

bool Contract::is_party(const std::string& agent_id) const {
    return agent_id == party_a || agent_id == party_b;
}

bool Contract::fully_signed() const {
    return party_a_signature.has_value() && party_b_signature.has_value();
}

bool Contract::expired_at(Timestamp now) const {
    return expires_at.has_value() && now > *expires_at;
}

Scope Contract::scope() const {
    return Scope{data_types, allowed_actions};
}

// -----------------------------------------------------------------------------
// Audit filter / chain report
// -----------------------------------------------------------------------------

bool AuditFilter::matches(const AuditLogEntry& entry) const {
    if (contract_id && entry.contract_id != contract_id) return false;
    if (agent_id && entry.agent_id != *agent_id) return false;
    if (action && entry.action != *action) return false;
    if (status && entry.status != *status) return false;
    if (start_time && entry.timestamp < *start_time) return false;
    if (end_time && entry.timestamp > *end_time) return false;
    return true;
}

Status ChainReport::to_status() const {
    if (valid) return Status::Ok();
    std::string msg = "audit chain broken for agent " + agent_id;
    if (failure) {
        msg += ": " + failure->message;
    }
    return make_error(ErrorKind::ChainBroken, msg);
}

// -----------------------------------------------------------------------------
// JSON
// -----------------------------------------------------------------------------

namespace {

json optional_time(const std::optional<Timestamp>& ts) {
    return ts ? json(utils::format_timestamp(*ts)) : json(nullptr);
}

json optional_string(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

} // namespace

void to_json(json& j, const Scope& scope) {
    j = json{{"data_types", scope.data_types}, {"actions", scope.actions}};
}

void from_json(const json& j, Scope& scope) {
    scope.data_types = j.value("data_types", std::set<std::string>{});
    scope.actions = j.value("actions", std::set<std::string>{});
}

void to_json(json& j, const Contract& c) {
    j = json{
        {"contract_id", c.id},
        {"party_a", c.party_a},
        {"party_b", c.party_b},
        {"data_types", c.data_types},
        {"allowed_actions", c.allowed_actions},
        {"purpose", c.purpose},
        {"retention_days", c.retention_days ? json(*c.retention_days) : json(nullptr)},
        {"geographic_scope", c.geographic_scope},
        {"party_a_signature", optional_string(c.party_a_signature)},
        {"party_b_signature", optional_string(c.party_b_signature)},
        {"status", to_string(c.status)},
        {"content_hash", c.content_hash},
        {"created_at", utils::format_timestamp(c.created_at)},
        {"updated_at", utils::format_timestamp(c.updated_at)},
        {"signed_at", optional_time(c.signed_at)},
        {"expires_at", optional_time(c.expires_at)},
        {"revoked_at", optional_time(c.revoked_at)},
        {"revoked_by", optional_string(c.revoked_by)},
        {"revocation_reason", optional_string(c.revocation_reason)},
    };
}

void to_json(json& j, const Pin& p) {
    j = json{
        {"pin_id", p.id},
        {"contract_id", p.contract_id},
        {"agent_id", p.agent_id},
        {"scope", p.scope},
        {"issued_at", utils::format_timestamp(p.issued_at)},
        {"expires_at", utils::format_timestamp(p.expires_at)},
        {"used_at", optional_time(p.used_at)},
        {"single_use", p.single_use},
        {"revoked", p.revoked},
        {"revoked_at", optional_time(p.revoked_at)},
        {"revocation_reason", optional_string(p.revocation_reason)},
    };
}

void to_json(json& j, const PinGrant& g) {
    j = json{
        {"valid", true},
        {"pin_id", g.pin_id},
        {"contract_id", g.contract_id},
        {"agent_id", g.agent_id},
        {"scope", g.scope},
        {"validated_at", utils::format_timestamp(g.validated_at)},
        {"consumed", g.consumed},
    };
}

void to_json(json& j, const AuditLogEntry& e) {
    j = json{
        {"log_id", e.log_id},
        {"timestamp", utils::format_timestamp(e.timestamp)},
        {"contract_id", optional_string(e.contract_id)},
        {"pin_id", optional_string(e.pin_id)},
        {"agent_id", e.agent_id},
        {"action", to_string(e.action)},
        {"status", to_string(e.status)},
        {"target_system", e.target_system},
        {"scope", e.scope},
        {"metadata", e.metadata},
        {"source", e.source},
        {"request_id", e.request_id},
        {"prev_hash", e.prev_hash},
        {"entry_hash", e.entry_hash},
    };
}

void to_json(json& j, const AuditPage& page) {
    j = json{
        {"logs", page.entries},
        {"total", page.total},
        {"limit", page.limit},
        {"offset", page.offset},
    };
}

void to_json(json& j, const ChainReport& r) {
    j = json{
        {"agent_id", r.agent_id},
        {"valid", r.valid},
        {"entries_checked", r.entries_checked},
    };
    if (r.failure) {
        j["failure"] = json{
            {"log_id", r.failure->log_id},
            {"index", r.failure->index},
            {"check", to_string(r.failure->check)},
            {"message", r.failure->message},
        };
    } else {
        j["failure"] = nullptr;
    }
}

} // namespace protocol
} // namespace consent
