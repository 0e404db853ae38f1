#include "consent/consent_c.h"
#include "../protocol/core.hpp"
#include "../store/memory_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../helpers.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <set>
#include <string>

using namespace consent;
using namespace consent::protocol;
using nlohmann::json;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct consent_core_t {
    store::MemoryStore           store;
    std::unique_ptr<ConsentCore> core;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static int status_from_kind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return CONSENT_OK;
        case ErrorKind::NotFound:         return CONSENT_ERR_NOT_FOUND;
        case ErrorKind::InvalidState:     return CONSENT_ERR_INVALID_STATE;
        case ErrorKind::Forbidden:        return CONSENT_ERR_FORBIDDEN;
        case ErrorKind::Conflict:         return CONSENT_ERR_CONFLICT;
        case ErrorKind::InvalidSignature: return CONSENT_ERR_INVALID_SIGNATURE;
        case ErrorKind::ScopeExceeded:    return CONSENT_ERR_SCOPE_EXCEEDED;
        case ErrorKind::Expired:          return CONSENT_ERR_EXPIRED;
        case ErrorKind::AlreadyUsed:      return CONSENT_ERR_ALREADY_USED;
        case ErrorKind::LockContention:   return CONSENT_ERR_LOCK_CONTENTION;
        case ErrorKind::ChainBroken:      return CONSENT_ERR_CHAIN_BROKEN;
        case ErrorKind::InvalidArgument:  return CONSENT_ERR_INVALID_ARG;
    }
    return CONSENT_ERR;
}

static json error_body(const std::string& code, const std::string& message) {
    return json{{"error", {{"code", code}, {"message", message}}}};
}

static int fail(char** out_json, int status, const std::string& message) {
    *out_json = copy_to_c_string(error_body(consent_status_name(status), message).dump());
    return status;
}

static int fail(char** out_json, const Error& error) {
    int status = status_from_kind(error.kind);
    *out_json = copy_to_c_string(error_body(error_kind_name(error.kind), error.message).dump());
    return status;
}

static int succeed(char** out_json, const json& body) {
    *out_json = copy_to_c_string(body.dump());
    return CONSENT_OK;
}

template <typename T>
static int finish(const Result<T>& result, char** out_json) {
    if (!result) return fail(out_json, result.error());
    return succeed(out_json, json(result.value()));
}

// Runs one entry point, turning malformed input into CONSENT_ERR_INVALID_ARG.
template <typename Fn>
static int guarded(char** out_json, Fn&& fn) {
    try {
        return fn();
    } catch (const json::exception& e) {
        return fail(out_json, CONSENT_ERR_INVALID_ARG, e.what());
    } catch (const utils::DecodeError& e) {
        return fail(out_json, CONSENT_ERR_INVALID_ARG, e.what());
    } catch (const std::exception& e) {
        return fail(out_json, CONSENT_ERR, e.what());
    }
}

static std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<Timestamp> optional_time(const json& j, const char* key) {
    auto text = optional_string(j, key);
    if (!text) return std::nullopt;
    return utils::parse_timestamp(*text);
}

// Integers must be exact: fractions and values outside int range are rejected
// rather than narrowed.
static std::optional<int> optional_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw utils::DecodeError(std::string(key) + ": expected an integer");
    }
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw utils::DecodeError(std::string(key) + ": out of range");
        }
        return static_cast<int>(v);
    }
    auto v = it->get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw utils::DecodeError(std::string(key) + ": out of range");
    }
    return static_cast<int>(v);
}

static std::set<std::string> string_set(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::set<std::string>>();
}

static std::string counterparty_id(const json& j) {
    return j.at("counterparty").at("agent_id").get<std::string>();
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int consent_init(void) {
    try {
        utils::ensure_sodium_init();
        return CONSENT_OK;
    } catch (const std::exception&) {
        return CONSENT_ERR;
    }
}

void consent_free_string(char* str) {
    delete[] str;
}

const char* consent_status_name(int status) {
    switch (status) {
        case CONSENT_OK:                    return "OK";
        case CONSENT_ERR:                   return "INTERNAL";
        case CONSENT_ERR_INVALID_ARG:       return "INVALID_ARGUMENT";
        case CONSENT_ERR_NOT_FOUND:         return "NOT_FOUND";
        case CONSENT_ERR_INVALID_STATE:     return "INVALID_STATE";
        case CONSENT_ERR_FORBIDDEN:         return "FORBIDDEN";
        case CONSENT_ERR_CONFLICT:          return "CONFLICT";
        case CONSENT_ERR_INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case CONSENT_ERR_SCOPE_EXCEEDED:    return "SCOPE_EXCEEDED";
        case CONSENT_ERR_EXPIRED:           return "EXPIRED";
        case CONSENT_ERR_ALREADY_USED:      return "ALREADY_USED";
        case CONSENT_ERR_LOCK_CONTENTION:   return "LOCK_CONTENTION";
        case CONSENT_ERR_CHAIN_BROKEN:      return "CHAIN_BROKEN";
        default:                            return "UNKNOWN";
    }
}

int consent_status_is_retryable(int status) {
    return status == CONSENT_ERR_LOCK_CONTENTION ? 1 : 0;
}

/*==============================================================================
 * Core lifecycle
 *============================================================================*/

int consent_core_create(const char* config_env, consent_core_t** out) {
    if (!out) return CONSENT_ERR_INVALID_ARG;

    try {
        CoreConfig config = config_env ? CoreConfig::from_env_string(config_env)
                                       : CoreConfig::from_environment();
        auto handle = std::make_unique<consent_core_t>();
        handle->core = std::make_unique<ConsentCore>(handle->store, std::move(config));
        *out = handle.release();
        return CONSENT_OK;
    } catch (const ConfigError&) {
        return CONSENT_ERR_INVALID_ARG;
    } catch (const std::exception&) {
        return CONSENT_ERR;
    }
}

void consent_core_destroy(consent_core_t* core) {
    delete core;
}

/*==============================================================================
 * Contracts
 *============================================================================*/

int consent_create_contract(consent_core_t* core, const char* proposer,
                            const char* request_json, char** out_json) {
    if (!core || !proposer || !request_json || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        json req = json::parse(request_json);
        const json& t = req.at("terms");

        ContractTerms terms;
        terms.data_types = string_set(t, "data_types");
        terms.allowed_actions = string_set(t, "allowed_actions");
        terms.purpose = t.at("purpose").get<std::string>();
        terms.retention_days = optional_int(t, "retention_days");
        terms.geographic_scope = string_set(t, "geographic_scope");
        terms.expires_at = optional_time(req, "expires_at");

        return finish(core->core->create_contract(proposer, counterparty_id(req), terms), out_json);
    });
}

int consent_sign_contract(consent_core_t* core, const char* contract_id,
                          const char* signer, const char* signature_b64,
                          const char* public_key_pem, char** out_json) {
    if (!core || !contract_id || !signer || !signature_b64 || !public_key_pem || !out_json) {
        return CONSENT_ERR_INVALID_ARG;
    }
    return guarded(out_json, [&] {
        return finish(core->core->sign_contract(contract_id, signer, signature_b64, public_key_pem),
                      out_json);
    });
}

int consent_get_contract(consent_core_t* core, const char* contract_id, char** out_json) {
    if (!core || !contract_id || !out_json) return CONSENT_ERR_INVALID_ARG;
    return guarded(out_json, [&] {
        return finish(core->core->get_contract(contract_id), out_json);
    });
}

int consent_revoke_contract(consent_core_t* core, const char* contract_id,
                            const char* agent_id, const char* reason, char** out_json) {
    if (!core || !contract_id || !agent_id || !out_json) return CONSENT_ERR_INVALID_ARG;
    return guarded(out_json, [&] {
        return finish(core->core->revoke_contract(contract_id, agent_id, reason ? reason : ""),
                      out_json);
    });
}

int consent_expire_contracts(consent_core_t* core, char** out_json) {
    if (!core || !out_json) return CONSENT_ERR_INVALID_ARG;
    return guarded(out_json, [&] {
        auto result = core->core->expire_contracts();
        if (!result) return fail(out_json, result.error());
        return succeed(out_json, json{{"expired", result.value()}});
    });
}

/*==============================================================================
 * PINs
 *============================================================================*/

int consent_create_pin(consent_core_t* core, const char* agent_id,
                       const char* request_json, char** out_json) {
    if (!core || !agent_id || !request_json || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        json req = json::parse(request_json);
        Scope scope = req.at("scope").get<Scope>();
        bool single_use = req.value("single_use", true);

        auto result = core->core->create_pin(agent_id, req.at("contract_id").get<std::string>(),
                                             scope, single_use, optional_int(req, "ttl_seconds"));
        if (!result) return fail(out_json, result.error());
        return succeed(out_json, json{{"pin", result->pin}, {"credential", result->credential}});
    });
}

int consent_validate_pin(consent_core_t* core, const char* pin_id,
                         const char* credential, const char* scope_json,
                         char** out_json) {
    if (!core || !pin_id || !credential || !scope_json || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        Scope scope = json::parse(scope_json).get<Scope>();
        return finish(core->core->validate_pin(pin_id, credential, scope), out_json);
    });
}

int consent_revoke_pin(consent_core_t* core, const char* pin_id,
                       const char* agent_id, const char* reason, char** out_json) {
    if (!core || !pin_id || !agent_id || !out_json) return CONSENT_ERR_INVALID_ARG;
    return guarded(out_json, [&] {
        return finish(core->core->revoke_pin(pin_id, agent_id, reason ? reason : ""), out_json);
    });
}

/*==============================================================================
 * Audit
 *============================================================================*/

int consent_append_audit_log(consent_core_t* core, const char* agent_id,
                             const char* request_json, char** out_json) {
    if (!core || !agent_id || !request_json || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        json req = json::parse(request_json);

        auto action = audit_action_from_string(req.at("action").get<std::string>());
        auto status = audit_status_from_string(req.at("status").get<std::string>());
        if (!action || !status) {
            return fail(out_json, CONSENT_ERR_INVALID_ARG, "unknown audit action or status");
        }

        AuditAppendRequest request;
        request.request_id = req.at("transaction_id").get<std::string>();
        request.contract_id = optional_string(req, "contract_id");
        request.pin_id = optional_string(req, "pin_id");
        request.action = *action;
        request.status = *status;
        request.target_system = counterparty_id(req);
        request.data_types = req.value("data_types", std::vector<std::string>{});
        request.metadata = req.value("metadata", json::object());

        return finish(core->core->append_audit_log(agent_id, request), out_json);
    });
}

int consent_query_audit_logs(consent_core_t* core, const char* query_json, char** out_json) {
    if (!core || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        json q = query_json ? json::parse(query_json) : json::object();

        AuditQuery query;
        query.filter.contract_id = optional_string(q, "contract_id");
        query.filter.agent_id = optional_string(q, "agent_id");
        if (auto action = optional_string(q, "action")) {
            query.filter.action = audit_action_from_string(*action);
            if (!query.filter.action) {
                return fail(out_json, CONSENT_ERR_INVALID_ARG, "unknown audit action: " + *action);
            }
        }
        if (auto status = optional_string(q, "status")) {
            query.filter.status = audit_status_from_string(*status);
            if (!query.filter.status) {
                return fail(out_json, CONSENT_ERR_INVALID_ARG, "unknown audit status: " + *status);
            }
        }
        query.filter.start_time = optional_time(q, "start_time");
        query.filter.end_time = optional_time(q, "end_time");
        query.limit = optional_int(q, "limit");
        query.offset = optional_int(q, "offset").value_or(0);

        return finish(core->core->query_audit_logs(query), out_json);
    });
}

int consent_verify_audit_chain(consent_core_t* core, const char* agent_id,
                               const char* range_json, char** out_json) {
    if (!core || !agent_id || !out_json) return CONSENT_ERR_INVALID_ARG;

    return guarded(out_json, [&] {
        json range = range_json ? json::parse(range_json) : json::object();

        auto result = core->core->verify_audit_chain(agent_id, optional_time(range, "start_time"),
                                                     optional_time(range, "end_time"));
        if (!result) return fail(out_json, result.error());

        const ChainReport& report = result.value();
        json body = report;
        Status st = report.to_status();
        if (!st) {
            body["error"] = {{"code", error_kind_name(st.kind())}, {"message", st.error().message}};
            *out_json = copy_to_c_string(body.dump());
            return status_from_kind(st.kind());
        }
        return succeed(out_json, body);
    });
}
