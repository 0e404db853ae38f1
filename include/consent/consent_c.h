#ifndef CONSENT_C_H
#define CONSENT_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define CONSENT_OK                      0
#define CONSENT_ERR                    -1   /* unexpected internal failure */
#define CONSENT_ERR_INVALID_ARG        -2   /* NULL pointer, malformed JSON or field */
#define CONSENT_ERR_NOT_FOUND         -10
#define CONSENT_ERR_INVALID_STATE     -11
#define CONSENT_ERR_FORBIDDEN         -12
#define CONSENT_ERR_CONFLICT          -13
#define CONSENT_ERR_INVALID_SIGNATURE -14
#define CONSENT_ERR_SCOPE_EXCEEDED    -15
#define CONSENT_ERR_EXPIRED           -16
#define CONSENT_ERR_ALREADY_USED      -17
#define CONSENT_ERR_LOCK_CONTENTION   -18   /* retryable */
#define CONSENT_ERR_CHAIN_BROKEN      -19

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct consent_core_t consent_core_t;

/*==============================================================================
 * Init / Utilities
 *
 * Every operation below writes a JSON document to *out_json, on success and on
 * failure alike. Failures carry {"error": {"code": "...", "message": "..."}}.
 * Release it with consent_free_string().
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int consent_init(void);

/** Free a heap-allocated string returned by consent_* functions. */
void consent_free_string(char* str);

/** Stable name of a status code, e.g. "SCOPE_EXCEEDED". Never NULL. */
const char* consent_status_name(int status);

/** Non-zero if the status is worth retrying unchanged. */
int consent_status_is_retryable(int status);

/*==============================================================================
 * Core lifecycle
 *============================================================================*/

/**
 * Create a core over a fresh in-process store.
 * config_env: KEY=value lines (CONSENT_PIN_SIGNING_KEY hex, ...), or NULL to
 * read the same keys from the process environment.
 */
int consent_core_create(const char* config_env, consent_core_t** out);

void consent_core_destroy(consent_core_t* core);

/*==============================================================================
 * Contracts
 *============================================================================*/

/**
 * request_json: {"counterparty": {"agent_id": "..."},
 *                "terms": {"data_types": [...], "allowed_actions": [...],
 *                          "purpose": "...", "retention_days": n|null,
 *                          "geographic_scope": [...]},
 *                "expires_at": "ISO-8601"|null}
 */
int consent_create_contract(consent_core_t* core, const char* proposer,
                            const char* request_json, char** out_json);

int consent_sign_contract(consent_core_t* core, const char* contract_id,
                          const char* signer, const char* signature_b64,
                          const char* public_key_pem, char** out_json);

int consent_get_contract(consent_core_t* core, const char* contract_id, char** out_json);

int consent_revoke_contract(consent_core_t* core, const char* contract_id,
                            const char* agent_id, const char* reason, char** out_json);

/** Expiry sweep. out_json: {"expired": ["<contract id>", ...]} */
int consent_expire_contracts(consent_core_t* core, char** out_json);

/*==============================================================================
 * PINs
 *============================================================================*/

/**
 * request_json: {"contract_id": "...",
 *                "scope": {"data_types": [...], "actions": [...]},
 *                "single_use": true, "ttl_seconds": n (optional)}
 * out_json: {"pin": {...}, "credential": "<token>.<signature>"}
 */
int consent_create_pin(consent_core_t* core, const char* agent_id,
                       const char* request_json, char** out_json);

/** scope_json: {"data_types": [...], "actions": [...]} */
int consent_validate_pin(consent_core_t* core, const char* pin_id,
                         const char* credential, const char* scope_json,
                         char** out_json);

int consent_revoke_pin(consent_core_t* core, const char* pin_id,
                       const char* agent_id, const char* reason, char** out_json);

/*==============================================================================
 * Audit
 *============================================================================*/

/**
 * request_json: {"transaction_id": "...", "contract_id": ..., "pin_id": ...,
 *                "action": "request", "status": "sent",
 *                "counterparty": {"agent_id": "..."},
 *                "data_types": [...], "metadata": {...}}
 */
int consent_append_audit_log(consent_core_t* core, const char* agent_id,
                             const char* request_json, char** out_json);

/**
 * query_json (every field optional): {"contract_id", "agent_id", "action",
 * "status", "start_time", "end_time", "limit", "offset"}
 */
int consent_query_audit_logs(consent_core_t* core, const char* query_json, char** out_json);

/**
 * range_json: {"start_time": ..., "end_time": ...} or NULL.
 * A broken chain returns CONSENT_ERR_CHAIN_BROKEN with the report in out_json.
 */
int consent_verify_audit_chain(consent_core_t* core, const char* agent_id,
                               const char* range_json, char** out_json);

#ifdef __cplusplus
}
#endif

#endif /* CONSENT_C_H */
