#include "pins.hpp"
#include "../logging.hpp"

#include <algorithm>
#include <chrono>

namespace consent {
namespace protocol {

namespace {

constexpr const char* LOG_CATEGORY = "pins";

Error pin_not_found(const std::string& pin_id) {
    return make_error(ErrorKind::NotFound, "PIN not found: " + pin_id);
}

} // namespace

PinIssuer::PinIssuer(store::Store& store, const CoreConfig& config, Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)), signer_(config.pin_signing_key) {}

Result<IssuedPin> PinIssuer::create_pin(const std::string& agent_id,
                                        const std::string& contract_id,
                                        const Scope& scope,
                                        bool single_use,
                                        std::optional<int> ttl_seconds) {
    int ttl = ttl_seconds.value_or(config_.pin_ttl_seconds);
    if (ttl <= 0) {
        return make_error(ErrorKind::InvalidArgument, "PIN ttl must be positive");
    }

    auto tx = store_.begin();
    auto contract = tx->get_contract(contract_id);
    if (!contract) {
        return make_error(ErrorKind::NotFound, "contract not found: " + contract_id);
    }

    Timestamp now = clock_();
    if (contract->status != ContractStatus::Active || contract->expired_at(now)) {
        return make_error(ErrorKind::InvalidState, "contract is not active");
    }
    if (!contract->is_party(agent_id)) {
        return make_error(ErrorKind::Forbidden,
                          "agent " + agent_id + " is not a party to this contract");
    }
    if (!scope.subset_of(contract->scope())) {
        log::debug(LOG_CATEGORY, "scope request by " + agent_id + " exceeds contract " + contract_id);
        return make_error(ErrorKind::ScopeExceeded, "requested scope exceeds contract scope");
    }

    Pin pin;
    pin.id = utils::generate_uuid();
    pin.contract_id = contract_id;
    pin.agent_id = agent_id;
    pin.scope = scope;
    pin.issued_at = now;
    pin.expires_at = now + std::chrono::seconds(ttl);
    pin.single_use = single_use;

    std::string token = crypto::generate_pin_token();
    pin.signature = signer_.sign(pin.id, token);

    tx->put_pin(pin);
    Status st = tx->commit();
    if (!st) return st.error();

    log::info(LOG_CATEGORY, "issued PIN " + pin.id + " on contract " + contract_id +
              " to " + agent_id + " (ttl " + std::to_string(ttl) + "s)");

    IssuedPin issued;
    issued.credential = crypto::compose_credential(token, pin.signature);
    issued.pin = std::move(pin);
    return issued;
}

Result<Pin> PinIssuer::revoke_pin(const std::string& pin_id,
                                  const std::string& agent_id,
                                  const std::string& reason) {
    auto tx = store_.begin();
    Status st = tx->lock_blocking(store::pin_lock_key(pin_id));
    if (!st) return st.error();

    auto found = tx->get_pin(pin_id);
    if (!found) return pin_not_found(pin_id);
    Pin pin = std::move(*found);

    if (agent_id != pin.agent_id) {
        auto contract = tx->get_contract(pin.contract_id);
        if (!contract || !contract->is_party(agent_id)) {
            return make_error(ErrorKind::Forbidden,
                              "agent " + agent_id + " may not revoke this PIN");
        }
    }
    if (pin.revoked) {
        return make_error(ErrorKind::InvalidState, "PIN already revoked");
    }

    pin.revoked = true;
    pin.revoked_at = clock_();
    pin.revocation_reason = reason;

    tx->put_pin(pin);
    st = tx->commit();
    if (!st) return st.error();

    log::info(LOG_CATEGORY, "PIN " + pin_id + " revoked by " + agent_id);
    return pin;
}

PinValidator::PinValidator(store::Store& store, const CoreConfig& config, Clock clock)
    : store_(store), signer_(config.pin_signing_key), clock_(std::move(clock)) {}

Result<PinGrant> PinValidator::validate(const std::string& pin_id,
                                        const std::string& credential,
                                        const Scope& requested_scope) {
    auto tx = store_.begin();

    // 1. exclusive row, fail fast when busy
    Status st = tx->try_lock(store::pin_lock_key(pin_id));
    if (!st) {
        log::debug(LOG_CATEGORY, "PIN " + pin_id + " busy");
        return st.error();
    }

    auto found = tx->get_pin(pin_id);
    if (!found || found->revoked) return pin_not_found(pin_id);
    Pin pin = std::move(*found);

    Timestamp now = clock_();

    // 2. expiry
    if (now > pin.expires_at) {
        return make_error(ErrorKind::Expired, "PIN has expired");
    }

    // 3. consumption
    if (pin.used_at) {
        return make_error(ErrorKind::AlreadyUsed, "PIN has already been used");
    }

    // 4. credential
    std::string token;
    std::string signature;
    if (!crypto::split_credential(credential, token, signature) ||
        !signer_.verify(pin.id, token, signature)) {
        log::warn(LOG_CATEGORY, "invalid credential presented for PIN " + pin_id);
        return make_error(ErrorKind::InvalidSignature, "invalid PIN credential");
    }

    // 5. scope
    if (!requested_scope.subset_of(pin.scope)) {
        return make_error(ErrorKind::ScopeExceeded, "requested scope exceeds PIN scope");
    }

    // 6. parent contract
    auto contract = tx->get_contract(pin.contract_id);
    if (!contract || contract->status != ContractStatus::Active || contract->expired_at(now)) {
        return make_error(ErrorKind::InvalidState, "contract is no longer active");
    }

    // 7. consume before the lock is released
    if (pin.single_use) {
        pin.used_at = std::max(now, pin.issued_at);
        tx->put_pin(pin);
        st = tx->commit();
        if (!st) return st.error();
    }

    PinGrant grant;
    grant.pin_id = pin.id;
    grant.contract_id = pin.contract_id;
    grant.agent_id = pin.agent_id;
    grant.scope = pin.scope;
    grant.validated_at = now;
    grant.consumed = pin.single_use;

    log::debug(LOG_CATEGORY, "PIN " + pin_id + " validated");
    return grant;
}

} // namespace protocol
} // namespace consent
