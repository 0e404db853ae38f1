#ifndef CONSENT_TEST_HELPERS_HPP
#define CONSENT_TEST_HELPERS_HPP

#include "../src/config.hpp"
#include "../src/crypto/ed25519.hpp"
#include "../src/crypto/verifier.hpp"
#include "../src/helpers.hpp"
#include "../src/protocol/core.hpp"
#include "../src/store/memory_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace test_helpers {

using consent::Bytes;
using consent::Timestamp;

// -----------------------------------------------------------------------------
// One-time initialization
// -----------------------------------------------------------------------------

inline void init_crypto() {
    consent::utils::ensure_sodium_init();
}

inline Bytes random_bytes(size_t len = 32) {
    return consent::utils::random_bytes(len);
}

// -----------------------------------------------------------------------------
// ManualClock - time moves only when the test says so
// -----------------------------------------------------------------------------

class ManualClock {
public:
    ManualClock() : now_(consent::utils::parse_timestamp("2025-01-15T12:00:00+00:00")) {}

    Timestamp now() const { return now_.load(); }

    void advance(std::chrono::microseconds delta) { now_.store(now_.load() + delta); }
    void set(Timestamp t) { now_.store(t); }

    consent::Clock clock() {
        return [this] { return now_.load(); };
    }

private:
    std::atomic<Timestamp> now_;
};

// -----------------------------------------------------------------------------
// Party - an agent id with its own Ed25519 signing key
// -----------------------------------------------------------------------------

struct Party {
    std::string                     agent_id;
    consent::crypto::SigningKeyPair keys;
    std::string                     public_key_pem;

    std::string sign(const std::string& content_hash) const {
        return consent::crypto::sign_content_hash(keys.secret_key, content_hash);
    }
};

inline Party make_party(const std::string& agent_id) {
    init_crypto();
    Party p;
    p.agent_id = agent_id;
    p.keys = consent::crypto::keygen();
    p.public_key_pem = consent::crypto::public_key_to_pem(p.keys.public_key);
    return p;
}

inline consent::CoreConfig make_config() {
    consent::CoreConfig config;
    config.pin_signing_key = random_bytes(32);
    config.log_level = consent::log::Level::Off;
    return config;
}

inline consent::protocol::ContractTerms scheduling_terms() {
    consent::protocol::ContractTerms terms;
    terms.data_types = {"appointment"};
    terms.allowed_actions = {"read"};
    terms.purpose = "scheduling";
    terms.retention_days = 30;
    return terms;
}

// -----------------------------------------------------------------------------
// TestCore - a core over the in-memory store, driven by a manual clock
// -----------------------------------------------------------------------------

struct TestCore {
    ManualClock                 clock;
    consent::store::MemoryStore store;
    consent::ConsentCore        core;

    TestCore() : core(store, make_config(), clock.clock()) {}
    explicit TestCore(consent::CoreConfig config) : core(store, std::move(config), clock.clock()) {}
};

// Proposes a contract from a to b and has both parties sign it.
inline consent::protocol::Contract make_active_contract(
        consent::ConsentCore& core, const Party& a, const Party& b,
        const consent::protocol::ContractTerms& terms = scheduling_terms()) {
    auto created = core.create_contract(a.agent_id, b.agent_id, terms);
    const std::string id = created.value().id;
    const std::string hash = created.value().content_hash;

    core.sign_contract(id, a.agent_id, a.sign(hash), a.public_key_pem).value();
    return core.sign_contract(id, b.agent_id, b.sign(hash), b.public_key_pem).value();
}

inline consent::protocol::Scope make_scope(std::set<std::string> data_types,
                                           std::set<std::string> actions) {
    consent::protocol::Scope scope;
    scope.data_types = std::move(data_types);
    scope.actions = std::move(actions);
    return scope;
}

} // namespace test_helpers

#endif // CONSENT_TEST_HELPERS_HPP
