#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>

#include "config.hpp"
#include "helpers.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/pin_signer.hpp"
#include "crypto/verifier.hpp"
#include "protocol/core.hpp"
#include "store/memory_store.hpp"

using consent::Bytes;
using namespace consent::protocol;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

struct BenchParty {
    std::string agent_id;
    consent::crypto::SigningKeyPair keys;
    std::string pem;
};

static BenchParty make_party(const std::string& agent_id) {
    BenchParty p;
    p.agent_id = agent_id;
    p.keys = consent::crypto::keygen();
    p.pem = consent::crypto::public_key_to_pem(p.keys.public_key);
    return p;
}

static ContractTerms bench_terms() {
    ContractTerms terms;
    terms.data_types = {"appointment", "availability", "contact"};
    terms.allowed_actions = {"read", "write"};
    terms.purpose = "scheduling";
    terms.retention_days = 30;
    return terms;
}

int main() {
    consent::utils::ensure_sodium_init();

    BenchmarkRunner primitive_runner(10000); // fast ops
    BenchmarkRunner protocol_runner(1000);   // store round trips

    // =====================================================================
    // SECTION 1: Primitives
    // =====================================================================
    std::cout << "\n--- Primitives (Avg over "
              << primitive_runner.num_iters << " iters) ---" << std::endl;

    consent::crypto::ContractContent content;
    content.party_a = "system:acme";
    content.party_b = "agent:scheduler";
    content.data_types = {"appointment", "availability", "contact"};
    content.actions = {"read", "write"};
    content.purpose = "scheduling";
    content.retention_days = 30;

    primitive_runner.run("Content Hash", [&]() {
        auto h = consent::crypto::compute_content_hash(content);
        volatile size_t sink = h.size();
        (void)sink;
    });

    BenchParty signer = make_party("system:acme");
    const std::string hash = consent::crypto::compute_content_hash(content);
    const std::string sig = consent::crypto::sign_content_hash(signer.keys.secret_key, hash);

    primitive_runner.run("Ed25519 Sign (content hash)", [&]() {
        auto s = consent::crypto::sign_content_hash(signer.keys.secret_key, hash);
        volatile size_t sink = s.size();
        (void)sink;
    });

    primitive_runner.run("Ed25519 Verify (PEM key)", [&]() {
        volatile bool sink = consent::crypto::verify_signature(signer.pem, sig, hash);
        (void)sink;
    });

    consent::crypto::PinSigner pin_signer(consent::utils::random_bytes(32));
    const std::string token = consent::crypto::generate_pin_token();
    const std::string pin_sig = pin_signer.sign("pin-1", token);

    primitive_runner.run("PIN HMAC Sign", [&]() {
        auto s = pin_signer.sign("pin-1", token);
        volatile size_t sink = s.size();
        (void)sink;
    });

    primitive_runner.run("PIN HMAC Verify", [&]() {
        volatile bool sink = pin_signer.verify("pin-1", token, pin_sig);
        (void)sink;
    });

    // =====================================================================
    // SECTION 2: Core operations (in-memory store)
    // =====================================================================
    std::cout << "\n--- Core Operations (Avg over "
              << protocol_runner.num_iters << " iters) ---" << std::endl;

    consent::store::MemoryStore store;
    consent::CoreConfig config;
    config.pin_signing_key = consent::utils::random_bytes(32);
    config.log_level = consent::log::Level::Off;
    consent::ConsentCore core(store, config);

    BenchParty a = make_party("system:acme");
    BenchParty b = make_party("agent:scheduler");

    protocol_runner.run("Create + Sign Contract (2 parties)", [&]() {
        auto c = core.create_contract(a.agent_id, b.agent_id, bench_terms()).value();
        core.sign_contract(c.id, a.agent_id,
                           consent::crypto::sign_content_hash(a.keys.secret_key, c.content_hash), a.pem).value();
        auto done = core.sign_contract(c.id, b.agent_id,
                                       consent::crypto::sign_content_hash(b.keys.secret_key, c.content_hash), b.pem);
        volatile bool sink = done.ok();
        (void)sink;
    });

    auto contract = core.create_contract(a.agent_id, b.agent_id, bench_terms()).value();
    core.sign_contract(contract.id, a.agent_id,
                       consent::crypto::sign_content_hash(a.keys.secret_key, contract.content_hash), a.pem).value();
    core.sign_contract(contract.id, b.agent_id,
                       consent::crypto::sign_content_hash(b.keys.secret_key, contract.content_hash), b.pem).value();

    Scope scope;
    scope.data_types = {"appointment"};
    scope.actions = {"read"};

    protocol_runner.run("Create PIN", [&]() {
        auto pin = core.create_pin(b.agent_id, contract.id, scope, true);
        volatile bool sink = pin.ok();
        (void)sink;
    });

    protocol_runner.run("Create + Validate PIN (single use)", [&]() {
        auto issued = core.create_pin(b.agent_id, contract.id, scope, true).value();
        auto grant = core.validate_pin(issued.pin.id, issued.credential, scope);
        volatile bool sink = grant.ok();
        (void)sink;
    });

    AuditAppendRequest req;
    req.request_id = "txn-bench";
    req.contract_id = contract.id;
    req.action = AuditAction::Request;
    req.status = AuditStatus::Sent;
    req.target_system = a.agent_id;
    req.data_types = {"appointment"};

    protocol_runner.run("Audit Append", [&]() {
        auto e = core.append_audit_log(b.agent_id, req);
        volatile bool sink = e.ok();
        (void)sink;
    });

    {
        BenchmarkRunner chain_runner(10);
        std::cout << "\n--- Audit Chain Verify ("
                  << store.audit_entry_count() << " entries, Avg over "
                  << chain_runner.num_iters << " iters) ---" << std::endl;
        chain_runner.run("Verify Full Chain", [&]() {
            auto report = core.verify_audit_chain(b.agent_id);
            volatile bool sink = report.ok() && report.value().valid;
            (void)sink;
        });
    }

    return 0;
}
