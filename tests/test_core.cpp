#include <catch2/catch_test_macros.hpp>
#include "protocol/core.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <string>

using namespace consent;
using namespace consent::protocol;
using namespace test_helpers;

// A system and an agent agree on scheduling access, the agent is issued a
// one-shot PIN, uses it, and both sides of the exchange are audited.
TEST_CASE("Scheduling consent end to end", "[core][e2e]") {
    TestCore t;
    auto acme = make_party("system:acme");
    auto scheduler = make_party("agent:scheduler");

    // --- Contract ---
    auto proposed = t.core.create_contract(acme.agent_id, scheduler.agent_id, scheduling_terms());
    REQUIRE(proposed.ok());
    REQUIRE(proposed->status == ContractStatus::Proposed);
    const std::string contract_id = proposed->id;
    const std::string hash = proposed->content_hash;

    t.clock.advance(std::chrono::seconds(5));
    REQUIRE(t.core.sign_contract(contract_id, acme.agent_id, acme.sign(hash),
                                 acme.public_key_pem).ok());
    t.clock.advance(std::chrono::seconds(5));
    auto active = t.core.sign_contract(contract_id, scheduler.agent_id, scheduler.sign(hash),
                                       scheduler.public_key_pem);
    REQUIRE(active.ok());
    REQUIRE(active->status == ContractStatus::Active);

    // --- PIN ---
    auto scope = make_scope({"appointment"}, {"read"});
    auto issued = t.core.create_pin(scheduler.agent_id, contract_id, scope, true, 60);
    REQUIRE(issued.ok());
    REQUIRE(issued->pin.expires_at - issued->pin.issued_at == std::chrono::seconds(60));

    auto grant = t.core.validate_pin(issued->pin.id, issued->credential, scope);
    REQUIRE(grant.ok());
    REQUIRE(grant->contract_id == contract_id);
    REQUIRE(grant->agent_id == scheduler.agent_id);
    REQUIRE(grant->consumed);

    REQUIRE(t.core.validate_pin(issued->pin.id, issued->credential, scope).kind() ==
            ErrorKind::AlreadyUsed);

    // --- Audit ---
    AuditAppendRequest req;
    req.request_id = "txn-001";
    req.contract_id = contract_id;
    req.pin_id = issued->pin.id;
    req.action = AuditAction::Request;
    req.status = AuditStatus::Sent;
    req.target_system = acme.agent_id;
    req.data_types = {"appointment"};

    auto first = t.core.append_audit_log(scheduler.agent_id, req);
    REQUIRE(first.ok());
    REQUIRE(first->prev_hash == GENESIS_HASH);

    t.clock.advance(std::chrono::milliseconds(250));
    req.action = AuditAction::Response;
    req.status = AuditStatus::Received;
    req.metadata = {{"records", 3}};
    auto second = t.core.append_audit_log(scheduler.agent_id, req);
    REQUIRE(second.ok());
    REQUIRE(second->prev_hash == first->entry_hash);

    auto report = t.core.verify_audit_chain(scheduler.agent_id);
    REQUIRE(report.ok());
    REQUIRE(report->valid);
    REQUIRE(report->entries_checked == 2);
    REQUIRE(report->to_status().ok());

    AuditQuery query;
    query.filter.contract_id = contract_id;
    auto page = t.core.query_audit_logs(query);
    REQUIRE(page.ok());
    REQUIRE(page->total == 2);
    REQUIRE(page->entries.front().log_id == second->log_id);

    // --- Teardown ---
    REQUIRE(t.core.revoke_contract(contract_id, acme.agent_id, "study complete").ok());

    auto late = t.core.create_pin(scheduler.agent_id, contract_id, scope, true);
    REQUIRE(late.kind() == ErrorKind::InvalidState);
}

TEST_CASE("ConsentCore uses the configured PIN lifetime", "[core]") {
    CoreConfig config = make_config();
    config.pin_ttl_seconds = 300;
    TestCore t(config);
    REQUIRE(t.core.config().pin_ttl_seconds == 300);

    auto a = make_party("system:acme");
    auto b = make_party("agent:scheduler");
    auto contract = make_active_contract(t.core, a, b);

    auto issued = t.core.create_pin(b.agent_id, contract.id, make_scope({"appointment"}, {"read"}), false);
    REQUIRE(issued.ok());
    REQUIRE(issued->pin.expires_at - issued->pin.issued_at == std::chrono::seconds(300));
}

TEST_CASE("Results carry stable error names", "[core][errors]") {
    REQUIRE(std::string(error_kind_name(ErrorKind::ScopeExceeded)) == "SCOPE_EXCEEDED");
    REQUIRE(std::string(error_kind_name(ErrorKind::LockContention)) == "LOCK_CONTENTION");
    REQUIRE(is_retryable(ErrorKind::LockContention));
    REQUIRE_FALSE(is_retryable(ErrorKind::AlreadyUsed));

    Result<int> failed = make_error(ErrorKind::NotFound, "nothing here");
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.kind() == ErrorKind::NotFound);
    REQUIRE_THROWS_AS(failed.value(), BadResultAccess);

    Result<int> fine = 7;
    REQUIRE(fine.kind() == ErrorKind::None);
    REQUIRE(fine.value() == 7);
}
