#include <catch2/catch_test_macros.hpp>
#include "consent/consent_c.h"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace test_helpers;
using nlohmann::json;

// Helper to create a test config env string
static std::string create_test_env_string() {
    init_crypto();
    return "CONSENT_PIN_SIGNING_KEY=" + consent::utils::bytes_to_hex(random_bytes(32)) + "\n"
           "CONSENT_LOG_LEVEL=off\n";
}

// Takes ownership of a returned string and parses it.
static json take_json(char* out) {
    REQUIRE(out != nullptr);
    json j = json::parse(out);
    consent_free_string(out);
    return j;
}

static std::string error_code(const json& j) {
    return j.at("error").at("code").get<std::string>();
}

TEST_CASE("consent_init initializes library", "[c_api]") {
    REQUIRE(consent_init() == CONSENT_OK);
    REQUIRE(consent_init() == CONSENT_OK);
}

TEST_CASE("Status names", "[c_api]") {
    REQUIRE(std::string(consent_status_name(CONSENT_OK)) == "OK");
    REQUIRE(std::string(consent_status_name(CONSENT_ERR_ALREADY_USED)) == "ALREADY_USED");
    REQUIRE(std::string(consent_status_name(12345)) == "UNKNOWN");
    REQUIRE(consent_status_is_retryable(CONSENT_ERR_LOCK_CONTENTION) == 1);
    REQUIRE(consent_status_is_retryable(CONSENT_ERR_EXPIRED) == 0);
}

TEST_CASE("Core creation", "[c_api]") {
    consent_init();

    SECTION("from env string") {
        consent_core_t* core = nullptr;
        REQUIRE(consent_core_create(create_test_env_string().c_str(), &core) == CONSENT_OK);
        REQUIRE(core != nullptr);
        consent_core_destroy(core);
    }

    SECTION("short signing key is rejected") {
        consent_core_t* core = nullptr;
        REQUIRE(consent_core_create("CONSENT_PIN_SIGNING_KEY=00ff", &core) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(core == nullptr);
    }

    SECTION("malformed env string is rejected") {
        consent_core_t* core = nullptr;
        REQUIRE(consent_core_create("INVALID_CONTENT", &core) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(core == nullptr);
    }

    SECTION("NULL out pointer") {
        REQUIRE(consent_core_create(create_test_env_string().c_str(), nullptr) == CONSENT_ERR_INVALID_ARG);
    }
}

TEST_CASE("Full consent flow through the C API", "[c_api]") {
    consent_init();
    consent_core_t* core = nullptr;
    REQUIRE(consent_core_create(create_test_env_string().c_str(), &core) == CONSENT_OK);

    auto acme = make_party("system:acme");
    auto scheduler = make_party("agent:scheduler");
    char* out = nullptr;

    // Propose
    json request = {
        {"counterparty", {{"agent_id", scheduler.agent_id}}},
        {"terms", {{"data_types", {"appointment"}},
                   {"allowed_actions", {"read"}},
                   {"purpose", "scheduling"},
                   {"retention_days", 30}}},
        {"expires_at", nullptr},
    };
    REQUIRE(consent_create_contract(core, acme.agent_id.c_str(), request.dump().c_str(), &out) == CONSENT_OK);
    json contract = take_json(out);
    REQUIRE(contract["status"] == "proposed");
    REQUIRE(contract["content_hash"] ==
            "381d82555932c23faa96db0e28c09007948aaa9a499aa41d51277110d01874ea");
    const std::string contract_id = contract["contract_id"];
    const std::string hash = contract["content_hash"];

    // Sign by both parties
    REQUIRE(consent_sign_contract(core, contract_id.c_str(), acme.agent_id.c_str(),
                                  acme.sign(hash).c_str(), acme.public_key_pem.c_str(), &out) == CONSENT_OK);
    consent_free_string(out);

    SECTION("bad signature reports INVALID_SIGNATURE") {
        int rc = consent_sign_contract(core, contract_id.c_str(), scheduler.agent_id.c_str(),
                                       acme.sign(hash).c_str(), scheduler.public_key_pem.c_str(), &out);
        REQUIRE(rc == CONSENT_ERR_INVALID_SIGNATURE);
        REQUIRE(error_code(take_json(out)) == "INVALID_SIGNATURE");
    }

    SECTION("activate, issue, validate, audit") {
        REQUIRE(consent_sign_contract(core, contract_id.c_str(), scheduler.agent_id.c_str(),
                                      scheduler.sign(hash).c_str(), scheduler.public_key_pem.c_str(),
                                      &out) == CONSENT_OK);
        REQUIRE(take_json(out)["status"] == "active");

        json pin_request = {
            {"contract_id", contract_id},
            {"scope", {{"data_types", {"appointment"}}, {"actions", {"read"}}}},
            {"single_use", true},
            {"ttl_seconds", 60},
        };
        REQUIRE(consent_create_pin(core, scheduler.agent_id.c_str(), pin_request.dump().c_str(), &out) == CONSENT_OK);
        json issued = take_json(out);
        const std::string pin_id = issued["pin"]["pin_id"];
        const std::string credential = issued["credential"];
        REQUIRE_FALSE(issued["pin"].contains("signature"));

        const std::string scope = R"({"data_types":["appointment"],"actions":["read"]})";
        REQUIRE(consent_validate_pin(core, pin_id.c_str(), credential.c_str(), scope.c_str(), &out) == CONSENT_OK);
        json grant = take_json(out);
        REQUIRE(grant["valid"] == true);
        REQUIRE(grant["contract_id"] == contract_id);

        REQUIRE(consent_validate_pin(core, pin_id.c_str(), credential.c_str(), scope.c_str(), &out) ==
                CONSENT_ERR_ALREADY_USED);
        REQUIRE(error_code(take_json(out)) == "ALREADY_USED");

        json audit_request = {
            {"transaction_id", "txn-001"},
            {"contract_id", contract_id},
            {"pin_id", pin_id},
            {"action", "request"},
            {"status", "sent"},
            {"counterparty", {{"agent_id", acme.agent_id}}},
            {"data_types", {"appointment"}},
            {"metadata", {{"attempt", 1}}},
        };
        REQUIRE(consent_append_audit_log(core, scheduler.agent_id.c_str(), audit_request.dump().c_str(), &out) ==
                CONSENT_OK);
        json entry = take_json(out);
        REQUIRE(entry["prev_hash"] == std::string(64, '0'));
        REQUIRE(entry["scope"] == json{{"data_types", {"appointment"}}});
        REQUIRE(entry["source"] == scheduler.agent_id);

        audit_request["action"] = "response";
        audit_request["status"] = "received";
        REQUIRE(consent_append_audit_log(core, scheduler.agent_id.c_str(), audit_request.dump().c_str(), &out) ==
                CONSENT_OK);
        REQUIRE(take_json(out)["prev_hash"] == entry["entry_hash"]);

        REQUIRE(consent_query_audit_logs(core, R"({"agent_id":"agent:scheduler","limit":1})", &out) == CONSENT_OK);
        json page = take_json(out);
        REQUIRE(page["total"] == 2);
        REQUIRE(page["logs"].size() == 1);
        REQUIRE(page["logs"][0]["action"] == "response");

        REQUIRE(consent_verify_audit_chain(core, scheduler.agent_id.c_str(), nullptr, &out) == CONSENT_OK);
        json report = take_json(out);
        REQUIRE(report["valid"] == true);
        REQUIRE(report["entries_checked"] == 2);

        REQUIRE(consent_revoke_contract(core, contract_id.c_str(), acme.agent_id.c_str(), "done", &out) ==
                CONSENT_OK);
        json revoked = take_json(out);
        REQUIRE(revoked["status"] == "revoked");
        REQUIRE(revoked["revocation_reason"] == "done");
    }

    consent_core_destroy(core);
}

TEST_CASE("C API rejects malformed input", "[c_api]") {
    consent_init();
    consent_core_t* core = nullptr;
    REQUIRE(consent_core_create(create_test_env_string().c_str(), &core) == CONSENT_OK);
    char* out = nullptr;

    SECTION("NULL arguments") {
        REQUIRE(consent_get_contract(nullptr, "id", &out) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(consent_get_contract(core, nullptr, &out) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(consent_get_contract(core, "id", nullptr) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(consent_validate_pin(core, "p", "c", nullptr, &out) == CONSENT_ERR_INVALID_ARG);
    }

    SECTION("unparseable JSON") {
        REQUIRE(consent_create_contract(core, "system:acme", "{not json", &out) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(error_code(take_json(out)) == "INVALID_ARGUMENT");
    }

    SECTION("missing required field") {
        REQUIRE(consent_create_pin(core, "agent:scheduler", R"({"contract_id":"x"})", &out) ==
                CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
    }

    SECTION("unknown audit action") {
        json req = {
            {"transaction_id", "t"},
            {"action", "delete"},
            {"status", "sent"},
            {"counterparty", {{"agent_id", "system:acme"}}},
        };
        REQUIRE(consent_append_audit_log(core, "agent:scheduler", req.dump().c_str(), &out) ==
                CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
    }

    SECTION("integers are never narrowed") {
        auto contract_with_retention = [&](const json& retention) {
            json req = {
                {"counterparty", {{"agent_id", "agent:scheduler"}}},
                {"terms", {{"data_types", {"appointment"}},
                           {"allowed_actions", {"read"}},
                           {"purpose", "scheduling"},
                           {"retention_days", retention}}},
            };
            return consent_create_contract(core, "system:acme", req.dump().c_str(), &out);
        };

        // 2^32 + 30 would wrap to 30 days
        REQUIRE(contract_with_retention(json(4294967326LL)) == CONSENT_ERR_INVALID_ARG);
        REQUIRE(error_code(take_json(out)) == "INVALID_ARGUMENT");
        REQUIRE(contract_with_retention(json(2.9)) == CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
        REQUIRE(contract_with_retention(json(-4294967266LL)) == CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);

        REQUIRE(contract_with_retention(json(30)) == CONSENT_OK);
        REQUIRE(take_json(out)["retention_days"] == 30);

        json pin_request = {
            {"contract_id", "missing"},
            {"scope", {{"data_types", {"appointment"}}, {"actions", {"read"}}}},
            {"ttl_seconds", 4294967356ULL},
        };
        REQUIRE(consent_create_pin(core, "agent:scheduler", pin_request.dump().c_str(), &out) ==
                CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);

        REQUIRE(consent_query_audit_logs(core, R"({"limit":4294967297})", &out) == CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
        REQUIRE(consent_query_audit_logs(core, R"({"offset":1.5})", &out) == CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
    }

    SECTION("bad timestamp") {
        REQUIRE(consent_query_audit_logs(core, R"({"start_time":"yesterday"})", &out) ==
                CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
    }

    SECTION("domain errors map to their codes") {
        REQUIRE(consent_get_contract(core, "missing", &out) == CONSENT_ERR_NOT_FOUND);
        json err = take_json(out);
        REQUIRE(error_code(err) == "NOT_FOUND");
        REQUIRE_FALSE(err["error"]["message"].get<std::string>().empty());

        REQUIRE(consent_query_audit_logs(core, R"({"limit":0})", &out) == CONSENT_ERR_INVALID_ARG);
        consent_free_string(out);
    }

    SECTION("empty expiry sweep") {
        REQUIRE(consent_expire_contracts(core, &out) == CONSENT_OK);
        REQUIRE(take_json(out) == json{{"expired", json::array()}});
    }

    consent_core_destroy(core);
}
