#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "test_helpers.hpp"

#include <string>

using namespace consent;
using namespace test_helpers;

TEST_CASE("CoreConfig defaults", "[config]") {
    CoreConfig config;
    REQUIRE(config.pin_ttl_seconds == 60);
    REQUIRE(config.audit_query_default_limit == 100);
    REQUIRE(config.audit_query_max_limit == 1000);
    REQUIRE(config.log_level == log::Level::Info);

    // no signing key yet
    REQUIRE(config.validate().kind() == ErrorKind::InvalidArgument);
}

TEST_CASE("CoreConfig validate", "[config]") {
    CoreConfig config = make_config();
    REQUIRE(config.validate().ok());

    SECTION("short signing key") {
        config.pin_signing_key = random_bytes(31);
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("non-positive ttl") {
        config.pin_ttl_seconds = 0;
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("default limit above max") {
        config.audit_query_default_limit = 2000;
        REQUIRE_FALSE(config.validate().ok());
    }
}

TEST_CASE("CoreConfig env string round trip", "[config]") {
    CoreConfig config = make_config();
    config.pin_ttl_seconds = 120;
    config.audit_query_default_limit = 50;
    config.log_level = log::Level::Debug;

    std::string env = config.to_env_string();
    REQUIRE(env.find("CONSENT_PIN_SIGNING_KEY=" + utils::bytes_to_hex(config.pin_signing_key)) !=
            std::string::npos);

    CoreConfig parsed = CoreConfig::from_env_string(env);
    REQUIRE(parsed.pin_signing_key == config.pin_signing_key);
    REQUIRE(parsed.pin_ttl_seconds == 120);
    REQUIRE(parsed.audit_query_default_limit == 50);
    REQUIRE(parsed.audit_query_max_limit == 1000);
    REQUIRE(parsed.log_level == log::Level::Debug);
}

TEST_CASE("CoreConfig from_env_string parsing rules", "[config]") {
    SECTION("comments, blank lines and unknown keys are skipped") {
        auto config = CoreConfig::from_env_string(
            "# consent core\n"
            "\n"
            "CONSENT_PIN_TTL_SECONDS = 30\n"
            "SOMETHING_ELSE=1\n"
            "CONSENT_LOG_LEVEL=WARNING\n");
        REQUIRE(config.pin_ttl_seconds == 30);
        REQUIRE(config.log_level == log::Level::Warn);
        REQUIRE(config.pin_signing_key.empty());
    }

    SECTION("malformed input throws ConfigError") {
        REQUIRE_THROWS_AS(CoreConfig::from_env_string("NOT_A_PAIR"), ConfigError);
        REQUIRE_THROWS_AS(CoreConfig::from_env_string("CONSENT_PIN_TTL_SECONDS=soon"), ConfigError);
        REQUIRE_THROWS_AS(CoreConfig::from_env_string("CONSENT_PIN_TTL_SECONDS=10s"), ConfigError);
        REQUIRE_THROWS_AS(CoreConfig::from_env_string("CONSENT_PIN_SIGNING_KEY=xyz"), ConfigError);
        REQUIRE_THROWS_AS(CoreConfig::from_env_string("CONSENT_LOG_LEVEL=loud"), ConfigError);
    }
}

TEST_CASE("ConsentCore refuses an invalid configuration", "[config]") {
    store::MemoryStore db;
    CoreConfig config;
    config.pin_signing_key = random_bytes(8);
    REQUIRE_THROWS_AS(ConsentCore(db, config), ConfigError);
}
