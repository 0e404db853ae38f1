#include <catch2/catch_test_macros.hpp>
#include "crypto/pin_signer.hpp"
#include "test_helpers.hpp"

#include <set>
#include <string>

using namespace consent;
using namespace test_helpers;

TEST_CASE("PinSigner matches the reference HMAC", "[crypto][pin_signer]") {
    crypto::PinSigner signer(Bytes(32, 'k'));
    REQUIRE(signer.sign("pin-1", "tok") == "BB8FFDPULSMCORnWHhIWwqIKGx91qdnsL2tzjdTfvBo=");
}

TEST_CASE("PinSigner verify", "[crypto][pin_signer]") {
    crypto::PinSigner signer(random_bytes(32));
    auto token = crypto::generate_pin_token();
    auto sig = signer.sign("pin-1", token);

    REQUIRE(signer.verify("pin-1", token, sig));
    REQUIRE_FALSE(signer.verify("pin-2", token, sig));
    REQUIRE_FALSE(signer.verify("pin-1", token + "x", sig));
    REQUIRE_FALSE(signer.verify("pin-1", token, sig.substr(1)));
    REQUIRE_FALSE(signer.verify("pin-1", token, ""));

    crypto::PinSigner other(random_bytes(32));
    REQUIRE_FALSE(other.verify("pin-1", token, sig));
}

TEST_CASE("PinSigner rejects an empty key", "[crypto][pin_signer]") {
    REQUIRE_THROWS_AS(crypto::PinSigner(Bytes{}), std::invalid_argument);
}

TEST_CASE("generate_pin_token", "[crypto][pin_signer]") {
    std::set<std::string> seen;
    for (int i = 0; i < 50; i++) {
        auto token = crypto::generate_pin_token();
        // 32 bytes, unpadded base64url
        REQUIRE(token.size() == 43);
        REQUIRE(token.find('=') == std::string::npos);
        REQUIRE(token.find('+') == std::string::npos);
        REQUIRE(token.find('/') == std::string::npos);
        seen.insert(token);
    }
    REQUIRE(seen.size() == 50);
}

TEST_CASE("Credential compose and split", "[crypto][pin_signer]") {
    std::string token;
    std::string sig;

    SECTION("splits at the last separator") {
        REQUIRE(crypto::split_credential("a.b.c", token, sig));
        REQUIRE(token == "a.b");
        REQUIRE(sig == "c");
    }

    SECTION("round trip") {
        auto cred = crypto::compose_credential("tok", "sig=");
        REQUIRE(cred == "tok.sig=");
        REQUIRE(crypto::split_credential(cred, token, sig));
        REQUIRE(token == "tok");
        REQUIRE(sig == "sig=");
    }

    SECTION("no separator") {
        REQUIRE_FALSE(crypto::split_credential("nodots", token, sig));
    }
}
