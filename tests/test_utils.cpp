#include <catch2/catch_test_macros.hpp>
#include "helpers.hpp"

#include <chrono>
#include <set>
#include <string>

using namespace consent;
using namespace consent::utils;

TEST_CASE("Hex encoding", "[utils]") {
    Bytes data = {0x00, 0x01, 0xab, 0xff};
    REQUIRE(bytes_to_hex(data) == "0001abff");
    REQUIRE(hex_to_bytes("0001abff") == data);
    REQUIRE(hex_to_bytes("0001ABFF") == data);

    REQUIRE_THROWS_AS(hex_to_bytes("abc"), DecodeError);
    REQUIRE_THROWS_AS(hex_to_bytes("zz"), DecodeError);
}

TEST_CASE("Base64 encoding", "[utils]") {
    Bytes data = to_bytes("consent?>");

    REQUIRE(base64_encode(data) == "Y29uc2VudD8+");
    REQUIRE(base64url_encode(data, true) == "Y29uc2VudD8-");
    REQUIRE(base64url_encode(to_bytes("ab"), true) == "YWI=");
    REQUIRE(base64url_encode(to_bytes("ab"), false) == "YWI");

    REQUIRE(base64_decode("Y29uc2VudD8+") == data);
    REQUIRE(base64_decode("").empty());
    REQUIRE_THROWS_AS(base64_decode("Y29uc2VudD8-"), DecodeError);
    REQUIRE_THROWS_AS(base64_decode("not base64!"), DecodeError);
}

TEST_CASE("SHA-256", "[utils]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(sha256(to_bytes("abc")).size() == 32);
}

TEST_CASE("UUID generation", "[utils]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; i++) {
        std::string id = generate_uuid();
        REQUIRE(is_uuid(id));
        REQUIRE(id[14] == '4');
        seen.insert(id);
    }
    REQUIRE(seen.size() == 100);

    REQUIRE_FALSE(is_uuid(""));
    REQUIRE_FALSE(is_uuid("c0ffee"));
    REQUIRE_FALSE(is_uuid("123e4567-e89b-12d3-a456-42661417400g"));
    REQUIRE_FALSE(is_uuid("123e4567xe89b-12d3-a456-426614174000"));
}

TEST_CASE("Timestamp formatting", "[utils][time]") {
    Timestamp ts = parse_timestamp("2025-06-01T00:00:00+00:00");

    SECTION("whole seconds omit the fraction") {
        REQUIRE(format_timestamp(ts) == "2025-06-01T00:00:00+00:00");
    }

    SECTION("microseconds are printed with six digits") {
        REQUIRE(format_timestamp(ts + std::chrono::microseconds(1500)) ==
                "2025-06-01T00:00:00.001500+00:00");
    }

    SECTION("formatted text parses back to the same instant") {
        Timestamp t = now_utc();
        REQUIRE(parse_timestamp(format_timestamp(t)) == t);
    }
}

TEST_CASE("Timestamp parsing", "[utils][time]") {
    Timestamp utc = parse_timestamp("2025-01-15T12:00:00+00:00");

    REQUIRE(parse_timestamp("2025-01-15T12:00:00Z") == utc);
    REQUIRE(parse_timestamp("2025-01-15T14:30:00+02:30") == utc);
    REQUIRE(parse_timestamp("2025-01-15T07:00:00-05:00") == utc);
    REQUIRE(parse_timestamp("2025-01-15 12:00:00+00:00") == utc);
    REQUIRE(parse_timestamp("2025-01-15T12:00:00.5Z") == utc + std::chrono::milliseconds(500));

    REQUIRE(utc.time_since_epoch() == std::chrono::seconds(1736942400));

    SECTION("malformed input throws DecodeError") {
        REQUIRE_THROWS_AS(parse_timestamp(""), DecodeError);
        REQUIRE_THROWS_AS(parse_timestamp("2025-01-15"), DecodeError);
        REQUIRE_THROWS_AS(parse_timestamp("2025-01-15T12:00:00"), DecodeError);
        REQUIRE_THROWS_AS(parse_timestamp("2025-13-15T12:00:00Z"), DecodeError);
        REQUIRE_THROWS_AS(parse_timestamp("2025-01-15T12:00:00.Z"), DecodeError);
        REQUIRE_THROWS_AS(parse_timestamp("2025-01-15T12:00:00Zjunk"), DecodeError);
    }
}
