/* SPDX-License-Identifier: MIT */
/*
 * Homelab Core Types Tests
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

using namespace homelab;
using namespace dp;

TEST_SUITE("Core Types") {

    TEST_CASE("to_str") {
        CHECK(to_str(static_cast<u32>(0)) == "0");
        CHECK(to_str(static_cast<u16>(51820)) == "51820");
        CHECK(to_str(static_cast<i32>(-25)) == "-25");
        CHECK(to_str(static_cast<u64>(18446744073709551615ULL)) == "18446744073709551615");
    }

    TEST_CASE("parse_uint is strict") {
        auto ok = parse_uint("254", 255);
        REQUIRE(ok.is_ok());
        CHECK(ok.value() == 254);

        CHECK(parse_uint("", 10).is_err());
        CHECK(parse_uint("-1", 10).is_err());
        CHECK(parse_uint("12a", 100).is_err());
        CHECK(parse_uint("256", 255).is_err());
    }

    TEST_CASE("StepState names") {
        CHECK(String(step_state_to_string(StepState::Pending)) == "pending");
        CHECK(String(step_state_to_string(StepState::Completed)) == "completed");
        CHECK(String(step_state_to_string(StepState::Failed)) == "failed");
    }

    TEST_CASE("Defaults") {
        CHECK(DEFAULT_LISTEN_PORT == 51820);
        CHECK(DEFAULT_KEEPALIVE == 25);
        CHECK(String(DEFAULT_WG_ADDRESS) == "10.253.0.1/24");
    }

}

TEST_SUITE("Core Types - String Helpers") {

    TEST_CASE("trim") {
        CHECK(str::trim("  a b \t\r\n") == "a b");
        CHECK(str::trim("   ").empty());
    }

    TEST_CASE("split drops empty parts") {
        auto parts = str::split(" 1.1.1.1 ,, 8.8.8.8 ,", ',');
        REQUIRE(parts.size() == 2);
        CHECK(parts[0] == "1.1.1.1");
        CHECK(parts[1] == "8.8.8.8");
    }

    TEST_CASE("join") {
        Vector<String> parts;
        parts.push_back("media");
        parts.push_back("web");
        CHECK(str::join(parts, " ") == "media web");
        CHECK(str::join(Vector<String>(), ", ").empty());
    }

    TEST_CASE("starts_with and contains_any") {
        CHECK(str::starts_with("wg genkey", "wg"));
        CHECK_FALSE(str::starts_with("w", "wg"));
        CHECK(str::contains_any("a/b", "/\\"));
        CHECK_FALSE(str::contains_any("ab", "/\\"));
    }

}

TEST_SUITE("Core Types - Time") {

    TEST_CASE("format_rfc3339") {
        CHECK(homelab::time::format_rfc3339(0) == "1970-01-01T00:00:00Z");
        CHECK(homelab::time::format_rfc3339(1700000000) == "2023-11-14T22:13:20Z");
    }

    TEST_CASE("now_unix is after 2020") { CHECK(homelab::time::now_unix() > 1577836800); }

}
