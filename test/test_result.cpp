/* SPDX-License-Identifier: MIT */
/*
 * Homelab Result Tests
 * Tests for result types and error helpers
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

// Use explicit namespace to avoid ambiguity with datapod
namespace hl = homelab;

TEST_SUITE("Result - Type Aliases") {

    TEST_CASE("Res<T> ok value") {
        hl::Res<hl::i32> res = hl::result::ok(42);
        CHECK(res.is_ok());
        CHECK(res.value() == 42);
    }

    TEST_CASE("Res<T> error value") {
        hl::Res<hl::i32> res = hl::result::err(hl::err::invalid("test error"));
        CHECK(res.is_err());
        CHECK_FALSE(res.is_ok());
    }

    TEST_CASE("VoidRes ok") {
        hl::VoidRes res = hl::result::ok();
        CHECK(res.is_ok());
    }

}

TEST_SUITE("Result - Error Helpers") {

    TEST_CASE("err::invalid is a validation error") {
        hl::Error e = hl::err::invalid("bad input");
        CHECK(e.code == hl::Error::INVALID_ARGUMENT);
        CHECK(hl::err::is_validation(e));
        CHECK_FALSE(hl::err::is_io(e));
    }

    TEST_CASE("err::io_at names the path") {
        hl::Error e = hl::err::io_at("Failed to open", "/etc/x");
        CHECK(e.code == hl::Error::IO_ERROR);
        CHECK(e.message == "Failed to open: /etc/x");
    }

    TEST_CASE("err::exhausted maps to out of range") {
        hl::Error e = hl::err::exhausted("no addresses");
        CHECK(e.code == hl::Error::OUT_OF_RANGE);
        CHECK(hl::err::is_exhausted(e));
    }

    TEST_CASE("err::command carries program and output") {
        hl::Error e = hl::err::command("wg", "permission denied");
        CHECK(hl::err::is_io(e));
        CHECK(e.message == "command 'wg' failed: permission denied");

        hl::Error quiet = hl::err::command("wg", "");
        CHECK(quiet.message == "command 'wg' failed");
    }

    TEST_CASE("err::wrap keeps the code") {
        hl::Error inner = hl::err::not_found("missing");
        hl::Error wrapped = hl::err::wrap("step user failed", inner);
        CHECK(hl::err::is_not_found(wrapped));
        CHECK(wrapped.message == "step user failed: missing");
    }

}
