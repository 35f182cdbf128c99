/* SPDX-License-Identifier: MIT */
/*
 * Homelab IPv4 Tests
 * Tests for address, CIDR, port and endpoint parsing
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

using namespace homelab;
using namespace dp;

TEST_SUITE("IPv4 - Port") {

    TEST_CASE("Valid ports") {
        CHECK(net::parse_port("1").value() == 1);
        CHECK(net::parse_port("51820").value() == 51820);
        CHECK(net::parse_port("65535").value() == 65535);
    }

    TEST_CASE("Invalid ports") {
        CHECK(net::parse_port("").is_err());
        CHECK(net::parse_port("0").is_err());
        CHECK(net::parse_port("65536").is_err());
        CHECK(net::parse_port("80a").is_err());
        CHECK(net::parse_port("-1").is_err());
    }

}

TEST_SUITE("IPv4 - Address") {

    TEST_CASE("Parse and format") {
        auto addr = net::parse_ipv4("10.253.0.1");
        REQUIRE(addr.is_ok());
        CHECK(addr.value() == 0x0AFD0001u);
        CHECK(net::format_ipv4(addr.value()) == "10.253.0.1");
        CHECK(net::format_ipv4(0) == "0.0.0.0");
        CHECK(net::format_ipv4(0xFFFFFFFFu) == "255.255.255.255");
    }

    TEST_CASE("Strict parsing") {
        CHECK_FALSE(net::is_ipv4(""));
        CHECK_FALSE(net::is_ipv4("10.0.0"));
        CHECK_FALSE(net::is_ipv4("10.0.0.1.2"));
        CHECK_FALSE(net::is_ipv4("10.0.0.256"));
        CHECK_FALSE(net::is_ipv4("10.0.0.01"));
        CHECK_FALSE(net::is_ipv4("10.0.0.1 "));
        CHECK_FALSE(net::is_ipv4("a.b.c.d"));
        CHECK(net::is_ipv4("0.0.0.0"));
    }

}

TEST_SUITE("IPv4 - CIDR") {

    TEST_CASE("Parse keeps the host address") {
        auto cidr = net::parse_cidr("10.253.0.1/24");
        REQUIRE(cidr.is_ok());
        CHECK(cidr.value().prefix == 24);
        CHECK(net::format_ipv4(cidr.value().address) == "10.253.0.1");
        CHECK(net::format_ipv4(cidr.value().network()) == "10.253.0.0");
        CHECK(net::format_ipv4(cidr.value().broadcast()) == "10.253.0.255");
        CHECK(cidr.value().host_offset() == 1);
        CHECK(cidr.value().size() == 256);
        CHECK(cidr.value().to_string() == "10.253.0.1/24");
        CHECK(cidr.value().network_string() == "10.253.0.0/24");
    }

    TEST_CASE("Contains") {
        auto cidr = net::parse_cidr("192.168.1.0/30").value();
        CHECK(cidr.contains(net::parse_ipv4("192.168.1.3").value()));
        CHECK_FALSE(cidr.contains(net::parse_ipv4("192.168.1.4").value()));
    }

    TEST_CASE("Edge prefixes") {
        auto all = net::parse_cidr("0.0.0.0/0");
        REQUIRE(all.is_ok());
        CHECK(all.value().mask() == 0);
        CHECK(all.value().size() == 4294967296ULL);

        auto host = net::parse_cidr("10.0.0.5/32");
        REQUIRE(host.is_ok());
        CHECK(host.value().size() == 1);
    }

    TEST_CASE("Invalid CIDR") {
        CHECK(net::parse_cidr("10.0.0.1").is_err());
        CHECK(net::parse_cidr("10.0.0.1/").is_err());
        CHECK(net::parse_cidr("10.0.0.1/33").is_err());
        CHECK(net::parse_cidr("10.0.0.1/024").is_err());
        CHECK(net::parse_cidr("10.0.0/24").is_err());
        CHECK(net::parse_cidr("fd00::1/64").is_err());
    }

    TEST_CASE("Address or CIDR") {
        auto bare = net::parse_address_or_cidr("10.0.0.7");
        REQUIRE(bare.is_ok());
        CHECK(bare.value().prefix == 32);
        CHECK(net::parse_address_or_cidr("10.0.0.0/8").value().prefix == 8);
    }

    TEST_CASE("Address lists") {
        CHECK(net::validate_address_list("10.0.0.0/24, 192.168.1.10").is_ok());
        CHECK(net::validate_address_list("").is_err());
        CHECK(net::validate_address_list("10.0.0.0/24, nope").is_err());
        CHECK(net::validate_address_list("10.0.0.0/24,::/0").is_err());
    }

}

TEST_SUITE("IPv4 - Endpoint") {

    TEST_CASE("Hostnames") {
        CHECK(net::is_valid_hostname("vpn.example.com"));
        CHECK(net::is_valid_hostname("nas"));
        CHECK_FALSE(net::is_valid_hostname(""));
        CHECK_FALSE(net::is_valid_hostname("-bad.example.com"));
        CHECK_FALSE(net::is_valid_hostname("bad-.example.com"));
        CHECK_FALSE(net::is_valid_hostname("a..b"));
        CHECK_FALSE(net::is_valid_hostname("under_score.com"));
    }

    TEST_CASE("Endpoints") {
        CHECK(net::validate_endpoint("vpn.example.com:51820").is_ok());
        CHECK(net::validate_endpoint("203.0.113.5:51820").is_ok());
        CHECK(net::validate_endpoint("").is_err());
        CHECK(net::validate_endpoint("vpn.example.com").is_err());
        CHECK(net::validate_endpoint(":51820").is_err());
        CHECK(net::validate_endpoint("vpn.example.com:0").is_err());
        CHECK(net::validate_endpoint("300.1.1.1:51820").is_err());
        CHECK(net::validate_endpoint("bad host:51820").is_err());
    }

}
