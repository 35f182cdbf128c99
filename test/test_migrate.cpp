/* SPDX-License-Identifier: MIT */
/*
 * Homelab Marker Migration Tests
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

#include "test_helpers.hpp"

using namespace homelab;
using namespace dp;
using homelab_test::TempDir;

TEST_SUITE("Migrate - Canonical Marker") {

    TEST_CASE("Nothing present") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete",
                                                {"wireguard-configured", "wireguard-skipped"});
        REQUIRE(res.is_ok());
        CHECK_FALSE(res.value());
        CHECK_FALSE(store.is_complete("wireguard-setup-complete"));
    }

    TEST_CASE("Canonical already present") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("wireguard-setup-complete").is_ok());
        REQUIRE(store.mark_complete("wireguard-configured").is_ok());

        auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete", {"wireguard-configured"});
        REQUIRE(res.is_ok());
        CHECK(res.value());
        // Legacy marker is left alone when no migration happened
        CHECK(store.is_complete("wireguard-configured"));
    }

    TEST_CASE("Legacy marker is migrated") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("wireguard-skipped").is_ok());

        auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete",
                                                {"wireguard-configured", "wireguard-skipped"});
        REQUIRE(res.is_ok());
        CHECK(res.value());
        CHECK(store.is_complete("wireguard-setup-complete"));
        CHECK_FALSE(store.is_complete("wireguard-skipped"));
    }

    TEST_CASE("Migration is idempotent") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("wireguard-configured").is_ok());

        for (int i = 0; i < 3; ++i) {
            auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete", {"wireguard-configured"});
            REQUIRE(res.is_ok());
            CHECK(res.value());
        }
        auto markers = store.list_markers();
        REQUIRE(markers.is_ok());
        REQUIRE(markers.value().size() == 1);
        CHECK(markers.value()[0] == "wireguard-setup-complete");
    }

    TEST_CASE("Empty and self-referencing legacy names are ignored") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        Vector<String> legacy;
        legacy.push_back("");
        legacy.push_back("wireguard-setup-complete");

        auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete", legacy);
        REQUIRE(res.is_ok());
        CHECK_FALSE(res.value());
        CHECK(store.list_markers().value().empty());
    }

    TEST_CASE("Invalid canonical name fails when a legacy marker exists") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("old-marker").is_ok());

        auto res = cfg::ensure_canonical_marker(store, "../escape", {"old-marker"});
        REQUIRE(res.is_err());
        CHECK(err::is_validation(res.error()));
        CHECK(store.is_complete("old-marker"));
    }

    TEST_CASE("Canonical created by someone else leaves legacy cleanup to them") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("wireguard-configured").is_ok());

        // Another process wins the exclusive create between our checks
        auto won = store.mark_complete_if_not_exists("wireguard-setup-complete");
        REQUIRE(won.is_ok());
        CHECK(won.value());

        auto res = cfg::ensure_canonical_marker(store, "wireguard-setup-complete", {"wireguard-configured"});
        REQUIRE(res.is_ok());
        CHECK(res.value());
        CHECK(store.is_complete("wireguard-configured"));
    }

}
