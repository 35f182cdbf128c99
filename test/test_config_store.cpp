/* SPDX-License-Identifier: MIT */
/*
 * Homelab Config Store Tests
 * Tests for key/value persistence and completion markers
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

#include "test_helpers.hpp"

using namespace homelab;
using namespace dp;
using homelab_test::TempDir;

TEST_SUITE("ConfigStore - Validation") {

    TEST_CASE("Marker names") {
        CHECK(cfg::validate_marker_name("preflight-complete").is_ok());
        CHECK(cfg::validate_marker_name("").is_err());
        CHECK(cfg::validate_marker_name("../escape").is_err());
        CHECK(cfg::validate_marker_name("a/b").is_err());
        CHECK(cfg::validate_marker_name("a\\b").is_err());
        CHECK(cfg::validate_marker_name(".").is_err());
        CHECK(cfg::validate_marker_name("..").is_err());
    }

    TEST_CASE("Keys") {
        CHECK(cfg::validate_key("HOMELAB_USER").is_ok());
        CHECK(cfg::validate_key("").is_err());
        CHECK(cfg::validate_key("#KEY").is_err());
        CHECK(cfg::validate_key("A=B").is_err());
        CHECK(cfg::validate_key("A\nB").is_err());
        CHECK(cfg::validate_key(" KEY").is_err());
    }

    TEST_CASE("Values") {
        CHECK(cfg::validate_value("a=b c#d").is_ok());
        CHECK(cfg::validate_value("").is_ok());
        CHECK(cfg::validate_value("line\nbreak").is_err());
        CHECK(cfg::validate_value("cr\r").is_err());
    }

    TEST_CASE("Default paths") {
        auto paths = cfg::default_paths("/home/alice");
        CHECK(paths.config_file == "/home/alice/.homelab-setup.conf");
        CHECK(paths.marker_dir == "/home/alice/.local/homelab-setup");

        auto fallback = cfg::default_paths("");
        CHECK(fallback.config_file == "/var/home/core/.homelab-setup.conf");
    }

}

TEST_SUITE("ConfigStore - Key/Value") {

    TEST_CASE("Missing file is an empty store") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        CHECK(store.reload().is_ok());
        CHECK(store.get_all().empty());
        CHECK_FALSE(store.exists("HOMELAB_USER"));

        auto missing = store.get("HOMELAB_USER");
        REQUIRE(missing.is_err());
        CHECK(err::is_not_found(missing.error()));
    }

    TEST_CASE("Set persists immediately") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.set("HOMELAB_USER", "core").is_ok());

        cfg::ConfigStore other(cfg::default_paths(tmp.path()));
        auto value = other.get("HOMELAB_USER");
        REQUIRE(value.is_ok());
        CHECK(value.value() == "core");
    }

    TEST_CASE("Config file has mode 0600 and sorted keys") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.set("ZETA", "1").is_ok());
        REQUIRE(store.set("ALPHA", "2").is_ok());

        auto mode = sys::file_mode(store.path());
        REQUIRE(mode.is_ok());
        CHECK(mode.value() == 0600);

        auto content = sys::read_file(store.path());
        REQUIRE(content.is_ok());
        String text = content.value();
        CHECK(str::starts_with(text, cfg::CONFIG_HEADER));
        CHECK(text.find("# Generated: ") != String::npos);
        usize alpha = text.find("ALPHA=2");
        usize zeta = text.find("ZETA=1");
        REQUIRE(alpha != String::npos);
        REQUIRE(zeta != String::npos);
        CHECK(alpha < zeta);
    }

    TEST_CASE("Values round-trip verbatim") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.set("COMPOSE_COMMAND", "docker compose").is_ok());
        REQUIRE(store.set("WIREGUARD_PUBLIC_KEY", "hSDwCYkwp1R0i33ctD73Wg2/Og0mOBr066SpjqqbTmo=").is_ok());
        REQUIRE(store.set("PADDED", " spaced ").is_ok());
        REQUIRE(store.set("EMPTY", "").is_ok());

        cfg::ConfigStore reloaded(cfg::default_paths(tmp.path()));
        auto all = reloaded.get_all();
        CHECK(all.size() == 4);
        CHECK(reloaded.get("COMPOSE_COMMAND").value() == "docker compose");
        CHECK(reloaded.get("WIREGUARD_PUBLIC_KEY").value() == "hSDwCYkwp1R0i33ctD73Wg2/Og0mOBr066SpjqqbTmo=");
        CHECK(reloaded.get("PADDED").value() == " spaced ");
        CHECK(reloaded.exists("EMPTY"));
        CHECK(reloaded.get("EMPTY").value().empty());
    }

    TEST_CASE("Load skips comments, blank and malformed lines") {
        TempDir tmp;
        auto paths = cfg::default_paths(tmp.path());
        String content = "# comment\n\n  # indented comment\nHOMELAB_USER = core\r\nnot a pair\nPUID=1000\n";
        REQUIRE(sys::write_file_atomic(paths.config_file, content, 0600).is_ok());

        cfg::ConfigStore store(paths);
        REQUIRE(store.reload().is_ok());
        CHECK(store.get_all().size() == 2);
        CHECK(store.get("HOMELAB_USER").value() == " core");
        CHECK(store.get("PUID").value() == "1000");
    }

    TEST_CASE("Invalid keys and values are rejected") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        CHECK(err::is_validation(store.set("", "x").error()));
        CHECK(err::is_validation(store.set("A=B", "x").error()));
        CHECK(err::is_validation(store.set("KEY", "two\nlines").error()));
        CHECK_FALSE(sys::path_exists(store.path()));
    }

    TEST_CASE("get_or_default consults the defaults table") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        CHECK(store.get_or_default(cfg::keys::CONTAINER_RUNTIME, "x") == "docker");
        CHECK(store.get_or_default(cfg::keys::WIREGUARD_LISTEN_PORT, "x") == "51820");
        CHECK(store.get_or_default("UNKNOWN_KEY", "fallback") == "fallback");

        REQUIRE(store.set(cfg::keys::CONTAINER_RUNTIME, "podman").is_ok());
        CHECK(store.get_or_default(cfg::keys::CONTAINER_RUNTIME, "x") == "podman");
    }

    TEST_CASE("Remove and remove_config_file") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.set("A", "1").is_ok());
        REQUIRE(store.set("B", "2").is_ok());
        REQUIRE(store.remove("A").is_ok());
        CHECK(store.remove("NEVER_SET").is_ok());
        CHECK_FALSE(store.exists("A"));
        CHECK(store.exists("B"));

        REQUIRE(store.remove_config_file().is_ok());
        CHECK_FALSE(sys::path_exists(store.path()));
        CHECK_FALSE(store.exists("B"));
        CHECK(store.remove_config_file().is_ok());
    }

}

TEST_SUITE("ConfigStore - Markers") {

    TEST_CASE("mark_complete and is_complete") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        CHECK_FALSE(store.is_complete("user-setup-complete"));
        REQUIRE(store.mark_complete("user-setup-complete").is_ok());
        CHECK(store.is_complete("user-setup-complete"));
        CHECK(store.mark_complete("user-setup-complete").is_ok());

        auto mode = sys::file_mode(sys::join_path(store.marker_dir(), "user-setup-complete"));
        REQUIRE(mode.is_ok());
        CHECK(mode.value() == 0644);
    }

    TEST_CASE("Marker names that escape the directory are refused") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        auto res = store.mark_complete("../escape");
        REQUIRE(res.is_err());
        CHECK(err::is_validation(res.error()));
        CHECK_FALSE(sys::path_exists(tmp.sub(".local/escape")));
        CHECK_FALSE(store.is_complete("../escape"));
        CHECK(store.clear_marker("../escape").is_err());
        CHECK(store.mark_complete_if_not_exists("a/b").is_err());
    }

    TEST_CASE("mark_complete_if_not_exists creates once") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        auto first = store.mark_complete_if_not_exists("wireguard-setup-complete");
        REQUIRE(first.is_ok());
        CHECK(first.value());

        auto second = store.mark_complete_if_not_exists("wireguard-setup-complete");
        REQUIRE(second.is_ok());
        CHECK_FALSE(second.value());
        CHECK(store.is_complete("wireguard-setup-complete"));
    }

    TEST_CASE("clear_marker is idempotent") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.mark_complete("nfs-setup-complete").is_ok());
        CHECK(store.clear_marker("nfs-setup-complete").is_ok());
        CHECK_FALSE(store.is_complete("nfs-setup-complete"));
        CHECK(store.clear_marker("nfs-setup-complete").is_ok());
    }

    TEST_CASE("list_markers is sorted and clear_all_markers empties it") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));

        auto none = store.list_markers();
        REQUIRE(none.is_ok());
        CHECK(none.value().empty());

        REQUIRE(store.mark_complete("user-setup-complete").is_ok());
        REQUIRE(store.mark_complete("container-setup-complete").is_ok());
        REQUIRE(store.mark_complete("preflight-complete").is_ok());

        auto listed = store.list_markers();
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 3);
        CHECK(listed.value()[0] == "container-setup-complete");
        CHECK(listed.value()[1] == "preflight-complete");
        CHECK(listed.value()[2] == "user-setup-complete");

        REQUIRE(store.clear_all_markers().is_ok());
        CHECK(store.list_markers().value().empty());
        CHECK(store.clear_all_markers().is_ok());
    }

    TEST_CASE("Markers do not touch config values") {
        TempDir tmp;
        cfg::ConfigStore store(cfg::default_paths(tmp.path()));
        REQUIRE(store.set("HOMELAB_USER", "core").is_ok());
        REQUIRE(store.mark_complete("user-setup-complete").is_ok());
        REQUIRE(store.clear_all_markers().is_ok());
        CHECK(store.get("HOMELAB_USER").value() == "core");
    }

}

TEST_SUITE("ConfigStore - Keys") {

    TEST_CASE("default_for") {
        auto port = cfg::default_for(cfg::keys::WIREGUARD_LISTEN_PORT);
        REQUIRE(port.has_value());
        CHECK(port.value() == "51820");
        CHECK_FALSE(cfg::default_for("HOMELAB_USER").has_value());
    }

    TEST_CASE("log_level_from_string") {
        CHECK(cfg::log_level_from_string("debug") == echo::Level::Debug);
        CHECK(cfg::log_level_from_string("warning") == echo::Level::Warn);
        CHECK(cfg::log_level_from_string("error") == echo::Level::Error);
        CHECK(cfg::log_level_from_string("critical") == echo::Level::Critical);
        CHECK(cfg::log_level_from_string("nonsense") == echo::Level::Info);
    }

}
