/* SPDX-License-Identifier: MIT */
/*
 * Homelab Orchestrator Tests
 * Tests for step ordering, resume, re-run and reset
 */

#include <doctest/doctest.h>
#include <homelab/homelab.hpp>

#include "test_helpers.hpp"

using namespace homelab;
using namespace dp;
using homelab_test::Fixture;

namespace {

    // Step that appends its short name to a log, optionally failing
    auto recording_step(const char *short_name, boolean optional, Vector<String> &log, boolean fail = false)
        -> runtime::Step {
        runtime::Step step;
        step.descriptor.name = String("Step ") + short_name;
        step.descriptor.short_name = short_name;
        step.descriptor.description = "test step";
        step.descriptor.marker = String(short_name) + "-complete";
        step.descriptor.optional = optional;
        String name(short_name);
        step.fn = [&log, name, fail](steps::StepContext &) -> VoidRes {
            log.push_back(name);
            if (fail) {
                return result::err(err::io("boom"));
            }
            return result::ok();
        };
        return step;
    }

    auto seven_steps(Vector<String> &log) -> Vector<runtime::Step> {
        Vector<runtime::Step> all;
        all.push_back(recording_step("a", false, log));
        all.push_back(recording_step("b", false, log));
        all.push_back(recording_step("c", false, log));
        all.push_back(recording_step("d", true, log));
        all.push_back(recording_step("e", false, log));
        all.push_back(recording_step("f", false, log));
        all.push_back(recording_step("g", false, log));
        return all;
    }

    auto joined(const Vector<String> &log) -> String { return str::join(log, ","); }

} // namespace

TEST_SUITE("Orchestrator - Registry") {

    TEST_CASE("Default steps in order") {
        auto all = runtime::default_steps();
        REQUIRE(all.size() == 7);
        CHECK(all[0].descriptor.short_name == "preflight");
        CHECK(all[1].descriptor.short_name == "user");
        CHECK(all[2].descriptor.short_name == "directory");
        CHECK(all[3].descriptor.short_name == "wireguard");
        CHECK(all[4].descriptor.short_name == "nfs");
        CHECK(all[5].descriptor.short_name == "container");
        CHECK(all[6].descriptor.short_name == "deployment");

        for (usize i = 0; i < all.size(); ++i) {
            CHECK(all[i].descriptor.optional == (i == 3));
        }
        CHECK(all[3].descriptor.marker == steps::markers::WIREGUARD);
        CHECK(all[3].legacy_markers.size() == 2);
        CHECK(all[6].descriptor.marker == "service-deployment-complete");
    }

    TEST_CASE("Lookup") {
        Fixture f;
        runtime::Orchestrator orch(f.ctx);
        CHECK(orch.get_all_steps().size() == 7);
        auto nfs = orch.find_step("nfs");
        REQUIRE(nfs.has_value());
        CHECK(nfs.value().name == "NFS Setup");
        CHECK_FALSE(orch.find_step("bogus").has_value());
    }

}

TEST_SUITE("Orchestrator - Run All") {

    TEST_CASE("Skipping optional steps runs the rest in order") {
        Fixture f;
        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));

        REQUIRE(orch.run_all(true).is_ok());
        CHECK(joined(log) == "a,b,c,e,f,g");
        CHECK(orch.state("d") == StepState::Pending);
        CHECK(orch.state("g") == StepState::Completed);
        CHECK_FALSE(f.store.is_complete("d-complete"));
        CHECK(orch.progress().first == 6);
        CHECK(orch.progress().second == 7);
    }

    TEST_CASE("Including optional steps") {
        Fixture f;
        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));
        REQUIRE(orch.run_all(false).is_ok());
        CHECK(joined(log) == "a,b,c,d,e,f,g");
    }

    TEST_CASE("Completed steps are skipped on resume") {
        Fixture f;
        REQUIRE(f.store.mark_complete("a-complete").is_ok());
        REQUIRE(f.store.mark_complete("b-complete").is_ok());

        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));
        CHECK(orch.state("a") == StepState::Completed);
        REQUIRE(orch.run_all(true).is_ok());
        CHECK(joined(log) == "c,e,f,g");
    }

    TEST_CASE("Failure stops the run and keeps earlier markers") {
        Fixture f;
        Vector<String> log;
        Vector<runtime::Step> all;
        all.push_back(recording_step("a", false, log));
        all.push_back(recording_step("b", false, log, true));
        all.push_back(recording_step("c", false, log));
        runtime::Orchestrator orch(f.ctx, all);

        auto res = orch.run_all(false);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "step b failed: boom");
        CHECK(err::is_io(res.error()));
        CHECK(joined(log) == "a,b");
        CHECK(orch.state("b") == StepState::Failed);
        CHECK(f.store.is_complete("a-complete"));
        CHECK_FALSE(f.store.is_complete("b-complete"));

        auto status = orch.status();
        CHECK(status[0].state == StepState::Completed);
        CHECK(status[1].state == StepState::Failed);
        CHECK(status[2].state == StepState::Pending);
    }

    TEST_CASE("Default sequence end to end") {
        Fixture f;
        // user, directory, nfs confirm, container runtime, services
        f.answers({"", "", "n", "", "media web"});
        runtime::Orchestrator orch(f.ctx);

        REQUIRE(orch.run_all(true).is_ok());
        CHECK(f.store.is_complete(steps::markers::PREFLIGHT));
        CHECK(f.store.is_complete(steps::markers::USER));
        CHECK(f.store.is_complete(steps::markers::DIRECTORY));
        CHECK_FALSE(f.store.is_complete(steps::markers::WIREGUARD));
        CHECK(f.store.is_complete(steps::markers::NFS));
        CHECK(f.store.is_complete(steps::markers::CONTAINER));
        CHECK(f.store.is_complete(steps::markers::DEPLOYMENT));

        CHECK(f.store.get(cfg::keys::HOMELAB_USER).value() == "core");
        CHECK(f.store.get(cfg::keys::CONTAINERS_BASE).value() == "/srv/containers");
        CHECK(f.store.get(cfg::keys::NFS_ENABLED).value() == "false");
        CHECK(f.store.get(cfg::keys::COMPOSE_COMMAND).value() == "docker compose");
        CHECK(f.store.get(cfg::keys::SELECTED_SERVICES).value() == "media web");
        CHECK(orch.progress().first == 6);
        CHECK(f.prompter.remaining() == 0);
    }

}

TEST_SUITE("Orchestrator - Run Step") {

    TEST_CASE("Unknown step") {
        Fixture f;
        runtime::Orchestrator orch(f.ctx);
        auto res = orch.run_step("bogus");
        REQUIRE(res.is_err());
        CHECK(err::is_validation(res.error()));
    }

    TEST_CASE("Runs a single step and marks it") {
        Fixture f;
        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));
        REQUIRE(orch.run_step("e").is_ok());
        CHECK(joined(log) == "e");
        CHECK(orch.is_step_complete("e-complete"));
    }

    TEST_CASE("Completed step is re-run only when confirmed") {
        Fixture f;
        REQUIRE(f.store.mark_complete("c-complete").is_ok());
        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));

        REQUIRE(orch.run_step("c").is_ok());
        CHECK(log.empty());
        CHECK(f.prompter.was_asked("Step c has already been completed. Run again?"));

        f.answers({"y"});
        REQUIRE(orch.run_step("c").is_ok());
        CHECK(joined(log) == "c");
        CHECK(f.store.is_complete("c-complete"));
    }

    TEST_CASE("Failed re-run leaves the step incomplete") {
        Fixture f;
        REQUIRE(f.store.mark_complete("x-complete").is_ok());
        Vector<String> log;
        Vector<runtime::Step> all;
        all.push_back(recording_step("x", false, log, true));
        runtime::Orchestrator orch(f.ctx, all);

        f.answers({"yes"});
        CHECK(orch.run_step("x").is_err());
        CHECK_FALSE(f.store.is_complete("x-complete"));
    }

}

TEST_SUITE("Orchestrator - Legacy Markers") {

    TEST_CASE("Legacy WireGuard marker counts as complete") {
        Fixture f;
        REQUIRE(f.store.mark_complete(steps::markers::WIREGUARD_LEGACY_CONFIGURED).is_ok());

        runtime::Orchestrator orch(f.ctx);
        CHECK(orch.state("wireguard") == StepState::Completed);
        CHECK(f.store.is_complete(steps::markers::WIREGUARD));
        CHECK_FALSE(f.store.is_complete(steps::markers::WIREGUARD_LEGACY_CONFIGURED));
        CHECK(orch.is_step_complete(steps::markers::WIREGUARD));
    }

    TEST_CASE("Skipped marker migrates too") {
        Fixture f;
        REQUIRE(f.store.mark_complete(steps::markers::WIREGUARD_LEGACY_SKIPPED).is_ok());
        runtime::Orchestrator orch(f.ctx);
        CHECK(orch.progress().first == 1);
        CHECK(f.store.list_markers().value().size() == 1);
    }

}

TEST_SUITE("Orchestrator - Reset") {

    TEST_CASE("Clears markers and keeps config") {
        Fixture f;
        Vector<String> log;
        runtime::Orchestrator orch(f.ctx, seven_steps(log));
        REQUIRE(f.store.set(cfg::keys::HOMELAB_USER, "core").is_ok());
        REQUIRE(orch.run_all(true).is_ok());

        REQUIRE(orch.reset(false).is_ok());
        CHECK(orch.progress().first == 0);
        CHECK(orch.state("a") == StepState::Pending);
        CHECK(f.store.get(cfg::keys::HOMELAB_USER).value() == "core");
    }

    TEST_CASE("Optionally removes the config file") {
        Fixture f;
        runtime::Orchestrator orch(f.ctx);
        REQUIRE(f.store.set(cfg::keys::HOMELAB_USER, "core").is_ok());
        REQUIRE(f.store.mark_complete(steps::markers::USER).is_ok());

        REQUIRE(orch.reset(true).is_ok());
        CHECK_FALSE(sys::path_exists(f.store.path()));
        CHECK_FALSE(f.store.exists(cfg::keys::HOMELAB_USER));
        CHECK_FALSE(f.store.is_complete(steps::markers::USER));
    }

}
