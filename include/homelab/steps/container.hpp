/* SPDX-License-Identifier: MIT */
/*
 * Homelab Container Step
 * Pick the container runtime and the matching compose command
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/preflight.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        [[nodiscard]] inline auto compose_command_for(const String &runtime) -> String {
            if (runtime == "podman") {
                return String("podman-compose");
            }
            return String("docker compose");
        }

        inline auto run_container_setup(StepContext &ctx) -> VoidRes {
            ctx.out.header("Container Setup");

            Vector<String> runtimes;
            runtimes.push_back("docker");
            runtimes.push_back("podman");
            String current = ctx.store.get_or_default(cfg::keys::CONTAINER_RUNTIME, "docker");
            usize default_idx = current == "podman" ? 1 : 0;

            auto choice = ctx.prompter.select("Container runtime", runtimes, default_idx);
            if (choice.is_err()) {
                return result::err(choice.error());
            }
            String runtime = runtimes[choice.value()];

            auto present = check_tool(ctx.runner, runtime);
            if (present.is_err()) {
                return present;
            }

            auto res = ctx.store.set(cfg::keys::CONTAINER_RUNTIME, runtime);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::COMPOSE_COMMAND, compose_command_for(runtime));
            if (res.is_err()) {
                return res;
            }
            ctx.out.success(String("Using ") + runtime);
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
