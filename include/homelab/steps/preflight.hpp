/* SPDX-License-Identifier: MIT */
/*
 * Homelab Preflight Step
 * Verify the tools later steps shell out to are present
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/sys/command.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        // Runs `<tool> --version`; any exit status other than 0 counts as missing
        [[nodiscard]] inline auto check_tool(sys::CommandRunner &runner, const String &tool) -> VoidRes {
            Vector<String> args;
            args.push_back("--version");
            auto out = sys::run_checked(runner, tool, args);
            if (out.is_err()) {
                return result::err(err::wrap(String("required tool '") + tool + "' is not available", out.error()));
            }
            return result::ok();
        }

        inline auto run_preflight(StepContext &ctx) -> VoidRes {
            ctx.out.header("Pre-flight System Validation");

            Vector<String> tools;
            tools.push_back("systemctl");
            tools.push_back(ctx.store.get_or_default(cfg::keys::CONTAINER_RUNTIME, "docker"));

            Vector<String> failures;
            for (const auto &tool : tools) {
                auto res = check_tool(ctx.runner, tool);
                if (res.is_err()) {
                    ctx.out.error(res.error().message);
                    failures.push_back(res.error().message);
                } else {
                    ctx.out.success(tool + " found");
                }
            }

            Vector<String> sudo_args;
            sudo_args.push_back("-n");
            sudo_args.push_back("true");
            auto sudo = sys::run_checked(ctx.runner, "sudo", sudo_args);
            if (sudo.is_err()) {
                ctx.out.warning("Passwordless sudo is not available; some steps may prompt for a password");
            }

            if (!failures.empty()) {
                return result::err(err::command("preflight", to_str(static_cast<u64>(failures.size())) +
                                                                 " check(s) failed: " + str::join(failures, "; ")));
            }
            ctx.out.success("All pre-flight checks passed");
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
