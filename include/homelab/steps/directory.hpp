/* SPDX-License-Identifier: MIT */
/*
 * Homelab Directory Step
 * Create the container base directory owned by the homelab user
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/validation.hpp>
#include <homelab/sys/command.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        inline auto run_directory_setup(StepContext &ctx) -> VoidRes {
            ctx.out.header("Directory Setup");

            auto user = ctx.store.get(cfg::keys::HOMELAB_USER);
            if (user.is_err()) {
                return result::err(err::invalid("HOMELAB_USER is not set; run the user step first"));
            }

            auto base = ctx.prompter.input("Container base directory",
                                           ctx.store.get_or_default(cfg::keys::CONTAINERS_BASE, "/srv/containers"));
            if (base.is_err()) {
                return result::err(base.error());
            }
            String dir = str::trim(base.value());
            auto valid = validate_absolute_path(dir);
            if (valid.is_err()) {
                return valid;
            }

            Vector<String> mkdir_args;
            mkdir_args.push_back("mkdir");
            mkdir_args.push_back("-p");
            mkdir_args.push_back(dir);
            auto made = sys::run_checked(ctx.runner, "sudo", mkdir_args);
            if (made.is_err()) {
                return result::err(made.error());
            }

            Vector<String> chown_args;
            chown_args.push_back("chown");
            chown_args.push_back(user.value() + ":" + user.value());
            chown_args.push_back(dir);
            auto owned = sys::run_checked(ctx.runner, "sudo", chown_args);
            if (owned.is_err()) {
                return result::err(owned.error());
            }

            auto saved = ctx.store.set(cfg::keys::CONTAINERS_BASE, dir);
            if (saved.is_err()) {
                return saved;
            }
            ctx.out.success(String("Created ") + dir);
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
