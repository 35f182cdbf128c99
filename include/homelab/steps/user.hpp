/* SPDX-License-Identifier: MIT */
/*
 * Homelab User Step
 * Resolve the account that owns the homelab and record its ids
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

        inline auto run_user_setup(StepContext &ctx) -> VoidRes {
            ctx.out.header("User Setup");

            String current = ctx.store.get_or_default(cfg::keys::HOMELAB_USER, "core");
            auto username = ctx.prompter.input("Homelab username", current);
            if (username.is_err()) {
                return result::err(username.error());
            }
            String user = str::trim(username.value());
            auto valid = validate_username(user);
            if (valid.is_err()) {
                return valid;
            }

            Vector<String> uid_args;
            uid_args.push_back("-u");
            uid_args.push_back(user);
            auto uid = sys::run_checked(ctx.runner, "id", uid_args);
            if (uid.is_err()) {
                return result::err(err::wrap(String("user ") + user + " does not exist", uid.error()));
            }

            Vector<String> gid_args;
            gid_args.push_back("-g");
            gid_args.push_back(user);
            auto gid = sys::run_checked(ctx.runner, "id", gid_args);
            if (gid.is_err()) {
                return result::err(err::wrap(String("failed to read group of ") + user, gid.error()));
            }

            if (parse_uint(uid.value(), 0xFFFFFFFFu).is_err() || parse_uint(gid.value(), 0xFFFFFFFFu).is_err()) {
                return result::err(err::command("id", String("unexpected output: ") + uid.value()));
            }

            auto res = ctx.store.set(cfg::keys::HOMELAB_USER, user);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::PUID, uid.value());
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::PGID, gid.value());
            if (res.is_err()) {
                return res;
            }

            ctx.out.success(String("Using ") + user + " (uid " + uid.value() + ", gid " + gid.value() + ")");
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
