/* SPDX-License-Identifier: MIT */
/*
 * Homelab NFS Step
 * Record the NFS server, export and local mount point
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/validation.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        inline auto run_nfs_setup(StepContext &ctx) -> VoidRes {
            ctx.out.header("NFS Setup");

            auto wanted = ctx.prompter.confirm("Configure NFS mount?", true);
            if (wanted.is_err()) {
                return result::err(wanted.error());
            }
            if (!wanted.value()) {
                ctx.out.info("Skipping NFS configuration");
                return ctx.store.set(cfg::keys::NFS_ENABLED, "false");
            }

            auto server = ctx.prompter.input("NFS server IP or hostname",
                                             ctx.store.get_or_default(cfg::keys::NFS_SERVER, ""));
            if (server.is_err()) {
                return result::err(server.error());
            }
            String host = str::trim(server.value());
            auto host_ok = validate_host(host);
            if (host_ok.is_err()) {
                return host_ok;
            }

            auto exported = ctx.prompter.input("NFS export path",
                                               ctx.store.get_or_default(cfg::keys::NFS_EXPORT, "/mnt/storage"));
            if (exported.is_err()) {
                return result::err(exported.error());
            }
            String export_path = str::trim(exported.value());
            auto export_ok = validate_absolute_path(export_path);
            if (export_ok.is_err()) {
                return export_ok;
            }

            auto mount = ctx.prompter.input("Local mount point",
                                            ctx.store.get_or_default(cfg::keys::NFS_MOUNT_POINT, "/mnt/nas"));
            if (mount.is_err()) {
                return result::err(mount.error());
            }
            String mount_point = str::trim(mount.value());
            auto mount_ok = validate_absolute_path(mount_point);
            if (mount_ok.is_err()) {
                return mount_ok;
            }

            auto res = ctx.store.set(cfg::keys::NFS_ENABLED, "true");
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::NFS_SERVER, host);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::NFS_EXPORT, export_path);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::NFS_MOUNT_POINT, mount_point);
            if (res.is_err()) {
                return res;
            }
            ctx.out.success(host + ":" + export_path + " -> " + mount_point);
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
