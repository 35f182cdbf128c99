/* SPDX-License-Identifier: MIT */
/*
 * Homelab Step Context
 * Capabilities every setup step receives
 */

#pragma once

#include <homelab/cfg/config_store.hpp>
#include <homelab/crypto/keygen.hpp>
#include <homelab/sys/command.hpp>
#include <homelab/ui/output.hpp>
#include <homelab/ui/prompt.hpp>

#include <datapod/datapod.hpp>

#include <functional>

namespace homelab {

    using namespace dp;

    namespace steps {

        namespace markers {
            inline constexpr const char *PREFLIGHT = "preflight-complete";
            inline constexpr const char *USER = "user-setup-complete";
            inline constexpr const char *DIRECTORY = "directory-setup-complete";
            inline constexpr const char *WIREGUARD = "wireguard-setup-complete";
            inline constexpr const char *NFS = "nfs-setup-complete";
            inline constexpr const char *CONTAINER = "container-setup-complete";
            inline constexpr const char *DEPLOYMENT = "service-deployment-complete";

            // Names used by earlier releases of the WireGuard step
            inline constexpr const char *WIREGUARD_LEGACY_CONFIGURED = "wireguard-configured";
            inline constexpr const char *WIREGUARD_LEGACY_SKIPPED = "wireguard-skipped";
        } // namespace markers

        struct StepContext {
            cfg::ConfigStore &store;
            ui::Prompter &prompter;
            sys::CommandRunner &runner;
            crypto::KeyGenerator &keygen;
            ui::Output out{};
            String home{}; // operator home, for export paths

            StepContext(cfg::ConfigStore &s, ui::Prompter &p, sys::CommandRunner &r, crypto::KeyGenerator &k,
                        String home_dir = String())
                : store(s), prompter(p), runner(r), keygen(k), home(std::move(home_dir)) {}
        };

        using StepFn = std::function<VoidRes(StepContext &)>;

    } // namespace steps

} // namespace homelab
