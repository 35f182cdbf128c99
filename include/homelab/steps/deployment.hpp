/* SPDX-License-Identifier: MIT */
/*
 * Homelab Deployment Step
 * Record which services the operator wants deployed
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/steps/context.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        inline constexpr const char *KNOWN_SERVICES[] = {"media", "web", "cloud"};

        inline auto run_deployment(StepContext &ctx) -> VoidRes {
            ctx.out.header("Service Deployment");

            auto base = ctx.store.get(cfg::keys::CONTAINERS_BASE);
            if (base.is_err()) {
                return result::err(err::invalid("CONTAINERS_BASE is not set; run the directory step first"));
            }
            auto runtime = ctx.store.get(cfg::keys::CONTAINER_RUNTIME);
            if (runtime.is_err()) {
                return result::err(err::invalid("CONTAINER_RUNTIME is not set; run the container step first"));
            }

            Vector<String> options;
            for (const char *service : KNOWN_SERVICES) {
                options.push_back(String(service));
            }
            auto picked = ctx.prompter.multi_select("Services to deploy", options);
            if (picked.is_err()) {
                return result::err(picked.error());
            }

            Vector<String> selected;
            for (usize idx : picked.value()) {
                selected.push_back(options[idx]);
            }
            auto saved = ctx.store.set(cfg::keys::SELECTED_SERVICES, str::join(selected, " "));
            if (saved.is_err()) {
                return saved;
            }

            if (selected.empty()) {
                ctx.out.info("No services selected");
            } else {
                ctx.out.success(String("Selected services: ") + str::join(selected, ", "));
            }
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
