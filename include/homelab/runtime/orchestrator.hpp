/* SPDX-License-Identifier: MIT */
/*
 * Homelab Step Orchestrator
 * Ordered step registry, marker-driven run/resume, status and reset
 */

#pragma once

#include <homelab/cfg/config_store.hpp>
#include <homelab/cfg/migrate.hpp>
#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>
#include <homelab/steps/container.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/deployment.hpp>
#include <homelab/steps/directory.hpp>
#include <homelab/steps/nfs.hpp>
#include <homelab/steps/preflight.hpp>
#include <homelab/steps/user.hpp>
#include <homelab/steps/wireguard.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace homelab {

    using namespace dp;

    namespace runtime {

        // =============================================================================
        // Step Registry
        // =============================================================================

        struct StepDescriptor {
            String name;
            String short_name;
            String description;
            String marker;
            boolean optional = false;

            auto members() noexcept { return std::tie(name, short_name, description, marker, optional); }
            auto members() const noexcept { return std::tie(name, short_name, description, marker, optional); }
        };

        struct Step {
            StepDescriptor descriptor;
            steps::StepFn fn;
            Vector<String> legacy_markers; // migrated to descriptor.marker when found
        };

        struct StepStatus {
            StepDescriptor descriptor;
            StepState state = StepState::Pending;
        };

        namespace detail {
            inline auto make_step(const char *name, const char *short_name, const char *description,
                                  const char *marker, boolean optional, steps::StepFn fn) -> Step {
                Step step;
                step.descriptor.name = name;
                step.descriptor.short_name = short_name;
                step.descriptor.description = description;
                step.descriptor.marker = marker;
                step.descriptor.optional = optional;
                step.fn = std::move(fn);
                return step;
            }
        } // namespace detail

        // The fixed setup sequence. Order encodes dependencies between steps.
        [[nodiscard]] inline auto default_steps() -> Vector<Step> {
            Vector<Step> all;
            all.push_back(detail::make_step("Pre-flight Check", "preflight", "Verify system requirements",
                                            steps::markers::PREFLIGHT, false, steps::run_preflight));
            all.push_back(detail::make_step("User Setup", "user", "Configure the homelab user account",
                                            steps::markers::USER, false, steps::run_user_setup));
            all.push_back(detail::make_step("Directory Setup", "directory", "Create the container directory tree",
                                            steps::markers::DIRECTORY, false, steps::run_directory_setup));

            Step wireguard = detail::make_step("WireGuard Setup", "wireguard", "Configure the WireGuard VPN (optional)",
                                               steps::markers::WIREGUARD, true, steps::run_wireguard_setup);
            wireguard.legacy_markers.push_back(steps::markers::WIREGUARD_LEGACY_CONFIGURED);
            wireguard.legacy_markers.push_back(steps::markers::WIREGUARD_LEGACY_SKIPPED);
            all.push_back(wireguard);

            all.push_back(detail::make_step("NFS Setup", "nfs", "Configure the NFS mount", steps::markers::NFS, false,
                                            steps::run_nfs_setup));
            all.push_back(detail::make_step("Container Setup", "container", "Configure the container runtime",
                                            steps::markers::CONTAINER, false, steps::run_container_setup));
            all.push_back(detail::make_step("Service Deployment", "deployment", "Select services to deploy",
                                            steps::markers::DEPLOYMENT, false, steps::run_deployment));
            return all;
        }

        // =============================================================================
        // Orchestrator
        // =============================================================================

        class Orchestrator {
          private:
            steps::StepContext &ctx_;
            Vector<Step> steps_;
            Vector<StepState> states_;

            [[nodiscard]] auto index_of(const String &short_name) const -> Optional<usize> {
                for (usize i = 0; i < steps_.size(); ++i) {
                    if (steps_[i].descriptor.short_name == short_name) {
                        return i;
                    }
                }
                return nullopt;
            }

            [[nodiscard]] auto complete_at(usize idx) -> boolean {
                const Step &step = steps_[idx];
                if (step.legacy_markers.empty()) {
                    return ctx_.store.is_complete(step.descriptor.marker);
                }
                auto migrated = cfg::ensure_canonical_marker(ctx_.store, step.descriptor.marker, step.legacy_markers);
                if (migrated.is_err()) {
                    echo::warn("Marker check failed for ", step.descriptor.short_name.c_str(), ": ",
                               migrated.error().message.c_str());
                    return false;
                }
                return migrated.value();
            }

            // Run one step and record its marker. No completion check, no retry.
            auto execute(usize idx) -> VoidRes {
                const Step &step = steps_[idx];
                const String &short_name = step.descriptor.short_name;
                String context = String("step ") + short_name + " failed";

                ctx_.out.step(idx + 1, steps_.size(), step.descriptor.name);
                states_[idx] = StepState::Running;

                auto res = step.fn(ctx_);
                if (res.is_ok()) {
                    res = ctx_.store.mark_complete(step.descriptor.marker);
                }
                if (res.is_err()) {
                    states_[idx] = StepState::Failed;
                    echo::error("Step ", short_name.c_str(), " failed: ", res.error().message.c_str());
                    return result::err(err::wrap(context, res.error()));
                }

                states_[idx] = StepState::Completed;
                ctx_.out.success(step.descriptor.name + " completed");
                return result::ok();
            }

          public:
            explicit Orchestrator(steps::StepContext &ctx) : Orchestrator(ctx, default_steps()) {}

            Orchestrator(steps::StepContext &ctx, Vector<Step> registry) : ctx_(ctx), steps_(std::move(registry)) {
                states_.reserve(steps_.size());
                for (usize i = 0; i < steps_.size(); ++i) {
                    states_.push_back(complete_at(i) ? StepState::Completed : StepState::Pending);
                }
            }

            [[nodiscard]] auto get_all_steps() const -> Vector<StepDescriptor> {
                Vector<StepDescriptor> out;
                for (const auto &step : steps_) {
                    out.push_back(step.descriptor);
                }
                return out;
            }

            [[nodiscard]] auto find_step(const String &short_name) const -> Optional<StepDescriptor> {
                auto idx = index_of(short_name);
                if (!idx.has_value()) {
                    return nullopt;
                }
                return steps_[idx.value()].descriptor;
            }

            [[nodiscard]] auto is_step_complete(const String &marker) -> boolean {
                for (usize i = 0; i < steps_.size(); ++i) {
                    if (steps_[i].descriptor.marker == marker) {
                        return complete_at(i);
                    }
                }
                return ctx_.store.is_complete(marker);
            }

            [[nodiscard]] auto state(const String &short_name) const -> StepState {
                auto idx = index_of(short_name);
                if (!idx.has_value()) {
                    return StepState::Pending;
                }
                return states_[idx.value()];
            }

            // Runs a single step. A completed step is re-run only if the operator confirms.
            auto run_step(const String &short_name) -> VoidRes {
                auto idx = index_of(short_name);
                if (!idx.has_value()) {
                    return result::err(err::invalid(String("unknown step: ") + short_name));
                }
                const Step &step = steps_[idx.value()];

                if (complete_at(idx.value())) {
                    auto again = ctx_.prompter.confirm(step.descriptor.name + " has already been completed. Run again?",
                                                       false);
                    if (again.is_err()) {
                        return result::err(again.error());
                    }
                    if (!again.value()) {
                        ctx_.out.info(step.descriptor.name + " already completed, skipping");
                        states_[idx.value()] = StepState::Completed;
                        return result::ok();
                    }
                    auto cleared = ctx_.store.clear_marker(step.descriptor.marker);
                    if (cleared.is_err()) {
                        return result::err(err::wrap(String("step ") + short_name + " failed", cleared.error()));
                    }
                }

                return execute(idx.value());
            }

            // Runs the sequence in order, skipping completed steps and, when asked,
            // optional ones. Stops at the first failure; markers already set remain.
            auto run_all(boolean skip_optional) -> VoidRes {
                for (usize i = 0; i < steps_.size(); ++i) {
                    const StepDescriptor &desc = steps_[i].descriptor;
                    if (skip_optional && desc.optional) {
                        echo::debug("Skipping optional step ", desc.short_name.c_str());
                        continue;
                    }
                    if (complete_at(i)) {
                        states_[i] = StepState::Completed;
                        ctx_.out.info(desc.name + " already completed");
                        continue;
                    }
                    auto res = execute(i);
                    if (res.is_err()) {
                        return res;
                    }
                }
                ctx_.out.success("Setup complete");
                return result::ok();
            }

            [[nodiscard]] auto status() -> Vector<StepStatus> {
                Vector<StepStatus> out;
                for (usize i = 0; i < steps_.size(); ++i) {
                    StepStatus s;
                    s.descriptor = steps_[i].descriptor;
                    if (complete_at(i)) {
                        s.state = StepState::Completed;
                    } else {
                        s.state = states_[i] == StepState::Failed ? StepState::Failed : StepState::Pending;
                    }
                    out.push_back(s);
                }
                return out;
            }

            // (completed, total)
            [[nodiscard]] auto progress() -> Pair<usize, usize> {
                usize done = 0;
                for (const auto &s : status()) {
                    if (s.state == StepState::Completed) {
                        ++done;
                    }
                }
                return {done, steps_.size()};
            }

            // Clear every marker, and the config file too when asked
            auto reset(boolean include_config) -> VoidRes {
                auto cleared = ctx_.store.clear_all_markers();
                if (cleared.is_err()) {
                    return cleared;
                }
                for (auto &s : states_) {
                    s = StepState::Pending;
                }
                if (include_config) {
                    return ctx_.store.remove_config_file();
                }
                return result::ok();
            }
        };

    } // namespace runtime

} // namespace homelab
