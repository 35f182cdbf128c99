/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Peer Workflow
 * Add a client peer: validate all input, then generate keys, allocate, write
 */

#pragma once

#include <homelab/cfg/config_store.hpp>
#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/core/time.hpp>
#include <homelab/core/types.hpp>
#include <homelab/crypto/keygen.hpp>
#include <homelab/crypto/wg_key.hpp>
#include <homelab/net/ipv4.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/sys/fs.hpp>
#include <homelab/wg/allocator.hpp>
#include <homelab/wg/config.hpp>
#include <homelab/wg/export.hpp>
#include <homelab/wg/sanitize.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace homelab {

    using namespace dp;

    namespace wg {

        inline constexpr u32 SERVER_CONFIG_MODE = 0600;

        // =============================================================================
        // Options and Result
        // =============================================================================

        struct PeerOptions {
            String interface_name;
            String peer_name;
            String endpoint;
            String dns;
            String client_allowed_ips;
            Optional<boolean> route_all;
            String output_dir;
            Optional<i32> keepalive;
            Optional<boolean> generate_preshared_key;
            String provided_preshared_key;
            boolean non_interactive = false;
            boolean skip_qr = false;
            boolean skip_service_restart = false;
            boolean mark_step = true; // complete the WireGuard step on first success
        };

        struct PeerResult {
            Peer peer;
            String client_config;
            String export_path;
            String server_config_path;
            String qr_code;         // empty when skipped or unavailable
            boolean marked_step = false; // this call completed the WireGuard step
        };

        [[nodiscard]] inline auto service_name(const String &interface_name) -> String {
            return String("wg-quick@") + interface_name + ".service";
        }

        // Asks before restarting; every failure is reported as a warning
        inline auto offer_service_restart(steps::StepContext &ctx, const String &interface_name) -> void {
            String service = service_name(interface_name);
            auto restart = ctx.prompter.confirm(String("Restart ") + service + " now?", true);
            if (restart.is_err()) {
                ctx.out.warning(String("Skipping restart of ") + service + ": " + restart.error().message);
                return;
            }
            if (!restart.value()) {
                ctx.out.info(String("Restart later with: sudo systemctl restart ") + service);
                return;
            }
            Vector<String> args;
            args.push_back("restart");
            args.push_back(service);
            auto ran = sys::run_checked(ctx.runner, "systemctl", args);
            if (ran.is_err()) {
                ctx.out.warning(String("Failed to restart ") + service + ": " + ran.error().message);
            } else {
                ctx.out.success(String("Service ") + service + " restarted");
            }
        }

        [[nodiscard]] inline auto server_config_path(cfg::ConfigStore &store, const String &interface_name) -> String {
            String dir = store.get_or_default(cfg::keys::WIREGUARD_CONFIG_DIR, "/etc/wireguard");
            return sys::join_path(dir, interface_name + ".conf");
        }

        namespace detail {

            // Everything the commit phase needs, resolved and validated
            struct PeerPlan {
                String interface_name;
                String config_path;
                String raw_config;
                ParsedConfig parsed;
                net::Cidr subnet;
                Vector<u32> used;
                String peer_name;
                String endpoint;
                String dns;
                String client_allowed_ips;
                i32 keepalive = DEFAULT_KEEPALIVE;
                boolean use_psk = false;
                String preshared_key; // set when supplied by the operator
                String server_public_key;
                Allocation allocation;
            };

            inline auto resolve_interface(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                String name = str::trim(opts.interface_name);
                if (name.empty()) {
                    name = ctx.store.get_or_default(cfg::keys::WIREGUARD_INTERFACE, DEFAULT_WG_INTERFACE);
                }
                auto valid = validate_interface_name(name);
                if (valid.is_err()) {
                    return valid;
                }
                plan.interface_name = name;
                plan.config_path = server_config_path(ctx.store, name);

                auto raw = sys::read_file(plan.config_path);
                if (raw.is_err()) {
                    if (err::is_not_found(raw.error())) {
                        return result::err(
                            err::not_found(String("WireGuard config ") + plan.config_path + " does not exist"));
                    }
                    return result::err(raw.error());
                }
                plan.raw_config = raw.value();
                plan.parsed = parse_config(plan.raw_config);

                auto subnet = first_interface_address(plan.parsed);
                if (subnet.is_err()) {
                    return result::err(subnet.error());
                }
                plan.subnet = subnet.value();
                plan.used = collect_used_addresses(plan.parsed);
                return result::ok();
            }

            inline auto resolve_peer_name(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                String name = str::trim(opts.peer_name);
                if (name.empty()) {
                    String fallback = String("peer-") + to_str(time::now_unix());
                    if (opts.non_interactive) {
                        name = fallback;
                    } else {
                        auto input = ctx.prompter.input("Peer name", fallback);
                        if (input.is_err()) {
                            return result::err(input.error());
                        }
                        name = input.value();
                    }
                }
                plan.peer_name = sanitize_peer_name(name);
                if (plan.peer_name.empty()) {
                    return result::err(err::invalid("Peer name is empty after sanitization"));
                }
                return result::ok();
            }

            inline auto resolve_endpoint(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                String endpoint = str::trim(opts.endpoint);
                if (endpoint.empty()) {
                    endpoint = ctx.store.get_or_default(cfg::keys::WIREGUARD_ENDPOINT, "");
                }
                if (endpoint.empty()) {
                    if (opts.non_interactive) {
                        return result::err(err::invalid("endpoint is required in non-interactive mode"));
                    }
                    auto input = ctx.prompter.input("Server endpoint (host:port)", "");
                    if (input.is_err()) {
                        return result::err(input.error());
                    }
                    endpoint = str::trim(input.value());
                }
                auto valid = net::validate_endpoint(endpoint);
                if (valid.is_err()) {
                    return valid;
                }
                plan.endpoint = endpoint;
                return result::ok();
            }

            inline auto resolve_dns(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                String dns = str::trim(opts.dns);
                if (dns.empty()) {
                    dns = ctx.store.get_or_default(cfg::keys::WIREGUARD_PEER_DNS, "");
                }
                if (dns.empty() && !opts.non_interactive) {
                    auto input = ctx.prompter.input("Client DNS server (optional)", "");
                    if (input.is_err()) {
                        return result::err(input.error());
                    }
                    dns = str::trim(input.value());
                }
                for (const auto &server : str::split(dns, ',')) {
                    auto addr = net::parse_ipv4(server);
                    if (addr.is_err()) {
                        return result::err(err::invalid(String("Invalid DNS server: ") + server));
                    }
                }
                plan.dns = str::join(str::split(dns, ','), ", ");
                return result::ok();
            }

            inline auto resolve_routing(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                String override_ips = str::trim(opts.client_allowed_ips);
                boolean route_all = opts.route_all.has_value() && opts.route_all.value();

                if (!override_ips.empty() && route_all) {
                    return result::err(
                        err::invalid("cannot combine client allowed IPs with route-all; they are mutually exclusive"));
                }

                if (!override_ips.empty()) {
                    auto valid = net::validate_address_list(override_ips);
                    if (valid.is_err()) {
                        return valid;
                    }
                    plan.client_allowed_ips = str::join(str::split(override_ips, ','), ", ");
                    return result::ok();
                }

                if (!opts.route_all.has_value()) {
                    if (opts.non_interactive) {
                        route_all = true;
                    } else {
                        auto answer = ctx.prompter.confirm("Route all client traffic through the VPN?", true);
                        if (answer.is_err()) {
                            return result::err(answer.error());
                        }
                        route_all = answer.value();
                    }
                }
                plan.client_allowed_ips = route_all ? String(ROUTE_ALL_ALLOWED_IPS) : plan.subnet.network_string();
                return result::ok();
            }

            inline auto resolve_keys(steps::StepContext &ctx, const PeerOptions &opts, PeerPlan &plan) -> VoidRes {
                if (opts.keepalive.has_value()) {
                    plan.keepalive = opts.keepalive.value() > 0 ? opts.keepalive.value() : 0;
                }

                String provided = str::trim(opts.provided_preshared_key);
                if (!provided.empty()) {
                    if (!crypto::is_valid_key(provided)) {
                        return result::err(err::invalid("Provided preshared key is not a valid WireGuard key"));
                    }
                    plan.preshared_key = provided;
                    plan.use_psk = true;
                } else if (opts.generate_preshared_key.has_value()) {
                    plan.use_psk = opts.generate_preshared_key.value();
                } else if (opts.non_interactive) {
                    plan.use_psk = true;
                } else {
                    auto answer = ctx.prompter.confirm("Generate a preshared key for this peer?", true);
                    if (answer.is_err()) {
                        return result::err(answer.error());
                    }
                    plan.use_psk = answer.value();
                }

                plan.server_public_key = str::trim(ctx.store.get_or_default(cfg::keys::WIREGUARD_PUBLIC_KEY, ""));
                if (plan.server_public_key.empty() && plan.parsed.private_key.empty()) {
                    if (opts.non_interactive) {
                        return result::err(err::invalid("server public key missing from configuration"));
                    }
                    auto input = ctx.prompter.input("Server public key", "");
                    if (input.is_err()) {
                        return result::err(input.error());
                    }
                    String key = str::trim(input.value());
                    if (!crypto::is_valid_key(key)) {
                        return result::err(err::invalid("Server public key is not a valid WireGuard key"));
                    }
                    plan.server_public_key = key;
                }
                return result::ok();
            }

        } // namespace detail

        // =============================================================================
        // Add Peer
        // =============================================================================

        // Nothing is generated, allocated or written until every input has been
        // resolved and validated.
        [[nodiscard]] inline auto add_peer(steps::StepContext &ctx, const PeerOptions &opts) -> Res<PeerResult> {
            detail::PeerPlan plan;

            // Validate
            auto resolved = detail::resolve_interface(ctx, opts, plan);
            if (resolved.is_ok())
                resolved = detail::resolve_peer_name(ctx, opts, plan);
            if (resolved.is_ok())
                resolved = detail::resolve_endpoint(ctx, opts, plan);
            if (resolved.is_ok())
                resolved = detail::resolve_dns(ctx, opts, plan);
            if (resolved.is_ok())
                resolved = detail::resolve_routing(ctx, opts, plan);
            if (resolved.is_ok())
                resolved = detail::resolve_keys(ctx, opts, plan);
            if (resolved.is_err()) {
                return result::err(resolved.error());
            }

            IpAllocator allocator(ctx.store, plan.subnet);
            auto next = allocator.peek_next_address(plan.used);
            if (next.is_err()) {
                return result::err(next.error());
            }
            plan.allocation = next.value();

            // Generate keys
            boolean derived_server_key = false;
            if (plan.server_public_key.empty()) {
                auto derived = ctx.keygen.derive_public_key(plan.parsed.private_key);
                if (derived.is_err()) {
                    return result::err(err::wrap("failed to derive server public key", derived.error()));
                }
                plan.server_public_key = derived.value();
                derived_server_key = true;
            }

            auto pair = crypto::generate_keypair(ctx.keygen);
            if (pair.is_err()) {
                return result::err(pair.error());
            }
            echo::debug("Generated client key pair for ", plan.peer_name.c_str());

            String psk = plan.preshared_key;
            if (plan.use_psk && psk.empty()) {
                auto generated = ctx.keygen.generate_preshared_key();
                if (generated.is_err()) {
                    return result::err(err::wrap("failed to generate preshared key", generated.error()));
                }
                psk = generated.value();
            }

            PeerResult res;
            res.peer.name = plan.peer_name;
            res.peer.public_key = pair.value().public_key;
            res.peer.preshared_key = psk;
            res.peer.address = plan.allocation.to_string();
            res.peer.allowed_ips = res.peer.address;
            res.peer.keepalive = plan.keepalive;
            res.server_config_path = plan.config_path;

            ClientConfig client;
            client.private_key = pair.value().private_key;
            client.address = res.peer.address;
            client.dns = plan.dns;
            client.server_public_key = plan.server_public_key;
            client.preshared_key = psk;
            client.endpoint = plan.endpoint;
            client.allowed_ips = plan.client_allowed_ips;
            client.keepalive = plan.keepalive;
            res.client_config = render_client_config(client);

            String export_dir = opts.output_dir.empty() ? default_export_dir(ctx.home) : opts.output_dir;
            auto exported = write_client_export(plan.peer_name, export_dir, res.client_config);
            if (exported.is_err()) {
                ctx.out.warning("Client configuration was not exported");
                return result::err(exported.error());
            }
            res.export_path = exported.value();

            String updated = append_peer_block(plan.raw_config, render_peer_block(res.peer));
            auto written = sys::write_file_atomic(plan.config_path, updated, SERVER_CONFIG_MODE);
            if (written.is_err()) {
                auto removed = sys::remove_file(res.export_path);
                if (removed.is_err()) {
                    ctx.out.warning(String("Stale client export left at ") + res.export_path);
                }
                return result::err(err::wrap("failed to update server config", written.error()));
            }

            // Offset moves only once the peer block is on disk
            auto committed = allocator.commit(plan.allocation);
            if (committed.is_err()) {
                ctx.out.warning(String("Failed to record peer offset: ") + committed.error().message);
            }

            auto persist = [&](const char *key, const String &value) {
                auto set_res = ctx.store.set(key, value);
                if (set_res.is_err()) {
                    ctx.out.warning(String("Failed to persist ") + key + ": " + set_res.error().message);
                }
            };
            persist(cfg::keys::WIREGUARD_ENDPOINT, plan.endpoint);
            if (!plan.dns.empty()) {
                persist(cfg::keys::WIREGUARD_PEER_DNS, plan.dns);
            }
            if (derived_server_key) {
                persist(cfg::keys::WIREGUARD_PUBLIC_KEY, plan.server_public_key);
            }

            if (opts.mark_step) {
                auto marked = ctx.store.mark_complete_if_not_exists(steps::markers::WIREGUARD);
                if (marked.is_err()) {
                    return result::err(marked.error());
                }
                res.marked_step = marked.value();
            }

            ctx.out.success(String("Peer ") + res.peer.name + " added (" + res.peer.address +
                            "). Client config: " + res.export_path);

            if (!opts.skip_qr) {
                auto qr = render_qr_code(ctx.runner, res.client_config);
                if (qr.is_err()) {
                    ctx.out.warning(String("Failed to render QR code: ") + qr.error().message);
                } else {
                    res.qr_code = qr.value();
                    ctx.out.info("Scan this QR code from the WireGuard mobile app:");
                    ctx.out.info(res.qr_code);
                }
            }

            if (!opts.skip_service_restart && !opts.non_interactive) {
                offer_service_restart(ctx, plan.interface_name);
            }

            return result::ok(res);
        }

    } // namespace wg

} // namespace homelab
